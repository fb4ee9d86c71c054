#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <bes/common_types.hpp>

namespace bes {

// Gating values of one channel attachment.
struct gating_snapshot {
    std::string channel;
    std::vector<cell_index_type> cells;
    std::vector<std::string> gate_names;

    // Cell-major: values[k*gate_names.size() + g] is gate g on cells[k].
    std::vector<double> values;
};

// Independent copy of the tissue state at the end of a step.
struct tissue_snapshot {
    step_type step = 0;
    time_type time = 0;
    double temperature = 0;                         // [K]

    std::vector<double> voltage;                    // per cell [V]

    std::vector<std::string> species;
    std::vector<std::vector<double>> concentration; // [species][cell] [mol/m^3]
    std::vector<double> bath;                       // per species [mol/m^3]

    std::vector<gating_snapshot> gating;

    std::vector<double> open_fraction;              // per junction

    // Net transmembrane current density over the last step, positive
    // inward [A/m^2].
    std::vector<double> membrane_current;
};

// Static description shared by every copy of a tissue state.
struct tissue_layout {
    std::size_t num_cells = 0;
    std::size_t num_junctions = 0;
    std::vector<std::string> species;

    struct instance_layout {
        std::string channel;
        std::vector<cell_index_type> cells;
        std::vector<std::string> gate_names;
    };
    std::vector<instance_layout> instances;
};

class simulation_state;

// Mutable state of a tissue: written only by the simulation engine.
class tissue_state {
public:
    tissue_state() = default;
    explicit tissue_state(std::shared_ptr<const tissue_layout> layout);

    std::size_t num_cells() const { return layout_->num_cells; }
    std::size_t num_species() const { return layout_->species.size(); }
    std::size_t num_junctions() const { return layout_->num_junctions; }
    std::size_t num_instances() const { return layout_->instances.size(); }
    const tissue_layout& layout() const { return *layout_; }

    step_type step() const { return step_; }
    time_type time() const { return time_; }
    double temperature() const { return temperature_; }

    double voltage(cell_index_type c) const { return voltage_[c]; }
    const std::vector<double>& voltage() const { return voltage_; }

    double concentration(std::size_t species, cell_index_type c) const {
        return concentration_[species*num_cells() + c];
    }

    // Species-major: concentrations()[s*num_cells() + c].
    const std::vector<double>& concentrations() const { return concentration_; }

    double bath(std::size_t species) const { return bath_[species]; }
    const std::vector<double>& bath() const { return bath_; }

    // Cell-major gating values of a channel instance.
    const std::vector<double>& gates(std::size_t instance) const { return gates_[instance]; }

    const std::vector<double>& open_fraction() const { return open_fraction_; }
    const std::vector<double>& membrane_current() const { return membrane_current_; }

    tissue_snapshot snapshot() const;

private:
    friend class simulation_state;

    std::shared_ptr<const tissue_layout> layout_;

    step_type step_ = 0;
    time_type time_ = 0;
    double temperature_ = 0;

    std::vector<double> voltage_;
    std::vector<double> concentration_;
    std::vector<double> bath_;
    std::vector<std::vector<double>> gates_;
    std::vector<double> open_fraction_;
    std::vector<double> membrane_current_;
};

} // namespace bes
