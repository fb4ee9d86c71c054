#include <memory>
#include <utility>

#include <bes/tissue_state.hpp>

namespace bes {

tissue_state::tissue_state(std::shared_ptr<const tissue_layout> layout):
    layout_(std::move(layout))
{
    auto n = layout_->num_cells;
    auto ns = layout_->species.size();

    voltage_.assign(n, 0);
    concentration_.assign(ns*n, 0);
    bath_.assign(ns, 0);
    open_fraction_.assign(layout_->num_junctions, 1);
    membrane_current_.assign(n, 0);

    for (auto& inst: layout_->instances) {
        gates_.emplace_back(inst.cells.size()*inst.gate_names.size(), 0);
    }
}

tissue_snapshot tissue_state::snapshot() const {
    tissue_snapshot s;
    s.step = step_;
    s.time = time_;
    s.temperature = temperature_;
    s.voltage = voltage_;

    auto n = num_cells();
    s.species = layout_->species;
    for (std::size_t i=0; i<num_species(); ++i) {
        auto b = concentration_.begin() + i*n;
        s.concentration.emplace_back(b, b + n);
    }
    s.bath = bath_;

    for (std::size_t i=0; i<num_instances(); ++i) {
        auto& inst = layout_->instances[i];
        s.gating.push_back({inst.channel, inst.cells, inst.gate_names, gates_[i]});
    }

    s.open_fraction = open_fraction_;
    s.membrane_current = membrane_current_;
    return s;
}

} // namespace bes
