#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include <bes/chancat.hpp>
#include <bes/common_types.hpp>
#include <bes/context.hpp>
#include <bes/geometry.hpp>
#include <bes/network.hpp>
#include <bes/tissue_parameters.hpp>
#include <bes/tissue_state.hpp>

namespace bes {

enum class simulation_status {
    uninitialized,
    ready,
    stepping,
    converged,
    diverged,
    finalized
};

std::string to_string(simulation_status);

// simulation_state comprises private implementation for simulation class.
class simulation_state;

class simulation {
public:
    // Resolves channel attachments, regions and initial conditions.
    // Throws unknown_channel_error, unknown_ion_error or bad_parameters
    // before any state exists.
    simulation(const tissue_geometry& geom,
               const tissue_network& net,
               const tissue_parameters& params,
               const channel_catalogue& catalogue = global_default_catalogue(),
               context ctx = make_context());

    simulation(simulation const&) = delete;
    simulation(simulation&&);

    // Advance by one step of length dt [s] and return the new status.
    // Throws divergence_error if the step fails the stability check; the
    // state is then left at the last stable step.
    simulation_status step(time_type dt);

    // Mark the requested horizon as reached.
    void finalize();

    // Restore initial conditions; status returns to ready.
    void reset();

    simulation_status status() const;

    // Values of the last committed step.
    double voltage(cell_index_type c) const;
    double concentration(std::size_t species, cell_index_type c) const;

    // Independent copy of the last committed step.
    tissue_snapshot snapshot() const;

    // Number of clamp events that exceeded the clamp tolerance.
    std::size_t stability_warnings() const;

    time_type time() const;
    step_type num_steps() const;

    ~simulation();

private:
    std::unique_ptr<simulation_state> impl_;
};

} // namespace bes
