#pragma once

#include <cmath>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <bes/constants.hpp>
#include <bes/ion.hpp>
#include <bes/region.hpp>

// Parameters describing the membrane, initial conditions, stimuli and
// interventions applied to a tissue. Geometry and connectivity are
// described separately by geometry_parameters and connectivity_parameters.

namespace bes {

enum class integration_scheme {
    // Forward Euler for every state variable.
    explicit_euler,
    // Exponential relaxation of gating variables toward their steady state
    // where the channel model provides one; forward Euler otherwise.
    semi_implicit
};

// Channel from the catalogue attached to the cells of a region.
struct channel_attachment {
    std::string channel;
    region where;

    // Parameter overrides applied on top of the catalogue entry.
    std::unordered_map<std::string, double> parameters;

    // Scale applied to the fluxes of the channel (e.g. expression level).
    double density = 1;
};

// Patch of initial intracellular concentration, applied after species
// defaults in order of declaration.
struct concentration_override {
    std::string species;
    region where;
    double value = 0;                       // [mol/m^3]

    // Bath concentration of the species; the bath is shared by all cells.
    std::optional<double> bath;             // [mol/m^3]
};

// Smooth on/off profile used by interventions:
//     p(t) = 1/(1+exp((t_on-t)/rate)) - 1/(1+exp((t_off-t)/rate))
// or the square pulse on [t_on, t_off) when rate is zero.
struct pulse {
    double t_on = 0;    // [s]
    double t_off = 0;   // [s]
    double rate = 0;    // [s]

    double operator()(double t) const {
        if (rate<=0) {
            return t>=t_on && t<t_off? 1: 0;
        }
        return 1/(1 + std::exp((t_on - t)/rate)) - 1/(1 + std::exp((t_off - t)/rate));
    }
};

// Transmembrane current density injected into the cells of a region during
// [t_on, t_off), carried by the named ion. Positive amplitude depolarizes.
struct current_stimulus {
    region where;
    double amplitude = 0;   // [A/m^2]
    double t_on = 0;        // [s]
    double t_off = 0;       // [s]
    std::string ion = "na";
};

// Bath concentration of a species moves toward `target` following the pulse.
struct bath_change {
    std::string species;
    double target = 0;      // [mol/m^3]
    pulse profile;
};

// Gap junction permeability scaled by 1 - strength·p(t).
struct junction_block {
    double strength = 1;
    pulse profile;
};

// Attachments of the named channel on a region scaled by 1 - strength·p(t).
struct channel_block {
    std::string channel;
    region where;
    double strength = 1;
    pulse profile;
};

// Temperature shifted by delta·p(t).
struct temperature_change {
    double delta = 0;       // [K]
    pulse profile;
};

// Voltage gating of gap junctions.
struct junction_parameters {
    bool voltage_gated = true;
    double threshold = 0.05;            // |ΔV| below which junctions stay open [V]
    double slope = 0.01;                // closing voltage scale above threshold [V]
    double min_open_fraction = 0.04;    // residual open fraction at large |ΔV|
    double tau = 0.01;                  // relaxation time constant [s], 0 = instantaneous
};

// Divergence policy.
struct stability_parameters {
    // A clamp that removes more than this fraction of a concentration
    // increment counts as a stability warning.
    double clamp_tolerance = 0.1;

    // Divergence when more than this fraction of cells need clamping for
    // more than clamp_step_limit consecutive steps.
    double clamp_cell_fraction = 0.1;
    unsigned clamp_step_limit = 10;

    // Largest admissible |V| [V].
    double voltage_bound = 1.0;

    // Converged when max |dV/dt| falls below this value [V/s]; 0 disables.
    double steady_state_tolerance = 0;
};

struct tissue_parameters {
    std::vector<ion_species> species = default_ion_species();
    physical_constants constants;
    double temperature = default_temperature;   // [K]

    std::vector<channel_attachment> channels;
    std::vector<concentration_override> concentrations;
    std::vector<current_stimulus> stimuli;

    std::vector<bath_change> bath_changes;
    std::vector<junction_block> junction_blocks;
    std::vector<channel_block> channel_blocks;
    std::vector<temperature_change> temperature_changes;

    junction_parameters junctions;
    stability_parameters stability;
    integration_scheme scheme = integration_scheme::explicit_euler;

    // Resting voltage reference [V], added to the capacitive voltage of the
    // initial charge imbalance of each cell. Unset is a zero offset.
    std::optional<double> initial_voltage;

    // Log setup summary.
    bool verbose = false;
};

// Throws bad_parameters describing the first inconsistency found.
void validate(const tissue_parameters& p);

std::string to_string(integration_scheme);

} // namespace bes
