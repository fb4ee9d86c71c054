#pragma once

/* Channel metadata, used by channel_catalogue to validate parameter
 * overrides and ion bindings, and by the simulation to lay out gating state.
 */

#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace bes {

enum class channel_kind {
    voltage_gated,
    ligand_gated,
    leak,
    pump
};

struct channel_field_spec {
    std::string units;
    double default_value = 0;
    double lower_bound = std::numeric_limits<double>::lowest();
    double upper_bound = std::numeric_limits<double>::max();

    bool valid(double x) const { return x>=lower_bound && x<=upper_bound; }
};

// Gating variable with its bounded domain.
struct gate_spec {
    std::string name;
    double lower_bound = 0;
    double upper_bound = 1;
};

struct ion_dependency {
    // Channel carries flux of this ion; otherwise the concentration is only read.
    bool write_flux = true;
};

struct channel_info {
    channel_kind kind = channel_kind::leak;

    // Parameters in declaration order: models index their values by position.
    std::vector<std::pair<std::string, channel_field_spec>> parameters;

    std::vector<gate_spec> gates;

    // Ion bindings in slot order.
    std::vector<std::pair<std::string, ion_dependency>> ions;

    // Index of the named parameter, or -1.
    int parameter_index(const std::string& name) const;

    // Index of the named ion slot, or -1.
    int ion_index(const std::string& name) const;
};

std::string to_string(channel_kind);

} // namespace bes
