#include <cmath>
#include <string>
#include <unordered_set>

#include <bes/besexcept.hpp>
#include <bes/tissue_parameters.hpp>

#include "util/pprintf.hpp"

namespace bes {

using util::pprintf;

namespace {

bool finite_nonneg(double x) {
    return std::isfinite(x) && x>=0;
}

void check_species(const tissue_parameters& p, const std::string& name, const char* what) {
    if (find_species(p.species, name)<0) {
        throw bad_parameters(pprintf("{} refers to unknown ion species '{}'", what, name));
    }
}

void check_pulse(const pulse& p, const char* what) {
    if (!std::isfinite(p.t_on) || !std::isfinite(p.t_off) || !finite_nonneg(p.rate)) {
        throw bad_parameters(pprintf("{} pulse must have finite times and non-negative rate", what));
    }
    if (p.t_off<p.t_on) {
        throw bad_parameters(pprintf("{} pulse ends at {} s before it starts at {} s", what, p.t_off, p.t_on));
    }
}

} // anonymous namespace

void validate(const tissue_parameters& p) {
    if (p.species.empty()) {
        throw bad_parameters("at least one ion species is required");
    }

    std::unordered_set<std::string> names;
    for (auto& s: p.species) {
        if (s.name.empty()) {
            throw bad_parameters("ion species with empty name");
        }
        if (!names.insert(s.name).second) {
            throw bad_parameters(pprintf("duplicate ion species '{}'", s.name));
        }
        if (!finite_nonneg(s.diffusivity)) {
            throw bad_parameters(pprintf("diffusivity of '{}' must be non-negative", s.name));
        }
        if (!finite_nonneg(s.default_int_concentration) || !finite_nonneg(s.default_ext_concentration)) {
            throw bad_parameters(pprintf("default concentrations of '{}' must be non-negative", s.name));
        }
    }

    if (!(p.temperature>0) || !std::isfinite(p.temperature)) {
        throw bad_parameters(pprintf("temperature {} K must be positive", p.temperature));
    }
    if (!(p.constants.membrane_capacitance>0)) {
        throw bad_parameters("membrane capacitance must be positive");
    }
    if (!(p.constants.membrane_thickness>0)) {
        throw bad_parameters("membrane thickness must be positive");
    }

    for (auto& a: p.channels) {
        if (!finite_nonneg(a.density)) {
            throw bad_parameters(pprintf("density {} of channel {} must be non-negative", a.density, a.channel));
        }
    }

    for (auto& c: p.concentrations) {
        check_species(p, c.species, "concentration override");
        if (!finite_nonneg(c.value) || (c.bath && !finite_nonneg(*c.bath))) {
            throw bad_parameters(pprintf("concentration override for '{}' must be non-negative", c.species));
        }
    }

    for (auto& s: p.stimuli) {
        check_species(p, s.ion, "current stimulus");
        if (!p.species[find_species(p.species, s.ion)].charge) {
            throw bad_parameters(pprintf("current stimulus carried by uncharged species '{}'", s.ion));
        }
        if (!std::isfinite(s.amplitude)) {
            throw bad_parameters("current stimulus amplitude must be finite");
        }
        if (s.t_off<s.t_on) {
            throw bad_parameters(pprintf("current stimulus ends at {} s before it starts at {} s", s.t_off, s.t_on));
        }
    }

    for (auto& b: p.bath_changes) {
        check_species(p, b.species, "bath change");
        if (!finite_nonneg(b.target)) {
            throw bad_parameters(pprintf("bath change target for '{}' must be non-negative", b.species));
        }
        check_pulse(b.profile, "bath change");
    }

    for (auto& b: p.junction_blocks) {
        if (!(b.strength>=0 && b.strength<=1)) {
            throw bad_parameters(pprintf("junction block strength {} must lie in [0, 1]", b.strength));
        }
        check_pulse(b.profile, "junction block");
    }

    for (auto& b: p.channel_blocks) {
        if (!(b.strength>=0 && b.strength<=1)) {
            throw bad_parameters(pprintf("block strength {} of channel {} must lie in [0, 1]", b.strength, b.channel));
        }
        check_pulse(b.profile, "channel block");
    }

    for (auto& t: p.temperature_changes) {
        if (!std::isfinite(t.delta)) {
            throw bad_parameters("temperature change must be finite");
        }
        check_pulse(t.profile, "temperature change");
    }

    auto& j = p.junctions;
    if (!finite_nonneg(j.threshold) || !(j.slope>0) || !finite_nonneg(j.tau)) {
        throw bad_parameters("junction gating requires threshold >= 0, slope > 0 and tau >= 0");
    }
    if (!(j.min_open_fraction>=0 && j.min_open_fraction<=1)) {
        throw bad_parameters(pprintf("minimum junction open fraction {} must lie in [0, 1]", j.min_open_fraction));
    }

    auto& s = p.stability;
    if (!finite_nonneg(s.clamp_tolerance) || !(s.clamp_cell_fraction>=0 && s.clamp_cell_fraction<=1)) {
        throw bad_parameters("clamp tolerance must be non-negative and clamp cell fraction in [0, 1]");
    }
    if (!(s.voltage_bound>0)) {
        throw bad_parameters(pprintf("voltage bound {} V must be positive", s.voltage_bound));
    }
    if (!finite_nonneg(s.steady_state_tolerance)) {
        throw bad_parameters("steady state tolerance must be non-negative");
    }

    if (p.initial_voltage && !std::isfinite(*p.initial_voltage)) {
        throw bad_parameters("initial voltage must be finite");
    }
}

std::string to_string(integration_scheme s) {
    switch (s) {
    case integration_scheme::explicit_euler: return "explicit_euler";
    case integration_scheme::semi_implicit:  return "semi_implicit";
    }
    return "unknown";
}

} // namespace bes
