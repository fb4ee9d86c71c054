#pragma once

#include <stdexcept>
#include <string>

#include <bes/common_types.hpp>

// Exception hierarchy for tissue construction and simulation.

namespace bes {

// Internal logic error (if these are thrown,
// there is a bug in the library.)

struct bes_internal_error: std::logic_error {
    bes_internal_error(const std::string&);
};

// Common base-class for run-time errors.

struct bes_exception: std::runtime_error {
    bes_exception(const std::string&);
};

// Parameter set violates domain constraints.
struct bad_parameters: bes_exception {
    bad_parameters(const std::string&);
};

// Geometry errors:

struct geometry_error: bes_exception {
    geometry_error(const std::string&);
};

// Connectivity errors:

struct connectivity_error: bes_exception {
    explicit connectivity_error(const std::string&);
    connectivity_error(cell_index_type cell, const std::string&);
    cell_index_type cell = no_cell;
};

// Channel catalogue errors:

struct unknown_channel_error: bes_exception {
    explicit unknown_channel_error(const std::string& channel_name);
    std::string channel_name;
};

struct duplicate_channel: bes_exception {
    explicit duplicate_channel(const std::string& channel_name);
    std::string channel_name;
};

struct no_such_parameter: bes_exception {
    no_such_parameter(const std::string& channel_name, const std::string& param_name);
    std::string channel_name;
    std::string param_name;
};

struct invalid_parameter_value: bes_exception {
    invalid_parameter_value(const std::string& channel_name, const std::string& param_name, const std::string& value_str);
    invalid_parameter_value(const std::string& channel_name, const std::string& param_name, double value);
    std::string channel_name;
    std::string param_name;
    std::string value_str;
    double value = 0;
};

struct invalid_ion_remap: bes_exception {
    explicit invalid_ion_remap(const std::string& channel_name);
    invalid_ion_remap(const std::string& channel_name, const std::string& from_ion, const std::string& to_ion);
    std::string channel_name;
    std::string from_ion;
    std::string to_ion;
};

// Channel binds an ion that is not part of the simulated species set.
struct unknown_ion_error: bes_exception {
    unknown_ion_error(const std::string& channel_name, const std::string& ion_name);
    std::string channel_name;
    std::string ion_name;
};

// Simulation errors:

struct bad_simulation_state: bes_exception {
    explicit bad_simulation_state(const std::string&);
};

struct divergence_error: bes_exception {
    divergence_error(step_type step, time_type time, const std::string& reason);
    step_type step;
    time_type time;
    std::string reason;
};

// Context errors:

struct zero_thread_requested_error: bes_exception {
    zero_thread_requested_error(unsigned nbt);
    unsigned nbt;
};

} // namespace bes
