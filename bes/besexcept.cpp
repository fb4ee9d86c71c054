#include <string>

#include <bes/besexcept.hpp>
#include <bes/common_types.hpp>

#include "util/pprintf.hpp"

namespace bes {

using bes::util::pprintf;

bes_exception::bes_exception(const std::string& what):
    std::runtime_error{what}
{}

bes_internal_error::bes_internal_error(const std::string& what):
    std::logic_error(what)
{}

bad_parameters::bad_parameters(const std::string& what):
    bes_exception(pprintf("invalid parameters: {}", what))
{}

geometry_error::geometry_error(const std::string& what):
    bes_exception(pprintf("geometry error: {}", what))
{}

connectivity_error::connectivity_error(const std::string& what):
    bes_exception(pprintf("connectivity error: {}", what))
{}

connectivity_error::connectivity_error(cell_index_type cell, const std::string& what):
    bes_exception(pprintf("connectivity error on cell {}: {}", cell, what)),
    cell(cell)
{}

unknown_channel_error::unknown_channel_error(const std::string& channel_name):
    bes_exception(pprintf("no channel {} in catalogue", channel_name)),
    channel_name(channel_name)
{}

duplicate_channel::duplicate_channel(const std::string& channel_name):
    bes_exception(pprintf("channel {} already exists", channel_name)),
    channel_name(channel_name)
{}

no_such_parameter::no_such_parameter(const std::string& channel_name, const std::string& param_name):
    bes_exception(pprintf("channel {} has no parameter {}", channel_name, param_name)),
    channel_name(channel_name),
    param_name(param_name)
{}

invalid_parameter_value::invalid_parameter_value(const std::string& channel_name, const std::string& param_name, const std::string& value_str):
    bes_exception(pprintf("invalid parameter value for channel {} parameter {}: {}", channel_name, param_name, value_str)),
    channel_name(channel_name),
    param_name(param_name),
    value_str(value_str)
{}

invalid_parameter_value::invalid_parameter_value(const std::string& channel_name, const std::string& param_name, double value):
    bes_exception(pprintf("invalid parameter value for channel {} parameter {}: {}", channel_name, param_name, value)),
    channel_name(channel_name),
    param_name(param_name),
    value(value)
{}

invalid_ion_remap::invalid_ion_remap(const std::string& channel_name):
    bes_exception(pprintf("ion remapping not supported for channel {}", channel_name)),
    channel_name(channel_name)
{}

invalid_ion_remap::invalid_ion_remap(const std::string& channel_name, const std::string& from_ion, const std::string& to_ion):
    bes_exception(pprintf("invalid ion parameter remapping for channel {}: {} -> {}", channel_name, from_ion, to_ion)),
    channel_name(channel_name),
    from_ion(from_ion),
    to_ion(to_ion)
{}

unknown_ion_error::unknown_ion_error(const std::string& channel_name, const std::string& ion_name):
    bes_exception(pprintf("channel {} uses ion {} which is not a simulated species", channel_name, ion_name)),
    channel_name(channel_name),
    ion_name(ion_name)
{}

bad_simulation_state::bad_simulation_state(const std::string& what):
    bes_exception(pprintf("bad simulation state: {}", what))
{}

divergence_error::divergence_error(step_type step, time_type time, const std::string& reason):
    bes_exception(pprintf("simulation diverged at step {} (t = {} s): {}", step, time, reason)),
    step(step),
    time(time),
    reason(reason)
{}

zero_thread_requested_error::zero_thread_requested_error(unsigned nbt):
    bes_exception("threads must be a positive integer"),
    nbt(nbt)
{}

} // namespace bes
