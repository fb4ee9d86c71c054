#include <string>

#include <bes/chaninfo.hpp>

namespace bes {

int channel_info::parameter_index(const std::string& name) const {
    for (std::size_t i=0; i<parameters.size(); ++i) {
        if (parameters[i].first==name) return (int)i;
    }
    return -1;
}

int channel_info::ion_index(const std::string& name) const {
    for (std::size_t i=0; i<ions.size(); ++i) {
        if (ions[i].first==name) return (int)i;
    }
    return -1;
}

std::string to_string(channel_kind k) {
    switch (k) {
    case channel_kind::voltage_gated: return "voltage-gated";
    case channel_kind::ligand_gated:  return "ligand-gated";
    case channel_kind::leak:          return "leak";
    case channel_kind::pump:          return "pump";
    }
    return "unknown";
}

} // namespace bes
