#include <string>
#include <vector>

#include <bes/ion.hpp>

namespace bes {

std::vector<ion_species> default_ion_species() {
    // name, valence, free diffusion [m^2/s], intracellular, extracellular [mol/m^3]
    return {
        {"na",  1, 1.33e-9, 12.0,   145.0},
        {"k",   1, 1.96e-9, 139.0,  5.0},
        {"cl", -1, 2.03e-9, 10.0,   115.0},
        {"ca",  2, 0.79e-9, 1.0e-4, 2.0},
        {"p",  -1, 0.0,     141.0002, 41.0},
    };
}

int find_species(const std::vector<ion_species>& species, const std::string& name) {
    for (std::size_t i=0; i<species.size(); ++i) {
        if (species[i].name==name) return (int)i;
    }
    return -1;
}

} // namespace bes
