#pragma once

#include <string>
#include <vector>

namespace bes {

// Ion species properties that are shared by every cell in the tissue.
struct ion_species {
    std::string name;
    int charge = 0;                         // valence
    double diffusivity = 0;                 // free diffusion constant [m^2/s]
    double default_int_concentration = 0;   // [mol/m^3]
    double default_ext_concentration = 0;   // [mol/m^3]
};

// Mammalian defaults: Na+, K+, Cl-, Ca2+ and an immobile protein anion
// sized to make the default cytoplasm electroneutral.
std::vector<ion_species> default_ion_species();

// Index of species by name in a species set, or -1 if absent.
int find_species(const std::vector<ion_species>& species, const std::string& name);

} // namespace bes
