#pragma once

// Physical constants and membrane defaults.
//
// All quantities are SI: concentrations in mol/m^3 (numerically mM),
// voltages in V, lengths in m and time in s.

namespace bes {

struct physical_constants {
    double faraday = 96485.332;        // [C/mol]
    double gas_constant = 8.314462;    // [J/(mol K)]

    // Specific membrane capacitance [F/m^2].
    double membrane_capacitance = 0.01;

    // Membrane thickness [m], the diffusion length for transmembrane leak.
    double membrane_thickness = 7.5e-9;

    // Metabolite pools consumed by ATP driven pumps [mol/m^3].
    double atp = 1.5;
    double adp = 0.1;
    double pi = 0.1;

    // Standard free energy of ATP hydrolysis [J/mol].
    double delta_g_atp = -37.3e3;

    // Thermal voltage RT/F at temperature T [V].
    double thermal_voltage(double T) const {
        return gas_constant*T/faraday;
    }
};

// 37 °C.
constexpr double default_temperature = 310.15;

} // namespace bes
