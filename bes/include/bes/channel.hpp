#pragma once

#include <array>
#include <memory>
#include <string>
#include <vector>

#include <bes/chaninfo.hpp>
#include <bes/constants.hpp>

namespace bes {

// Upper bound on the number of ion slots of a channel model.
constexpr unsigned max_channel_ions = 4;

// Upper bound on the number of gating variables of a channel model.
constexpr unsigned max_channel_gates = 8;

// Local conditions at one patch of membrane, as seen by a channel model.
// Concentration and charge arrays are indexed by the model's ion slots.
struct membrane_context {
    double v = 0;                           // membrane voltage [V]
    double temperature = default_temperature; // [K]
    double time = 0;                        // [s]
    physical_constants constants;

    std::array<double, max_channel_ions> c_in{};   // [mol/m^3]
    std::array<double, max_channel_ions> c_out{};  // [mol/m^3]
    std::array<int, max_channel_ions> charge{};

    // Thermal voltage RT/F [V].
    double vt() const { return constants.thermal_voltage(temperature); }
};

class channel_model;
using channel_ptr = std::unique_ptr<channel_model>;

// Kinetic model of an ion channel or pump.
//
// Models hold their parameter values; gating state is owned by the caller
// and passed as a pointer to info().gates.size() values.
class channel_model {
public:
    explicit channel_model(channel_info info);
    virtual ~channel_model() = default;

    const channel_info& info() const { return info_; }

    std::size_t num_gates() const { return info_.gates.size(); }
    std::size_t num_ions() const { return info_.ions.size(); }

    // Parameter access by name. Throws no_such_parameter for unknown names
    // and invalid_parameter_value for values outside the declared bounds.
    double get(const std::string& param) const;
    void set(const std::string& param, double value);

    // Rebind the ion of a slot (catalogue derivation).
    void rename_ion(const std::string& from, const std::string& to);

    // Name used in error messages.
    const std::string& name() const { return name_; }
    void set_name(std::string name) { name_ = std::move(name); }

    // Initial gating values: the steady state at the given conditions where
    // the model provides one, otherwise the gate lower bounds.
    virtual void init_gates(const membrane_context& ctx, double* gates) const;

    // Total membrane conductance density [S/m^2].
    virtual double conductance(const membrane_context& ctx, const double* gates) const = 0;

    // Transmembrane molar flux density per ion slot [mol/(m^2 s)],
    // positive into the cell. Overwrites flux[0, num_ions()).
    virtual void fluxes(const membrane_context& ctx, const double* gates, double* flux) const = 0;

    // Time derivatives of the gating variables [1/s].
    virtual void gating_derivative(const membrane_context& ctx, const double* gates, double* dgates) const {}

    // Steady state values and time constants of each gate; returns false if
    // the model does not provide them.
    virtual bool steady_state(const membrane_context& ctx, const double* gates, double* inf, double* tau) const {
        return false;
    }

    virtual channel_ptr clone() const = 0;

protected:
    // Parameter value by declaration index.
    double p(unsigned i) const { return values_[i]; }

private:
    std::string name_;
    channel_info info_;
    std::vector<double> values_;
};

// Helpers shared by channel implementations.

// Nernst potential [V] of an ion with given charge.
double nernst_potential(double vt, int charge, double c_in, double c_out);

// Goldman-Hodgkin-Katz electrodiffusive flux density [mol/(m^2 s)] through
// a membrane of given thickness, positive into the cell.
double ghk_flux(double v, double vt, int charge, double diffusivity, double thickness, double c_in, double c_out);

} // namespace bes
