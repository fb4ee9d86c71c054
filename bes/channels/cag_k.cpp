#include <algorithm>
#include <cmath>
#include <memory>

#include <bes/channel.hpp>

#include "channels/builtin.hpp"

namespace bes {
namespace channels {

namespace {

class cag_k: public channel_model {
public:
    enum param: unsigned { permeability, kd, hill, tau };
    enum ion: unsigned { k, ca };

    cag_k(): channel_model(make_info()) {}

    static channel_info make_info() {
        channel_info info;
        info.kind = channel_kind::ligand_gated;
        info.parameters = {
            {"permeability", {"m^2/s",   5e-17, 0,     HUGE_VAL}},
            {"kd",           {"mol/m^3", 1e-3,  1e-12, HUGE_VAL}},
            {"hill",         {"",        3.0,   0.1,   10}},
            {"tau",          {"s",       0.01,  1e-9,  HUGE_VAL}},
        };
        info.gates = {{"o", 0, 1}};
        info.ions = {{"k", {}}, {"ca", {false}}};
        return info;
    }

    double conductance(const membrane_context& ctx, const double* g) const override {
        double z = ctx.charge[k];
        double c = 0.5*(ctx.c_in[k] + ctx.c_out[k]);
        return g[0]*z*z*ctx.constants.faraday*p(permeability)/ctx.constants.membrane_thickness*c/ctx.vt();
    }

    void fluxes(const membrane_context& ctx, const double* g, double* flux) const override {
        flux[k] = ghk_flux(ctx.v, ctx.vt(), ctx.charge[k], g[0]*p(permeability),
                           ctx.constants.membrane_thickness, ctx.c_in[k], ctx.c_out[k]);
        flux[ca] = 0;
    }

    void gating_derivative(const membrane_context& ctx, const double* g, double* dg) const override {
        dg[0] = (activation(ctx) - g[0])/p(tau);
    }

    bool steady_state(const membrane_context& ctx, const double*, double* inf, double* t) const override {
        inf[0] = activation(ctx);
        t[0] = p(tau);
        return true;
    }

    channel_ptr clone() const override {
        return std::make_unique<cag_k>(*this);
    }

private:
    // Hill activation by intracellular calcium.
    double activation(const membrane_context& ctx) const {
        double c = std::pow(std::max(ctx.c_in[ca], 0.0), p(hill));
        double K = std::pow(p(kd), p(hill));
        return c/(K + c);
    }
};

} // anonymous namespace

channel_ptr make_cag_k() {
    return std::make_unique<cag_k>();
}

} // namespace channels
} // namespace bes
