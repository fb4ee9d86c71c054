#include <cmath>
#include <memory>

#include <bes/channel.hpp>

#include "channels/builtin.hpp"

// Hodgkin-Huxley squid axon kinetics. Rate functions take the membrane
// voltage in mV and return rates in 1/ms at 6.3 °C; the model scales them
// by a Q10 of 3 and converts to SI.

namespace bes {
namespace channels {

namespace {

// x/(exp(x)-1), continuous at 0.
inline double exprelr(double x) {
    return std::abs(x)<1e-7? 1 - x/2: x/std::expm1(x);
}

class hh: public channel_model {
public:
    enum param: unsigned { gnabar, gkbar, gl, el };
    enum gate: unsigned { m, h, n };
    enum ion: unsigned { na, k };

    hh(): channel_model(make_info()) {}

    static channel_info make_info() {
        channel_info info;
        info.kind = channel_kind::voltage_gated;
        info.parameters = {
            {"gnabar", {"S/m^2", 1200.0,  0, HUGE_VAL}},
            {"gkbar",  {"S/m^2", 360.0,   0, HUGE_VAL}},
            {"gl",     {"S/m^2", 3.0,     0, HUGE_VAL}},
            {"el",     {"V",     -0.0543, -1, 1}},
        };
        info.gates = {{"m", 0, 1}, {"h", 0, 1}, {"n", 0, 1}};
        info.ions = {{"na", {}}, {"k", {}}};
        return info;
    }

    double conductance(const membrane_context&, const double* g) const override {
        return p(gnabar)*g[m]*g[m]*g[m]*g[h] + p(gkbar)*std::pow(g[n], 4) + p(gl);
    }

    void fluxes(const membrane_context& ctx, const double* g, double* flux) const override {
        double vt = ctx.vt();
        double ena = nernst_potential(vt, ctx.charge[na], ctx.c_in[na], ctx.c_out[na]);
        double ek = nernst_potential(vt, ctx.charge[k], ctx.c_in[k], ctx.c_out[k]);

        // Outward current densities [A/m^2].
        double ina = p(gnabar)*g[m]*g[m]*g[m]*g[h]*(ctx.v - ena);
        double ik = p(gkbar)*std::pow(g[n], 4)*(ctx.v - ek) + p(gl)*(ctx.v - p(el));

        double F = ctx.constants.faraday;
        flux[na] = ctx.charge[na]? -ina/(ctx.charge[na]*F): 0;
        flux[k] = ctx.charge[k]? -ik/(ctx.charge[k]*F): 0;
    }

    void gating_derivative(const membrane_context& ctx, const double* g, double* dg) const override {
        double alpha[3], beta[3];
        rates(ctx, alpha, beta);
        for (unsigned i=0; i<3; ++i) {
            dg[i] = alpha[i]*(1 - g[i]) - beta[i]*g[i];
        }
    }

    bool steady_state(const membrane_context& ctx, const double*, double* inf, double* tau) const override {
        double alpha[3], beta[3];
        rates(ctx, alpha, beta);
        for (unsigned i=0; i<3; ++i) {
            double sum = alpha[i] + beta[i];
            inf[i] = alpha[i]/sum;
            tau[i] = 1/sum;
        }
        return true;
    }

    channel_ptr clone() const override {
        return std::make_unique<hh>(*this);
    }

private:
    // Rates [1/s] for m, h, n.
    static void rates(const membrane_context& ctx, double* alpha, double* beta) {
        double celsius = ctx.temperature - 273.15;
        double q10 = std::pow(3.0, (celsius - 6.3)/10.0)*1e3;
        double v = ctx.v*1e3;

        alpha[m] = q10*exprelr(-(v + 40)/10);
        beta[m]  = q10*4*std::exp(-(v + 65)/18);

        alpha[h] = q10*0.07*std::exp(-(v + 65)/20);
        beta[h]  = q10/(std::exp(-(v + 35)/10) + 1);

        alpha[n] = q10*0.1*exprelr(-(v + 55)/10);
        beta[n]  = q10*0.125*std::exp(-(v + 65)/80);
    }
};

} // anonymous namespace

channel_ptr make_hh() {
    return std::make_unique<hh>();
}

} // namespace channels
} // namespace bes
