#include <cmath>
#include <memory>

#include <bes/channel.hpp>

#include "channels/builtin.hpp"

// ATP driven pumps. The net rate is scaled by the distance of the pump
// reaction from equilibrium, 1 - Q/Keq, and by Michaelis-Menten saturation
// of the enzyme.

namespace bes {
namespace channels {

namespace {

// Stand-in for a vanishing reaction quotient denominator.
constexpr double min_quotient_denominator = 1e-10;

class nak_atpase: public channel_model {
public:
    enum param: unsigned { max_rate, km_na, km_k, km_atp };
    enum ion: unsigned { na, k };

    nak_atpase(): channel_model(make_info()) {}

    static channel_info make_info() {
        channel_info info;
        info.kind = channel_kind::pump;
        info.parameters = {
            {"max_rate", {"mol/(m^2 s)", 1e-7, 0,     HUGE_VAL}},
            {"km_na",    {"mol/m^3",     12.0, 1e-12, HUGE_VAL}},
            {"km_k",     {"mol/m^3",     0.2,  1e-12, HUGE_VAL}},
            {"km_atp",   {"mol/m^3",     0.5,  1e-12, HUGE_VAL}},
        };
        info.ions = {{"na", {}}, {"k", {}}};
        return info;
    }

    double conductance(const membrane_context&, const double*) const override {
        return 0;
    }

    void fluxes(const membrane_context& ctx, const double*, double* flux) const override {
        const auto& pc = ctx.constants;
        double na_i = ctx.c_in[na], na_o = ctx.c_out[na];
        double k_i = ctx.c_in[k], k_o = ctx.c_out[k];

        double q_num = pc.adp*pc.pi*na_o*na_o*na_o*k_i*k_i;
        double q_den = pc.atp*na_i*na_i*na_i*k_o*k_o;
        if (q_den==0) q_den = min_quotient_denominator;

        double RT = pc.gas_constant*ctx.temperature;
        double keq = std::exp(-pc.delta_g_atp/RT + ctx.v/ctx.vt());
        double alpha = p(max_rate)*(1 - q_num/q_den/keq);

        double a = std::pow(na_i/p(km_na), 3);
        double b = std::pow(k_o/p(km_k), 2);
        double c = pc.atp/p(km_atp);
        double enzyme = a*b*c/((1 + a)*(1 + b)*(1 + c));

        flux[na] = -alpha*enzyme;
        flux[k] = -2./3.*flux[na];
    }

    channel_ptr clone() const override {
        return std::make_unique<nak_atpase>(*this);
    }
};

class ca_atpase: public channel_model {
public:
    enum param: unsigned { max_rate, km_ca, km_atp };

    ca_atpase(): channel_model(make_info()) {}

    static channel_info make_info() {
        channel_info info;
        info.kind = channel_kind::pump;
        info.parameters = {
            {"max_rate", {"mol/(m^2 s)", 1e-8, 0,     HUGE_VAL}},
            {"km_ca",    {"mol/m^3",     1e-3, 1e-12, HUGE_VAL}},
            {"km_atp",   {"mol/m^3",     0.5,  1e-12, HUGE_VAL}},
        };
        info.ions = {{"ca", {}}};
        return info;
    }

    double conductance(const membrane_context&, const double*) const override {
        return 0;
    }

    void fluxes(const membrane_context& ctx, const double*, double* flux) const override {
        const auto& pc = ctx.constants;
        double ca_i = ctx.c_in[0], ca_o = ctx.c_out[0];

        double q_num = pc.adp*pc.pi*ca_o;
        double q_den = pc.atp*ca_i;
        if (q_den==0) q_den = min_quotient_denominator;

        double RT = pc.gas_constant*ctx.temperature;
        double keq = std::exp(-pc.delta_g_atp/RT + 2*ctx.v/ctx.vt());
        double alpha = p(max_rate)*(1 - q_num/q_den/keq);

        double a = ca_i/p(km_ca);
        double c = pc.atp/p(km_atp);
        double enzyme = a*c/((1 + a)*(1 + c));

        flux[0] = -alpha*enzyme;
    }

    channel_ptr clone() const override {
        return std::make_unique<ca_atpase>(*this);
    }
};

} // anonymous namespace

channel_ptr make_nak_atpase() {
    return std::make_unique<nak_atpase>();
}

channel_ptr make_ca_atpase() {
    return std::make_unique<ca_atpase>();
}

} // namespace channels
} // namespace bes
