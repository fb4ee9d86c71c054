#include <cmath>
#include <memory>

#include <bes/channel.hpp>

#include "channels/builtin.hpp"

namespace bes {
namespace channels {

namespace {

class leak: public channel_model {
public:
    enum param: unsigned { permeability };

    leak(): channel_model(make_info()) {}

    static channel_info make_info() {
        channel_info info;
        info.kind = channel_kind::leak;
        info.parameters = {{"permeability", {"m^2/s", 1e-18, 0, HUGE_VAL}}};
        info.ions = {{"na", {}}};
        return info;
    }

    double conductance(const membrane_context& ctx, const double*) const override {
        // Linearised GHK conductance about zero driving force.
        double z = ctx.charge[0];
        double c = 0.5*(ctx.c_in[0] + ctx.c_out[0]);
        return z*z*ctx.constants.faraday*p(permeability)/ctx.constants.membrane_thickness*c/ctx.vt();
    }

    void fluxes(const membrane_context& ctx, const double*, double* flux) const override {
        flux[0] = ghk_flux(ctx.v, ctx.vt(), ctx.charge[0], p(permeability),
                           ctx.constants.membrane_thickness, ctx.c_in[0], ctx.c_out[0]);
    }

    channel_ptr clone() const override {
        return std::make_unique<leak>(*this);
    }
};

} // anonymous namespace

channel_ptr make_leak() {
    return std::make_unique<leak>();
}

} // namespace channels
} // namespace bes
