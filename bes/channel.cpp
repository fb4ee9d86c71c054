#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

#include <bes/besexcept.hpp>
#include <bes/channel.hpp>

namespace bes {

namespace {
// Floor on concentrations entering logarithms [mol/m^3].
constexpr double min_concentration = 1e-12;
}

channel_model::channel_model(channel_info info):
    info_(std::move(info))
{
    for (auto& kv: info_.parameters) {
        values_.push_back(kv.second.default_value);
    }
}

double channel_model::get(const std::string& param) const {
    int i = info_.parameter_index(param);
    if (i<0) throw no_such_parameter(name_, param);
    return values_[i];
}

void channel_model::set(const std::string& param, double value) {
    int i = info_.parameter_index(param);
    if (i<0) throw no_such_parameter(name_, param);
    if (!info_.parameters[i].second.valid(value)) {
        throw invalid_parameter_value(name_, param, value);
    }
    values_[i] = value;
    info_.parameters[i].second.default_value = value;
}

void channel_model::rename_ion(const std::string& from, const std::string& to) {
    int i = info_.ion_index(from);
    if (i<0 || (from!=to && info_.ion_index(to)>=0)) {
        throw invalid_ion_remap(name_, from, to);
    }
    info_.ions[i].first = to;
}

void channel_model::init_gates(const membrane_context& ctx, double* gates) const {
    auto n = num_gates();
    if (!n) return;

    for (std::size_t i=0; i<n; ++i) {
        gates[i] = info_.gates[i].lower_bound;
    }

    std::vector<double> inf(n), tau(n);
    if (steady_state(ctx, gates, inf.data(), tau.data())) {
        for (std::size_t i=0; i<n; ++i) {
            gates[i] = std::clamp(inf[i], info_.gates[i].lower_bound, info_.gates[i].upper_bound);
        }
    }
}

double nernst_potential(double vt, int charge, double c_in, double c_out) {
    if (!charge) return 0;
    c_in = std::max(c_in, min_concentration);
    c_out = std::max(c_out, min_concentration);
    return vt/charge*std::log(c_out/c_in);
}

double ghk_flux(double v, double vt, int charge, double diffusivity, double thickness, double c_in, double c_out) {
    double alpha = charge*v/vt;
    double k = diffusivity/thickness;

    if (std::abs(alpha)<1e-9) {
        return -k*(c_in - c_out);
    }

    double e = std::exp(-alpha);
    return -k*alpha*(c_in - c_out*e)/(1 - e);
}

} // namespace bes
