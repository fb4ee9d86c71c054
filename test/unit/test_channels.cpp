#include <cmath>
#include <vector>

#include <bes/besexcept.hpp>
#include <bes/chancat.hpp>
#include <bes/channel.hpp>
#include <bes/constants.hpp>

#include "common.hpp"

using namespace bes;

namespace {

// Context with the default mammalian concentrations bound to the model's ions.
membrane_context make_context(const channel_model& m, double v) {
    membrane_context ctx;
    ctx.v = v;
    for (std::size_t i=0; i<m.num_ions(); ++i) {
        const auto& ion = m.info().ions[i].first;
        if (ion=="na") { ctx.c_in[i] = 12;   ctx.c_out[i] = 145; ctx.charge[i] = 1; }
        if (ion=="k")  { ctx.c_in[i] = 139;  ctx.c_out[i] = 5;   ctx.charge[i] = 1; }
        if (ion=="cl") { ctx.c_in[i] = 10;   ctx.c_out[i] = 115; ctx.charge[i] = -1; }
        if (ion=="ca") { ctx.c_in[i] = 1e-4; ctx.c_out[i] = 2;   ctx.charge[i] = 2; }
    }
    return ctx;
}

} // anonymous namespace

TEST(channels, nernst) {
    double vt = physical_constants{}.thermal_voltage(default_temperature);

    EXPECT_NEAR(0.0667, nernst_potential(vt, 1, 12, 145), 1e-3);
    EXPECT_NEAR(-0.0890, nernst_potential(vt, 1, 139, 5), 1e-3);
    EXPECT_NEAR(-0.0654, nernst_potential(vt, -1, 10, 115), 1e-3);
    EXPECT_EQ(0., nernst_potential(vt, 0, 1, 2));
}

TEST(channels, ghk_flux) {
    double vt = physical_constants{}.thermal_voltage(default_temperature);
    double d = 7.5e-9;
    double D = 1e-18;

    // No net flux at the reversal potential.
    for (int z: {1, -1, 2}) {
        double e = nernst_potential(vt, z, 12, 145);
        double j = ghk_flux(e, vt, z, D, d, 12, 145);
        EXPECT_NEAR(0., j, 1e-12*D/d*145);
    }

    // Inward down the gradient at zero voltage, outward when strongly depolarized.
    EXPECT_GT(ghk_flux(0, vt, 1, D, d, 12, 145), 0.);
    EXPECT_LT(ghk_flux(0.2, vt, 1, D, d, 12, 145), 0.);

    // Neutral species: plain Fick diffusion.
    EXPECT_DOUBLE_EQ(-D/d*(3. - 1.), ghk_flux(0.05, vt, 0, D, d, 3, 1));

    // Continuous through zero voltage.
    EXPECT_TRUE(testing::near_relative(ghk_flux(0, vt, 1, D, d, 12, 145), ghk_flux(1e-12, vt, 1, D, d, 12, 145), 1e-6));
}

TEST(channels, parameters) {
    auto m = global_default_catalogue().instance("hh");

    EXPECT_EQ(1200., m->get("gnabar"));
    m->set("gnabar", 1000);
    EXPECT_EQ(1000., m->get("gnabar"));

    EXPECT_THROW(m->get("gcabar"), no_such_parameter);
    EXPECT_THROW(m->set("gcabar", 1), no_such_parameter);
    EXPECT_THROW(m->set("gnabar", -1), invalid_parameter_value);

    EXPECT_THROW(m->rename_ion("cl", "ca"), invalid_ion_remap);
    EXPECT_THROW(m->rename_ion("na", "k"), invalid_ion_remap);
}

TEST(channels, hh_steady_state) {
    auto m = global_default_catalogue().instance("hh");
    ASSERT_EQ(3u, m->num_gates());

    for (double v: {-0.08, -0.065, -0.03, 0.02}) {
        auto ctx = make_context(*m, v);

        std::vector<double> g(3), inf(3), tau(3), dg(3);
        m->init_gates(ctx, g.data());
        ASSERT_TRUE(m->steady_state(ctx, g.data(), inf.data(), tau.data()));

        for (unsigned i=0; i<3; ++i) {
            EXPECT_EQ(inf[i], g[i]);
            EXPECT_GE(g[i], 0.);
            EXPECT_LE(g[i], 1.);
            EXPECT_GT(tau[i], 0.);
        }

        // The steady state is a fixed point of the kinetics.
        m->gating_derivative(ctx, g.data(), dg.data());
        for (unsigned i=0; i<3; ++i) {
            EXPECT_NEAR(0., dg[i], 1e-9/tau[i]);
        }
    }

    // Activation rises and inactivation falls with depolarization.
    std::vector<double> lo(3), hi(3);
    m->init_gates(make_context(*m, -0.08), lo.data());
    m->init_gates(make_context(*m, 0.0), hi.data());
    EXPECT_LT(lo[0], hi[0]);
    EXPECT_GT(lo[1], hi[1]);
    EXPECT_LT(lo[2], hi[2]);
}

TEST(channels, hh_fluxes) {
    auto m = global_default_catalogue().instance("hh");
    auto ctx = make_context(*m, -0.065);

    std::vector<double> g(3);
    m->init_gates(ctx, g.data());

    double flux[2];
    m->fluxes(ctx, g.data(), flux);

    // Below both reversal potentials sodium enters; above E_K potassium leaves.
    EXPECT_GT(flux[0], 0.);
    EXPECT_LT(flux[1], 0.);
    EXPECT_GT(m->conductance(ctx, g.data()), 0.);
}

TEST(channels, leak) {
    const auto& cat = global_default_catalogue();
    auto m = cat.instance("leak_k");
    auto ctx = make_context(*m, -0.05);

    double flux;
    m->fluxes(ctx, nullptr, &flux);

    // Potassium leaks out at rest.
    EXPECT_LT(flux, 0.);
    EXPECT_GT(m->conductance(ctx, nullptr), 0.);

    // Flux scales with permeability.
    auto m2 = cat.instance("leak_k/permeability=30e-18");
    double flux2;
    m2->fluxes(ctx, nullptr, &flux2);
    EXPECT_TRUE(testing::near_relative(2*flux, flux2, 1e-12));
}

TEST(channels, nak_atpase) {
    auto m = global_default_catalogue().instance("nak_atpase");
    auto ctx = make_context(*m, -0.05);

    double flux[2];
    m->fluxes(ctx, nullptr, flux);

    // Three sodium out for two potassium in.
    EXPECT_LT(flux[0], 0.);
    EXPECT_GT(flux[1], 0.);
    EXPECT_DOUBLE_EQ(-2./3.*flux[0], flux[1]);
    EXPECT_EQ(0., m->conductance(ctx, nullptr));

    // No sodium, no pumping.
    ctx.c_in[0] = 0;
    m->fluxes(ctx, nullptr, flux);
    EXPECT_EQ(0., flux[0]);
}

TEST(channels, ca_atpase) {
    auto m = global_default_catalogue().instance("ca_atpase");
    auto ctx = make_context(*m, -0.05);
    ctx.c_in[0] = 1e-3;

    double flux;
    m->fluxes(ctx, nullptr, &flux);
    EXPECT_LT(flux, 0.);

    // No cytosolic calcium: the quotient stays finite and nothing is pumped.
    ctx.c_in[0] = 0;
    m->fluxes(ctx, nullptr, &flux);
    EXPECT_TRUE(std::isfinite(flux));
    EXPECT_EQ(0., flux);

    ctx.c_in[0] = 1e-3;
    ctx.c_out[0] = 0;
    m->fluxes(ctx, nullptr, &flux);
    EXPECT_LT(flux, 0.);
}

TEST(channels, cag_k) {
    auto m = global_default_catalogue().instance("cag_k");
    ASSERT_EQ(2u, m->num_ions());
    EXPECT_FALSE(m->info().ions[1].second.write_flux);

    auto ctx = make_context(*m, -0.05);
    double kd = m->get("kd");

    double g, inf, tau;
    ctx.c_in[1] = 0;
    m->init_gates(ctx, &g);
    EXPECT_EQ(0., g);

    ctx.c_in[1] = kd;
    m->init_gates(ctx, &g);
    EXPECT_DOUBLE_EQ(0.5, g);

    ASSERT_TRUE(m->steady_state(ctx, &g, &inf, &tau));
    EXPECT_EQ(m->get("tau"), tau);

    // Relaxation toward activation.
    double dg;
    double closed = 0;
    m->gating_derivative(ctx, &closed, &dg);
    EXPECT_DOUBLE_EQ(0.5/tau, dg);

    // Open channel passes potassium outward; calcium is only read.
    double flux[2] = {1, 1};
    double open = 1;
    m->fluxes(ctx, &open, flux);
    EXPECT_LT(flux[0], 0.);
    EXPECT_EQ(0., flux[1]);

    m->fluxes(ctx, &closed, flux);
    EXPECT_EQ(0., flux[0]);
}
