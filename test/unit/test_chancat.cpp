#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include <bes/besexcept.hpp>
#include <bes/chancat.hpp>
#include <bes/channel.hpp>
#include <bes/chaninfo.hpp>

#include "common.hpp"

using namespace std::string_literals;
using namespace bes;

// A channel with two ions and two parameters for exercising the catalogue.

class burble: public channel_model {
public:
    burble(): channel_model(make_info()) {}

    static channel_info make_info() {
        channel_info info;
        info.kind = channel_kind::leak;
        info.parameters = {{"quux",  {"m/s", 2.3,   0, 10.}},
                           {"xyzzy", {"V",   0.05, -1, 1.}}};
        info.ions = {{"a", {}}, {"b", {}}};
        return info;
    }

    double conductance(const membrane_context&, const double*) const override { return p(0); }

    void fluxes(const membrane_context&, const double*, double* flux) const override {
        flux[0] = p(0);
        flux[1] = p(1);
    }

    channel_ptr clone() const override { return std::make_unique<burble>(*this); }
};

channel_catalogue build_fake_catalogue() {
    channel_catalogue cat;
    cat.add("burble", std::make_unique<burble>());

    // Derived channel with parameter overrides.
    cat.derive("burble_quiet", "burble", {{"quux", 0.5}});

    // Derived from a derived channel, with swapped ions.
    cat.derive("burble_swapped", "burble_quiet", {{"xyzzy", -0.1}}, {{"a", "b"}, {"b", "a"}});

    return cat;
}

TEST(chancat, fingerprint_and_info) {
    auto cat = build_fake_catalogue();

    EXPECT_TRUE(cat.has("burble"));
    EXPECT_TRUE(cat.has("burble_quiet"));
    EXPECT_FALSE(cat.has("fleeb"));

    EXPECT_FALSE(cat.is_derived("burble"));
    EXPECT_TRUE(cat.is_derived("burble_quiet"));

    auto info = cat["burble_quiet"];
    EXPECT_EQ(0.5, info.parameters[info.parameter_index("quux")].second.default_value);
    EXPECT_EQ(0.05, info.parameters[info.parameter_index("xyzzy")].second.default_value);

    EXPECT_EQ((std::vector<std::string>{"burble", "burble_quiet", "burble_swapped"}), cat.names());
}

TEST(chancat, names) {
    auto names = global_default_catalogue().names();
    for (auto n: {"leak", "hh", "cag_k", "nak_atpase", "ca_atpase", "leak_na", "leak_k", "leak_cl", "leak_ca"}) {
        EXPECT_TRUE(std::count(names.begin(), names.end(), n)) << n;
    }
    EXPECT_TRUE(std::is_sorted(names.begin(), names.end()));
}

TEST(chancat, instance) {
    auto cat = build_fake_catalogue();

    auto m = cat.instance("burble_swapped");
    EXPECT_EQ("burble_swapped", m->name());
    EXPECT_EQ(0.5, m->get("quux"));
    EXPECT_EQ(-0.1, m->get("xyzzy"));

    // Ion slots keep their order; bindings are exchanged.
    ASSERT_EQ(2u, m->num_ions());
    EXPECT_EQ("b", m->info().ions[0].first);
    EXPECT_EQ("a", m->info().ions[1].first);

    // Instances are independent.
    auto m1 = cat.instance("burble");
    auto m2 = cat.instance("burble");
    m1->set("quux", 7);
    EXPECT_EQ(2.3, m2->get("quux"));
    EXPECT_EQ(2.3, cat["burble"].parameters[0].second.default_value);
}

TEST(chancat, bad_derivations) {
    auto cat = build_fake_catalogue();

    EXPECT_THROW(cat.derive("x", "fleeb", {}), unknown_channel_error);
    EXPECT_THROW(cat.derive("burble_quiet", "burble", {}), duplicate_channel);
    EXPECT_THROW(cat.add("burble", std::make_unique<burble>()), duplicate_channel);
    EXPECT_THROW(cat.derive("x", "burble", {{"plugh", 1.}}), no_such_parameter);
    EXPECT_THROW(cat.derive("x", "burble", {{"quux", 11.}}), invalid_parameter_value);
    EXPECT_THROW(cat.derive("x", "burble", {}, {{"c", "d"}}), invalid_ion_remap);
    EXPECT_THROW(cat.derive("x", "burble", {}, {{"a", "b"}}), invalid_ion_remap);

    // Failed derivations leave nothing behind.
    EXPECT_FALSE(cat.has("x"));
}

TEST(chancat, implicit_derivation) {
    auto cat = build_fake_catalogue();

    EXPECT_TRUE(cat.has("burble/quux=4"));
    EXPECT_TRUE(cat.is_derived("burble/quux=4"));

    auto m = cat.instance("burble_quiet/xyzzy=0.2,a=c");
    EXPECT_EQ(0.5, m->get("quux"));
    EXPECT_EQ(0.2, m->get("xyzzy"));
    EXPECT_EQ("c", m->info().ions[0].first);

    EXPECT_THROW(cat.instance("burble/quux=lots"), invalid_parameter_value);
    EXPECT_THROW(cat.instance("burble/quux=100"), invalid_parameter_value);
    EXPECT_THROW(cat.instance("burble/plugh=1"), no_such_parameter);
    EXPECT_THROW(cat.instance("fleeb/quux=1"), unknown_channel_error);
    EXPECT_THROW(cat.instance("fleeb"), unknown_channel_error);

    // Bare ion renaming is allowed only for single ion channels.
    EXPECT_THROW(cat.instance("burble/c"), invalid_ion_remap);

    const auto& def = global_default_catalogue();
    auto leak_k = def.instance("leak/k");
    ASSERT_EQ(1u, leak_k->num_ions());
    EXPECT_EQ("k", leak_k->info().ions[0].first);

    // Make an implicit derivation permanent.
    cat.derive("burble_loud", "burble/quux=9");
    EXPECT_TRUE(cat.has("burble_loud"));
    EXPECT_EQ(9., cat.instance("burble_loud")->get("quux"));
}

TEST(chancat, remove) {
    auto cat = build_fake_catalogue();

    cat.remove("burble_quiet");
    EXPECT_TRUE(cat.has("burble"));
    EXPECT_FALSE(cat.has("burble_quiet"));

    // Derivations of a removed channel go with it.
    EXPECT_FALSE(cat.has("burble_swapped"));

    EXPECT_THROW(cat.remove("fleeb"), unknown_channel_error);
}

TEST(chancat, copy) {
    auto cat = build_fake_catalogue();
    channel_catalogue cat2 = cat;

    cat2.remove("burble");
    EXPECT_TRUE(cat.has("burble_swapped"));
    EXPECT_FALSE(cat2.has("burble"));

    cat2 = cat;
    EXPECT_TRUE(cat2.has("burble_swapped"));
    EXPECT_EQ(0.5, cat2.instance("burble_swapped")->get("quux"));
}

TEST(chancat, default_leaks) {
    const auto& cat = global_default_catalogue();

    auto leak_k = cat.instance("leak_k");
    EXPECT_EQ("k", leak_k->info().ions[0].first);
    EXPECT_EQ(15e-18, leak_k->get("permeability"));

    auto leak_cl = cat.instance("leak_cl");
    EXPECT_EQ("cl", leak_cl->info().ions[0].first);

    auto leak_na = cat.instance("leak_na");
    EXPECT_EQ("na", leak_na->info().ions[0].first);

    EXPECT_EQ(channel_kind::pump, cat["nak_atpase"].kind);
    EXPECT_EQ(channel_kind::voltage_gated, cat["hh"].kind);
    EXPECT_EQ(3u, cat["hh"].gates.size());
}
