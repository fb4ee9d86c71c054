#include <algorithm>
#include <set>
#include <utility>

#include <bes/besexcept.hpp>
#include <bes/geometry.hpp>
#include <bes/network.hpp>

#include "common.hpp"
#include "common_tissues.hpp"

using namespace bes;

TEST(network, full_coupling) {
    auto geom = testing::square_geometry(4, 4);
    auto net = build_network(geom, connectivity_parameters{});

    EXPECT_EQ(16u, net.num_cells);
    ASSERT_EQ(geom.candidates.size(), net.junctions.size());
    EXPECT_EQ(1u, net.num_components);

    // Sorted, unique, unordered pairs.
    std::set<std::pair<cell_index_type, cell_index_type>> pairs;
    for (auto& j: net.junctions) {
        EXPECT_LT(j.a, j.b);
        EXPECT_DOUBLE_EQ(1e-3, j.permeability);
        pairs.insert({j.a, j.b});
    }
    EXPECT_EQ(net.junctions.size(), pairs.size());
    EXPECT_TRUE(std::is_sorted(net.junctions.begin(), net.junctions.end(),
        [](const gap_junction& l, const gap_junction& r) { return std::make_pair(l.a, l.b)<std::make_pair(r.a, r.b); }));

    // Adjacency lists name every junction from both ends.
    std::size_t total = 0;
    for (cell_index_type c=0; c<net.num_cells; ++c) {
        for (auto j: net.junctions_of(c)) {
            EXPECT_TRUE(net.junctions[j].a==c || net.junctions[j].b==c);
        }
        total += net.junctions_of(c).size();
    }
    EXPECT_EQ(2*net.junctions.size(), total);

    // Corner cells have two neighbours, interior cells four.
    EXPECT_EQ(2u, net.junctions_of(0).size());
    EXPECT_EQ(4u, net.junctions_of(5).size());
}

TEST(network, boundary) {
    auto geom = testing::square_geometry(4, 4);
    auto net = build_network(geom, connectivity_parameters{});

    // 4 cells per side, one exposed segment each, corners twice.
    EXPECT_EQ(16u, net.boundary.size());

    double length = 0;
    for (auto& b: net.boundary) {
        EXPECT_TRUE(geom.cells[b.cell].segments[b.segment].is_boundary());
        length += b.length;
    }
    EXPECT_TRUE(testing::near_relative(160e-6, length, 1e-12));

    auto n_on_boundary = std::count(net.on_boundary.begin(), net.on_boundary.end(), 1);
    EXPECT_EQ(12, n_on_boundary);
    EXPECT_FALSE(net.on_boundary[5]);
}

TEST(network, exclude_boundary) {
    auto geom = testing::square_geometry(4, 4);
    connectivity_parameters p;
    p.rule = coupling_rule::exclude_boundary;
    auto net = build_network(geom, p);

    // Only the 2x2 interior block stays coupled.
    EXPECT_EQ(4u, net.junctions.size());
    for (auto& j: net.junctions) {
        EXPECT_FALSE(net.on_boundary[j.a]);
        EXPECT_FALSE(net.on_boundary[j.b]);
    }
    EXPECT_EQ(13u, net.num_components);

    p.require_full_connectivity = true;
    EXPECT_THROW(build_network(geom, p), connectivity_error);
}

TEST(network, random_coupling) {
    auto geom = testing::square_geometry(8, 8);

    connectivity_parameters p;
    p.rule = coupling_rule::random;
    p.probability = 0.5;
    p.seed = 42;

    auto n1 = build_network(geom, p);
    auto n2 = build_network(geom, p);

    // Same seed, same network.
    ASSERT_EQ(n1.junctions.size(), n2.junctions.size());
    for (std::size_t i=0; i<n1.junctions.size(); ++i) {
        EXPECT_EQ(n1.junctions[i].a, n2.junctions[i].a);
        EXPECT_EQ(n1.junctions[i].b, n2.junctions[i].b);
    }

    EXPECT_GT(n1.junctions.size(), 0u);
    EXPECT_LT(n1.junctions.size(), geom.candidates.size());

    p.probability = 0;
    EXPECT_EQ(0u, build_network(geom, p).junctions.size());
    EXPECT_EQ(64u, build_network(geom, p).num_components);

    p.probability = 1;
    EXPECT_EQ(geom.candidates.size(), build_network(geom, p).junctions.size());
}

TEST(network, connectivity_error) {
    auto geom = testing::square_geometry(3, 3);

    connectivity_parameters p;
    p.rule = coupling_rule::random;
    p.probability = 0;
    p.require_full_connectivity = true;

    try {
        build_network(geom, p);
        FAIL() << "expected connectivity_error";
    }
    catch (connectivity_error& e) {
        EXPECT_EQ(0u, e.cell);
    }

    // A single cell needs no junctions.
    EXPECT_NO_THROW(build_network(testing::square_geometry(1, 1), p));
}

TEST(network, bad_parameters) {
    auto geom = testing::square_geometry(2, 2);

    connectivity_parameters p;
    p.probability = 1.5;
    EXPECT_THROW(build_network(geom, p), connectivity_error);

    p.probability = 1;
    p.permeability = -1;
    EXPECT_THROW(build_network(geom, p), connectivity_error);
}
