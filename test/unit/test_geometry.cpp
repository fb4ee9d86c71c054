#include <algorithm>
#include <cmath>
#include <vector>

#include <bes/besexcept.hpp>
#include <bes/geometry.hpp>

#include "common.hpp"
#include "common_tissues.hpp"

using namespace bes;

TEST(geometry, polygon_helpers) {
    std::vector<point> square = {{0, 0}, {2, 0}, {2, 2}, {0, 2}};
    EXPECT_DOUBLE_EQ(4., polygon_area(square));

    point c = polygon_centroid(square);
    EXPECT_DOUBLE_EQ(1., c.x);
    EXPECT_DOUBLE_EQ(1., c.y);

    // Clockwise orientation gives negative area.
    std::vector<point> cw(square.rbegin(), square.rend());
    EXPECT_DOUBLE_EQ(-4., polygon_area(cw));
}

TEST(geometry, square_lattice) {
    auto geom = build_geometry(testing::square_tissue(10, 10));

    ASSERT_EQ(100u, geom.size());
    EXPECT_EQ(0u, geom.relax_sweeps);
    EXPECT_DOUBLE_EQ(10e-6, geom.spacing);

    for (cell_index_type i=0; i<geom.size(); ++i) {
        const auto& c = geom.cells[i];
        EXPECT_EQ(i, c.index);
        EXPECT_NEAR(1e-10, c.polygon_area, 1e-20);
        EXPECT_NEAR(4e-5, c.perimeter, 1e-15);
        EXPECT_NEAR(1e-15, c.volume, 1e-25);
        EXPECT_NEAR(4e-5*10e-6 + 2e-10, c.membrane_area, 1e-20);
        EXPECT_EQ(c.vertices.size(), c.segments.size());
    }

    // 9 shared edges per row and per column.
    ASSERT_EQ(180u, geom.candidates.size());
    for (auto& n: geom.candidates) {
        EXPECT_LT(n.a, n.b);
        EXPECT_NEAR(10e-6, n.contact_length, 1e-15);
        EXPECT_NEAR(10e-6, n.distance, 1e-15);
    }
}

TEST(geometry, boundary_segments) {
    auto geom = build_geometry(testing::square_tissue(3, 3));
    ASSERT_EQ(9u, geom.size());

    auto n_boundary = [](const cell& c) {
        return std::count_if(c.segments.begin(), c.segments.end(),
            [](const membrane_segment& s) { return s.is_boundary(); });
    };

    // Cells numbered row by row from the lower left corner.
    EXPECT_EQ(2, n_boundary(geom.cells[0]));
    EXPECT_EQ(1, n_boundary(geom.cells[1]));
    EXPECT_EQ(0, n_boundary(geom.cells[4]));
}

TEST(geometry, hexagonal_relaxation) {
    geometry_parameters p;
    p.width = 80e-6;
    p.height = 60e-6;
    p.noise = 0.2;

    auto geom = build_geometry(p);
    ASSERT_GT(geom.size(), 10u);

    // The cells tile the rectangle exactly.
    double total = 0;
    for (auto& c: geom.cells) {
        EXPECT_GT(c.polygon_area, 0.);
        total += c.polygon_area;
    }
    EXPECT_TRUE(testing::near_relative(p.width*p.height, total, 1e-9));

    // Every candidate pair shares membrane of equal length from both sides.
    for (auto& n: geom.candidates) {
        double la = 0, lb = 0;
        for (auto& s: geom.cells[n.a].segments) if (s.neighbor==n.b) la += s.length;
        for (auto& s: geom.cells[n.b].segments) if (s.neighbor==n.a) lb += s.length;
        EXPECT_TRUE(testing::near_relative(la, lb, 1e-9));
        EXPECT_TRUE(testing::near_relative(0.5*(la + lb), n.contact_length, 1e-9));
    }
}

TEST(geometry, determinism) {
    geometry_parameters p;
    p.width = 60e-6;
    p.height = 60e-6;
    p.noise = 0.3;
    p.seed = 17;

    auto g1 = build_geometry(p);
    auto g2 = build_geometry(p);
    ASSERT_EQ(g1.size(), g2.size());
    for (std::size_t i=0; i<g1.size(); ++i) {
        EXPECT_EQ(g1.cells[i].centroid, g2.cells[i].centroid);
    }

    p.seed = 18;
    auto g3 = build_geometry(p);
    bool differ = g3.size()!=g1.size();
    for (std::size_t i=0; !differ && i<g1.size(); ++i) {
        differ = g1.cells[i].centroid!=g3.cells[i].centroid;
    }
    EXPECT_TRUE(differ);
}

TEST(geometry, circle_crop) {
    geometry_parameters p;
    p.width = 100e-6;
    p.height = 100e-6;
    p.crop = crop_shape::circle;

    auto geom = build_geometry(p);
    ASSERT_GT(geom.size(), 0u);

    const double r = 50e-6;
    for (auto& c: geom.cells) {
        for (auto& v: c.vertices) {
            double d = std::hypot(v.x - 50e-6, v.y - 50e-6);
            EXPECT_LE(d, r*(1 + 1e-9));
        }
    }
}

TEST(geometry, exclusion) {
    auto p = testing::square_tissue(10, 10);
    p.exclusions.push_back({{50e-6, 50e-6}, 11e-6});

    auto geom = build_geometry(p);
    ASSERT_EQ(96u, geom.size());

    for (cell_index_type i=0; i<geom.size(); ++i) {
        EXPECT_EQ(i, geom.cells[i].index);
        auto& c = geom.cells[i].centroid;
        EXPECT_GE(std::hypot(c.x - 50e-6, c.y - 50e-6), 11e-6);
    }

    // Cells facing the wound see it as environment.
    auto faces_wound = [&](const cell& c) {
        return std::any_of(c.segments.begin(), c.segments.end(), [](const membrane_segment& s) {
            double mx = 0.5*(s.a.x + s.b.x);
            double my = 0.5*(s.a.y + s.b.y);
            return s.is_boundary() && std::hypot(mx - 50e-6, my - 50e-6)<15e-6;
        });
    };
    EXPECT_EQ(8, std::count_if(geom.cells.begin(), geom.cells.end(), faces_wound));

    // 180 shared edges less the 4 inside the wound and the 8 around it.
    EXPECT_EQ(168u, geom.candidates.size());
}

TEST(geometry, errors) {
    // No room for a cell.
    auto p = testing::square_tissue(1, 1);
    p.width = 1e-6;
    p.height = 1e-6;
    EXPECT_THROW(build_geometry(p), geometry_error);

    p = testing::square_tissue(2, 2);
    p.cell_radius = 0;
    EXPECT_THROW(build_geometry(p), geometry_error);

    p = testing::square_tissue(2, 2);
    p.noise = 0.6;
    EXPECT_THROW(build_geometry(p), geometry_error);

    p = testing::square_tissue(2, 2);
    p.exclusions.push_back({{10e-6, 10e-6}, 1.0});
    EXPECT_THROW(build_geometry(p), geometry_error);

    // Relaxation that cannot meet its tolerance in one sweep.
    geometry_parameters q;
    q.width = 60e-6;
    q.height = 60e-6;
    q.noise = 0.3;
    q.relax_iterations = 1;
    q.relax_tolerance = 1e-9;
    EXPECT_THROW(build_geometry(q), geometry_error);
}
