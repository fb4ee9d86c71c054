#pragma once

// Small tissues shared by the geometry, network and simulation tests.

#include <bes/geometry.hpp>
#include <bes/ion.hpp>
#include <bes/network.hpp>
#include <bes/tissue_parameters.hpp>

namespace testing {

// Square lattice without jitter: nx by ny cells of side 2*radius, exact
// Voronoi squares that need no relaxation.
inline bes::geometry_parameters square_tissue(int nx, int ny, double radius = 5e-6) {
    bes::geometry_parameters p;
    p.width = nx*2*radius;
    p.height = ny*2*radius;
    p.cell_radius = radius;
    p.lattice = bes::lattice_kind::square;
    p.noise = 0;
    return p;
}

inline bes::tissue_geometry square_geometry(int nx, int ny) {
    return bes::build_geometry(square_tissue(nx, ny));
}

// Membrane without channels: an ion set with a neutral tracer added.
inline bes::tissue_parameters passive_tissue() {
    bes::tissue_parameters p;
    p.species.push_back({"tracer", 0, 1e-9, 1.0, 1.0});
    return p;
}

} // namespace testing
