#pragma once

#include <cstddef>
#include <vector>

#include <bes/common_types.hpp>

// Construction of a planar cell cluster by Voronoi tessellation of a
// jittered lattice of seed points, followed by centroidal relaxation.

namespace bes {

enum class crop_shape {
    rectangle,  // the full bounding box
    circle      // circle inscribed in the bounding box
};

enum class lattice_kind {
    square,
    hexagonal
};

// Disc of removed tissue, used to model cuts and wound sites.
struct exclusion_disc {
    point centre;
    double radius = 0;
};

struct geometry_parameters {
    // Bounding region [0, width] x [0, height] in metres.
    double width = 100e-6;
    double height = 100e-6;
    crop_shape crop = crop_shape::rectangle;

    // Target cell radius: seed lattice spacing is twice this value.
    double cell_radius = 5e-6;
    lattice_kind lattice = lattice_kind::hexagonal;

    // Seed jitter amplitude as a fraction of the lattice spacing, in [0, 0.5).
    double noise = 0.1;
    seed_type seed = default_seed;

    std::vector<exclusion_disc> exclusions;

    // Lloyd relaxation: at most relax_iterations sweeps; converged when the
    // largest seed displacement is below relax_tolerance*spacing.
    // relax_iterations==0 disables relaxation.
    unsigned relax_iterations = 200;
    double relax_tolerance = 1e-2;

    // Cell height [m], used for volumes and membrane areas.
    double cell_height = 10e-6;

    // Minimum shared membrane length [m] for two cells to be coupling
    // candidates.
    double min_contact = 0.0;
};

// A straight piece of cell membrane, shared with a neighbouring cell or
// exposed to the extracellular environment (neighbor==no_cell).
struct membrane_segment {
    point a;
    point b;
    double length = 0;
    cell_index_type neighbor = no_cell;

    bool is_boundary() const { return neighbor==no_cell; }
};

struct cell {
    cell_index_type index = 0;
    point centroid;
    std::vector<point> vertices;           // counter-clockwise polygon
    std::vector<membrane_segment> segments; // segments[i] runs vertices[i] -> vertices[i+1]

    double polygon_area = 0;   // [m^2]
    double perimeter = 0;      // [m]
    double membrane_area = 0;  // [m^2] lateral plus apical and basal faces
    double volume = 0;         // [m^3]
};

// Pair of cells sharing membrane, a < b.
struct neighbor_candidate {
    cell_index_type a = 0;
    cell_index_type b = 0;
    double contact_length = 0;  // shared membrane length [m]
    double distance = 0;        // centroid separation [m]
};

struct tissue_geometry {
    geometry_parameters parameters;
    double spacing = 0;

    std::vector<cell> cells;
    std::vector<neighbor_candidate> candidates;

    // Number of relaxation sweeps performed.
    unsigned relax_sweeps = 0;

    std::size_t size() const { return cells.size(); }
};

// Throws geometry_error if the parameters are unsatisfiable: invalid
// sizes, no surviving cells, degenerate polygons, or relaxation that does
// not converge within the iteration bound.
tissue_geometry build_geometry(const geometry_parameters& params);

// Polygon helpers.
double polygon_area(const std::vector<point>& poly);
point polygon_centroid(const std::vector<point>& poly);

} // namespace bes
