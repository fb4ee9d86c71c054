#pragma once

#include <cstddef>
#include <vector>

#include <bes/common_types.hpp>
#include <bes/geometry.hpp>

// Gap-junction coupling graph and environmental boundary of a tissue.

namespace bes {

enum class coupling_rule {
    full,             // every neighbour candidate is coupled
    random,           // each candidate coupled with probability p
    exclude_boundary  // candidates touching the environment are not coupled
};

struct connectivity_parameters {
    coupling_rule rule = coupling_rule::full;
    double probability = 1.0;
    seed_type seed = default_seed;

    // Base junction permeability: the fraction of free diffusion that a
    // fully open junction passes.
    double permeability = 1e-3;

    // Fail if any cell is left without a gap junction.
    bool require_full_connectivity = false;
};

// Gap junction between cells a < b.
struct gap_junction {
    cell_index_type a = 0;
    cell_index_type b = 0;
    double contact_length = 0;  // [m]
    double distance = 0;        // centroid separation [m]
    double permeability = 0;    // base permeability [dimensionless]
};

// Membrane segment exposed to the extracellular environment.
struct boundary_segment {
    cell_index_type cell = 0;
    std::size_t segment = 0;    // index into cell::segments
    double length = 0;
};

struct tissue_network {
    std::size_t num_cells = 0;

    // Junction edge list sorted by (a, b); pairs are unique.
    std::vector<gap_junction> junctions;

    // Indices into `junctions` of the junctions touching each cell.
    std::vector<std::vector<std::size_t>> adjacency;

    std::vector<boundary_segment> boundary;

    // Non-zero for cells with at least one environmental boundary segment.
    std::vector<char> on_boundary;

    // Number of connected components of the coupling graph.
    unsigned num_components = 0;

    const std::vector<std::size_t>& junctions_of(cell_index_type c) const {
        return adjacency[c];
    }
};

// Deterministic for a given geometry and parameter set (including seed).
// Throws connectivity_error if a cell ends up uncoupled when full
// connectivity is required.
tissue_network build_network(const tissue_geometry& geom, const connectivity_parameters& params);

} // namespace bes
