#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>
#include <vector>

#include <bes/besexcept.hpp>
#include <bes/network.hpp>

#include "util/pprintf.hpp"

namespace bes {

using util::pprintf;

namespace {

// Union-find over cell indices for component counting.
struct disjoint_sets {
    std::vector<cell_index_type> parent;

    explicit disjoint_sets(std::size_t n): parent(n) {
        std::iota(parent.begin(), parent.end(), 0);
    }

    cell_index_type find(cell_index_type i) {
        while (parent[i]!=i) {
            parent[i] = parent[parent[i]];
            i = parent[i];
        }
        return i;
    }

    void merge(cell_index_type a, cell_index_type b) {
        a = find(a);
        b = find(b);
        if (a!=b) parent[std::max(a, b)] = std::min(a, b);
    }
};

} // anonymous namespace

tissue_network build_network(const tissue_geometry& geom, const connectivity_parameters& params) {
    if (!(params.probability>=0 && params.probability<=1)) {
        throw connectivity_error(pprintf("coupling probability {} must lie in [0, 1]", params.probability));
    }
    if (!(params.permeability>=0) || !std::isfinite(params.permeability)) {
        throw connectivity_error(pprintf("junction permeability {} must be non-negative", params.permeability));
    }

    const auto n = geom.size();

    tissue_network net;
    net.num_cells = n;
    net.adjacency.resize(n);
    net.on_boundary.assign(n, 0);

    for (auto& c: geom.cells) {
        for (std::size_t k=0; k<c.segments.size(); ++k) {
            if (c.segments[k].is_boundary()) {
                net.boundary.push_back({c.index, k, c.segments[k].length});
                net.on_boundary[c.index] = 1;
            }
        }
    }

    engine_type rng(params.seed);
    std::bernoulli_distribution coin(params.probability);

    // Candidates arrive sorted by (a, b), so the junction list is too.
    for (auto& cand: geom.candidates) {
        bool keep = true;
        switch (params.rule) {
        case coupling_rule::full:
            break;
        case coupling_rule::random:
            // One draw per candidate, in candidate order.
            keep = coin(rng);
            break;
        case coupling_rule::exclude_boundary:
            keep = !net.on_boundary[cand.a] && !net.on_boundary[cand.b];
            break;
        }
        if (!keep) continue;

        net.adjacency[cand.a].push_back(net.junctions.size());
        net.adjacency[cand.b].push_back(net.junctions.size());
        net.junctions.push_back({cand.a, cand.b, cand.contact_length, cand.distance, params.permeability});
    }

    disjoint_sets sets(n);
    for (auto& j: net.junctions) sets.merge(j.a, j.b);
    for (cell_index_type i=0; i<n; ++i) {
        if (sets.find(i)==i) ++net.num_components;
    }

    if (params.require_full_connectivity && n>1) {
        for (cell_index_type i=0; i<n; ++i) {
            if (net.adjacency[i].empty()) {
                throw connectivity_error(i, "cell has no gap junctions but full connectivity is required");
            }
        }
    }

    return net;
}

} // namespace bes
