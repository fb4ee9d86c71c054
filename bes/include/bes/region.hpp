#pragma once

#include <string>
#include <vector>

#include <bes/common_types.hpp>
#include <bes/geometry.hpp>
#include <bes/network.hpp>

// Named subsets of the tissue for attaching channels, initial condition
// patches, stimuli and interventions.

namespace bes {

class region {
public:
    enum class kind {
        all,        // every cell
        cells,      // an explicit list of cell indices
        disc,       // cells whose centroid lies in a disc
        boundary,   // cells exposed to the extracellular environment
        interior    // cells not exposed to the environment
    };

    region(): kind_(kind::all) {}

    static region all() { return region(kind::all); }
    static region boundary() { return region(kind::boundary); }
    static region interior() { return region(kind::interior); }

    static region cells(std::vector<cell_index_type> ids) {
        region r(kind::cells);
        r.cells_ = std::move(ids);
        return r;
    }

    static region disc(point centre, double radius) {
        region r(kind::disc);
        r.centre_ = centre;
        r.radius_ = radius;
        return r;
    }

    kind type() const { return kind_; }
    const std::vector<cell_index_type>& cell_list() const { return cells_; }
    point centre() const { return centre_; }
    double radius() const { return radius_; }

    friend std::string to_string(const region&);

private:
    explicit region(kind k): kind_(k) {}

    kind kind_;
    std::vector<cell_index_type> cells_;
    point centre_;
    double radius_ = 0;
};

// Resolve a region to a sorted list of unique cell indices. Throws
// bad_parameters if an explicit cell index is out of range.
std::vector<cell_index_type> thingify(const region& r, const tissue_geometry& geom, const tissue_network& net);

} // namespace bes
