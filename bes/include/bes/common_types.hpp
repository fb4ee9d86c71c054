#pragma once

// Common definitions for index types and time values used
// throughout the tissue model.

#include <cstddef>
#include <cstdint>
#include <limits>
#include <random>
#include <type_traits>

namespace bes {

// Cells are identified by a contiguous index in [0, number of cells).
using cell_index_type = std::uint32_t;
using cell_size_type = std::make_unsigned_t<cell_index_type>;

// Sentinel marking the absence of a neighbouring cell, e.g. for membrane
// segments facing the extracellular environment.
constexpr cell_index_type no_cell = std::numeric_limits<cell_index_type>::max();

// Simulation time in seconds.
using time_type = double;

// Count of completed integration steps.
using step_type = std::uint64_t;

// Random engines for seeding lattice jitter and stochastic coupling rules.
using engine_type = std::mt19937_64;
using seed_type = std::remove_cv_t<decltype(engine_type::default_seed)>;

constexpr static auto default_seed = engine_type::default_seed;

// Planar position in metres.
struct point {
    double x = 0;
    double y = 0;
};

inline bool operator==(const point& a, const point& b) {
    return a.x==b.x && a.y==b.y;
}

inline bool operator!=(const point& a, const point& b) {
    return !(a==b);
}

} // namespace bes
