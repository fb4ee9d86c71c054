#include <algorithm>
#include <cmath>
#include <map>
#include <random>
#include <utility>
#include <vector>

#include <bes/besexcept.hpp>
#include <bes/common_types.hpp>
#include <bes/geometry.hpp>

#include "util/pprintf.hpp"

namespace bes {

using util::pprintf;

namespace {

constexpr double pi = 3.14159265358979323846;

// Number of vertices approximating a circular crop boundary.
constexpr unsigned circle_resolution = 96;

// Polygon whose vertex i carries the tag of edge i -> i+1: the index of the
// seed on the other side of the edge, or no_cell for the region boundary.
struct tagged_polygon {
    std::vector<point> v;
    std::vector<cell_index_type> tag;

    std::size_t size() const { return v.size(); }
    bool empty() const { return v.empty(); }
};

double dist(point a, point b) {
    return std::hypot(a.x-b.x, a.y-b.y);
}

void validate(const geometry_parameters& p) {
    auto positive = [](double x) { return std::isfinite(x) && x>0; };

    if (!positive(p.width) || !positive(p.height)) {
        throw geometry_error(pprintf("bounding region {} x {} must have positive extent", p.width, p.height));
    }
    if (!positive(p.cell_radius)) {
        throw geometry_error(pprintf("cell radius {} must be positive", p.cell_radius));
    }
    if (!(p.noise>=0 && p.noise<0.5)) {
        throw geometry_error(pprintf("lattice noise {} must lie in [0, 0.5)", p.noise));
    }
    if (!positive(p.cell_height)) {
        throw geometry_error(pprintf("cell height {} must be positive", p.cell_height));
    }
    if (!positive(p.relax_tolerance)) {
        throw geometry_error(pprintf("relaxation tolerance {} must be positive", p.relax_tolerance));
    }
    if (!(p.min_contact>=0)) {
        throw geometry_error(pprintf("minimum contact length {} must be non-negative", p.min_contact));
    }
    for (auto& d: p.exclusions) {
        if (!(d.radius>=0)) {
            throw geometry_error(pprintf("exclusion radius {} must be non-negative", d.radius));
        }
    }
}

// Counter-clockwise boundary of the cropped region.
std::vector<point> region_boundary(const geometry_parameters& p) {
    if (p.crop==crop_shape::rectangle) {
        return {{0, 0}, {p.width, 0}, {p.width, p.height}, {0, p.height}};
    }

    std::vector<point> poly;
    point c{p.width/2, p.height/2};
    double r = std::min(p.width, p.height)/2;
    for (unsigned i=0; i<circle_resolution; ++i) {
        double theta = 2*pi*i/circle_resolution;
        poly.push_back({c.x + r*std::cos(theta), c.y + r*std::sin(theta)});
    }
    return poly;
}

// Strict containment in a convex counter-clockwise polygon.
bool contains(const std::vector<point>& poly, point x, double eps) {
    auto n = poly.size();
    for (std::size_t i=0; i<n; ++i) {
        point a = poly[i];
        point b = poly[(i+1)%n];
        double cross = (b.x-a.x)*(x.y-a.y) - (b.y-a.y)*(x.x-a.x);
        if (cross <= eps*dist(a, b)) return false;
    }
    return true;
}

std::vector<point> lattice_seeds(const geometry_parameters& p, double s) {
    std::vector<point> seeds;

    if (p.lattice==lattice_kind::square) {
        auto nx = (long)std::floor(p.width/s);
        auto ny = (long)std::floor(p.height/s);
        double ox = (p.width - nx*s)/2 + s/2;
        double oy = (p.height - ny*s)/2 + s/2;
        for (long j=0; j<ny; ++j) {
            for (long i=0; i<nx; ++i) {
                seeds.push_back({ox + i*s, oy + j*s});
            }
        }
    }
    else {
        double dy = s*std::sqrt(3.)/2;
        if (p.height<s || p.width<s) return seeds;

        auto ny = (long)std::floor((p.height - s)/dy) + 1;
        auto nx = (long)std::floor(p.width/s);
        double ox = (p.width - (nx-1)*s)/2;
        double oy = (p.height - (ny-1)*dy)/2;
        for (long j=0; j<ny; ++j) {
            // Odd rows sit half a spacing to the right, one seed shorter.
            bool odd = j%2;
            long row = odd? nx-1: nx;
            for (long i=0; i<row; ++i) {
                seeds.push_back({ox + (odd? s/2: 0) + i*s, oy + j*dy});
            }
        }
    }
    return seeds;
}

// Keep the part of the polygon closer to seed si than to seed sj. The new
// edge along the bisector is tagged j.
void clip(tagged_polygon& poly, point si, point sj, cell_index_type j, double eps) {
    auto n = poly.size();
    if (!n) return;

    point dir{sj.x-si.x, sj.y-si.y};
    double len = std::hypot(dir.x, dir.y);
    if (len==0) return;
    point mid{(si.x+sj.x)/2, (si.y+sj.y)/2};

    std::vector<double> d(n);
    bool any_out = false, any_in = false;
    for (std::size_t k=0; k<n; ++k) {
        d[k] = ((poly.v[k].x-mid.x)*dir.x + (poly.v[k].y-mid.y)*dir.y)/len;
        (d[k]<=eps? any_in: any_out) = true;
    }
    if (!any_out) return;
    if (!any_in) {
        poly = {};
        return;
    }

    auto cut = [&](std::size_t a, std::size_t b) {
        double t = d[a]/(d[a]-d[b]);
        const point& p = poly.v[a];
        const point& q = poly.v[b];
        return point{p.x + t*(q.x-p.x), p.y + t*(q.y-p.y)};
    };

    tagged_polygon out;
    out.v.reserve(n+1);
    out.tag.reserve(n+1);
    for (std::size_t k=0; k<n; ++k) {
        auto k1 = (k+1)%n;
        bool pin = d[k]<=eps;
        bool qin = d[k1]<=eps;
        if (pin) {
            out.v.push_back(poly.v[k]);
            out.tag.push_back(poly.tag[k]);
            if (!qin) {
                out.v.push_back(cut(k, k1));
                out.tag.push_back(j);
            }
        }
        else if (qin) {
            out.v.push_back(cut(k, k1));
            out.tag.push_back(poly.tag[k]);
        }
    }
    poly = std::move(out);
}

// Drop vertices whose outgoing edge has collapsed to (numerically) zero length.
void remove_degenerate_edges(tagged_polygon& poly, double eps) {
    auto n = poly.size();
    if (n<2) return;

    tagged_polygon out;
    for (std::size_t k=0; k<n; ++k) {
        if (dist(poly.v[k], poly.v[(k+1)%n])>eps) {
            out.v.push_back(poly.v[k]);
            out.tag.push_back(poly.tag[k]);
        }
    }
    poly = std::move(out);
}

// Voronoi tessellation of the seeds restricted to the region polygon.
// Seeds are binned on a grid with bin width `s`; for each seed, bins are
// visited in rings of increasing Chebyshev distance until no further seed
// can be close enough to cut the current polygon.
std::vector<tagged_polygon> tessellate(const std::vector<point>& seeds, const std::vector<point>& region, double width, double height, double s) {
    double eps = 1e-9*s;
    auto nbx = std::max(1l, (long)std::ceil(width/s));
    auto nby = std::max(1l, (long)std::ceil(height/s));

    auto bin_of = [&](point p) {
        auto bx = std::clamp((long)std::floor(p.x/s), 0l, nbx-1);
        auto by = std::clamp((long)std::floor(p.y/s), 0l, nby-1);
        return std::make_pair(bx, by);
    };

    std::vector<std::vector<cell_index_type>> bins(nbx*nby);
    for (cell_index_type i=0; i<seeds.size(); ++i) {
        auto b = bin_of(seeds[i]);
        bins[b.second*nbx + b.first].push_back(i);
    }

    std::vector<tagged_polygon> cells(seeds.size());
    for (cell_index_type i=0; i<seeds.size(); ++i) {
        tagged_polygon poly;
        poly.v = region;
        poly.tag.assign(region.size(), no_cell);

        const point si = seeds[i];
        auto home = bin_of(si);
        long max_ring = std::max(nbx, nby);

        for (long ring=0; ring<=max_ring && !poly.empty(); ++ring) {
            double reach = 0;
            for (auto& v: poly.v) reach = std::max(reach, dist(v, si));
            if ((ring-1)*s > 2*reach) break;

            for (long by=home.second-ring; by<=home.second+ring; ++by) {
                if (by<0 || by>=nby) continue;
                for (long bx=home.first-ring; bx<=home.first+ring; ++bx) {
                    if (bx<0 || bx>=nbx) continue;
                    if (std::max(std::abs(bx-home.first), std::abs(by-home.second))!=ring) continue;

                    for (auto j: bins[by*nbx + bx]) {
                        if (j!=i) clip(poly, si, seeds[j], j, eps);
                    }
                }
            }
        }
        remove_degenerate_edges(poly, eps);
        cells[i] = std::move(poly);
    }
    return cells;
}

} // anonymous namespace

double polygon_area(const std::vector<point>& poly) {
    double a = 0;
    auto n = poly.size();
    for (std::size_t i=0; i<n; ++i) {
        const point& p = poly[i];
        const point& q = poly[(i+1)%n];
        a += p.x*q.y - q.x*p.y;
    }
    return a/2;
}

point polygon_centroid(const std::vector<point>& poly) {
    double a = 0, cx = 0, cy = 0;
    auto n = poly.size();
    for (std::size_t i=0; i<n; ++i) {
        const point& p = poly[i];
        const point& q = poly[(i+1)%n];
        double w = p.x*q.y - q.x*p.y;
        a += w;
        cx += (p.x + q.x)*w;
        cy += (p.y + q.y)*w;
    }
    if (a==0) return poly.empty()? point{}: poly.front();
    return {cx/(3*a), cy/(3*a)};
}

tissue_geometry build_geometry(const geometry_parameters& params) {
    validate(params);

    tissue_geometry geom;
    geom.parameters = params;
    const double s = 2*params.cell_radius;
    geom.spacing = s;

    const auto region = region_boundary(params);
    const double eps = 1e-9*s;

    // Seed points: lattice, jitter, crop.

    std::vector<point> seeds;
    {
        engine_type rng(params.seed);
        std::uniform_real_distribution<double> jitter(-params.noise*s, params.noise*s);

        for (auto p: lattice_seeds(params, s)) {
            if (params.noise>0) {
                p.x += jitter(rng);
                p.y += jitter(rng);
            }
            if (contains(region, p, eps)) seeds.push_back(p);
        }
    }
    if (seeds.empty()) {
        throw geometry_error(pprintf("no cells of radius {} fit in the {} x {} region", params.cell_radius, params.width, params.height));
    }

    // Tessellate and relax.

    auto polys = tessellate(seeds, region, params.width, params.height, s);
    if (params.relax_iterations>0) {
        for (;;) {
            double max_shift = 0;
            std::vector<point> centroids(seeds.size());
            for (std::size_t i=0; i<seeds.size(); ++i) {
                if (polys[i].size()<3) {
                    throw geometry_error(pprintf("cell seed {} has an empty Voronoi region", i));
                }
                centroids[i] = polygon_centroid(polys[i].v);
                max_shift = std::max(max_shift, dist(centroids[i], seeds[i]));
            }

            if (max_shift<=params.relax_tolerance*s) break;
            if (geom.relax_sweeps==params.relax_iterations) {
                throw geometry_error(pprintf(
                    "centroidal relaxation did not converge after {} iterations (largest displacement {} m, tolerance {} m)",
                    params.relax_iterations, max_shift, params.relax_tolerance*s));
            }

            seeds = std::move(centroids);
            polys = tessellate(seeds, region, params.width, params.height, s);
            ++geom.relax_sweeps;
        }
    }

    // Remove excluded cells and renumber.

    std::vector<cell_index_type> new_index(seeds.size(), no_cell);
    cell_index_type n_kept = 0;
    for (std::size_t i=0; i<seeds.size(); ++i) {
        if (polys[i].size()<3) {
            throw geometry_error(pprintf("cell seed {} has an empty Voronoi region", i));
        }
        point c = polygon_centroid(polys[i].v);
        bool excluded = std::any_of(params.exclusions.begin(), params.exclusions.end(),
            [c](const exclusion_disc& d) { return dist(c, d.centre)<d.radius; });
        if (!excluded) new_index[i] = n_kept++;
    }
    if (!n_kept) {
        throw geometry_error("every cell lies within an exclusion region");
    }

    // Assemble cells.

    geom.cells.reserve(n_kept);
    for (std::size_t i=0; i<seeds.size(); ++i) {
        if (new_index[i]==no_cell) continue;

        const auto& poly = polys[i];
        cell c;
        c.index = new_index[i];
        c.vertices = poly.v;
        c.centroid = polygon_centroid(poly.v);
        c.polygon_area = polygon_area(poly.v);
        if (!(c.polygon_area>0)) {
            throw geometry_error(pprintf("cell {} has a degenerate membrane polygon", c.index));
        }

        auto n = poly.size();
        for (std::size_t k=0; k<n; ++k) {
            membrane_segment seg;
            seg.a = poly.v[k];
            seg.b = poly.v[(k+1)%n];
            seg.length = dist(seg.a, seg.b);
            seg.neighbor = poly.tag[k]==no_cell? no_cell: new_index[poly.tag[k]];
            c.perimeter += seg.length;
            c.segments.push_back(seg);
        }

        c.volume = c.polygon_area*params.cell_height;
        c.membrane_area = c.perimeter*params.cell_height + 2*c.polygon_area;
        geom.cells.push_back(std::move(c));
    }

    // Neighbour candidates: shared membrane length averaged over both sides.

    std::map<std::pair<cell_index_type, cell_index_type>, double> contact;
    for (auto& c: geom.cells) {
        for (auto& seg: c.segments) {
            if (seg.is_boundary()) continue;
            auto key = std::minmax(c.index, seg.neighbor);
            contact[{key.first, key.second}] += seg.length/2;
        }
    }

    double threshold = std::max(params.min_contact, eps);
    for (auto& kv: contact) {
        if (kv.second<=threshold) continue;
        auto a = kv.first.first;
        auto b = kv.first.second;
        geom.candidates.push_back({a, b, kv.second, dist(geom.cells[a].centroid, geom.cells[b].centroid)});
    }

    return geom;
}

} // namespace bes
