#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

#include <bes/besexcept.hpp>
#include <bes/region.hpp>

#include "util/pprintf.hpp"

namespace bes {

std::string to_string(const region& r) {
    switch (r.kind_) {
    case region::kind::all:
        return "(all)";
    case region::kind::boundary:
        return "(boundary)";
    case region::kind::interior:
        return "(interior)";
    case region::kind::cells:
        return util::pprintf("(cells {})", r.cells_.size());
    case region::kind::disc:
        return util::pprintf("(disc {} {} {})", r.centre_.x, r.centre_.y, r.radius_);
    }
    return "(unknown)";
}

std::vector<cell_index_type> thingify(const region& r, const tissue_geometry& geom, const tissue_network& net) {
    const auto n = (cell_index_type)geom.size();
    std::vector<cell_index_type> out;

    switch (r.type()) {
    case region::kind::all:
        for (cell_index_type i=0; i<n; ++i) out.push_back(i);
        break;
    case region::kind::boundary:
    case region::kind::interior: {
        bool want = r.type()==region::kind::boundary;
        for (cell_index_type i=0; i<n; ++i) {
            if ((bool)net.on_boundary[i]==want) out.push_back(i);
        }
        break;
    }
    case region::kind::cells:
        for (auto i: r.cell_list()) {
            if (i>=n) {
                throw bad_parameters(util::pprintf("region cell index {} out of range for tissue of {} cells", i, n));
            }
            out.push_back(i);
        }
        std::sort(out.begin(), out.end());
        out.erase(std::unique(out.begin(), out.end()), out.end());
        break;
    case region::kind::disc:
        for (auto& c: geom.cells) {
            if (std::hypot(c.centroid.x-r.centre().x, c.centroid.y-r.centre().y)<=r.radius()) {
                out.push_back(c.index);
            }
        }
        break;
    }
    return out;
}

} // namespace bes
