#include "apps/chroma/GeometryMeasurer.hpp"
#include <Eigen/Core>
#include <Eigen/Eigenvalues>
#include <algorithm>
#include <cmath>

using EVec2 = Eigen::Vector2d;
using EMat2 = Eigen::Matrix2d;

namespace {

struct Box {
    uint32_t u_min, u_max, v_min, v_max;
};

Box boundingBox(const std::vector<msg::PixelCoord>& members) {
    Box b{members[0].u, members[0].u, members[0].v, members[0].v};
    for (const auto& p : members) {
        b.u_min = std::min(b.u_min, p.u);
        b.u_max = std::max(b.u_max, p.u);
        b.v_min = std::min(b.v_min, p.v);
        b.v_max = std::max(b.v_max, p.v);
    }
    return b;
}

// Exposed-edge count over a membership mask of the bounding box with a
// one-cell empty border, so no neighbour lookup needs a bounds check.
uint64_t exposedEdges(const std::vector<msg::PixelCoord>& members, const Box& b) {
    const std::size_t mw = static_cast<std::size_t>(b.u_max - b.u_min) + 3;
    const std::size_t mh = static_cast<std::size_t>(b.v_max - b.v_min) + 3;
    std::vector<uint8_t> mask(mw * mh, 0);

    auto at = [&](const msg::PixelCoord& p) {
        return (static_cast<std::size_t>(p.v - b.v_min) + 1) * mw +
               (static_cast<std::size_t>(p.u - b.u_min) + 1);
    };

    for (const auto& p : members) {
        mask[at(p)] = 1;
    }

    uint64_t edges = 0;
    for (const auto& p : members) {
        const std::size_t i = at(p);
        edges += (mask[i - mw] == 0) + (mask[i + mw] == 0) +
                 (mask[i - 1]  == 0) + (mask[i + 1]  == 0);
    }
    return edges;
}

} // anonymous namespace

namespace chroma {

RegionGeometry GeometryMeasurer::measure(const msg::Region& region) const {
    RegionGeometry g;
    if (region.members.empty()) return g;

    g.area = region.members.size();
    g.perimeter = exposedEdges(region.members, boundingBox(region.members));
    return g;
}

std::vector<RegionGeometry> GeometryMeasurer::measure(const std::vector<uint32_t>& labels, uint32_t width,
                                                     uint32_t height, uint32_t region_count) const {
    if (labels.size() != static_cast<std::size_t>(width) * height) return {};
    std::vector<RegionGeometry> out(region_count);

    // Each labeled cell adds one edge per 4-neighbour carrying another label
    // (0 included) or lying outside the grid.
    for (uint32_t v = 0; v < height; ++v) {
        const uint32_t* row = labels.data() + static_cast<std::size_t>(v) * width;
        const uint32_t* up   = (v > 0) ? row - width : nullptr;
        const uint32_t* down = (v + 1 < height) ? row + width : nullptr;

        for (uint32_t u = 0; u < width; ++u) {
            const uint32_t id = row[u];
            if (id == 0 || id > region_count) continue;

            RegionGeometry& g = out[id - 1];
            g.area += 1;
            g.perimeter += (u == 0 || row[u - 1] != id) +
                           (u + 1 == width || row[u + 1] != id) +
                           (!up || up[u] != id) +
                           (!down || down[u] != id);
        }
    }
    return out;
}

void GeometryMeasurer::describe(msg::Region& region) const {
    describe(region, measure(region));
}

void GeometryMeasurer::describe(msg::Region& region, const RegionGeometry& g) const {
    region.area = g.area;
    region.perimeter = g.perimeter;

    if (region.members.empty()) return;
    const double n = static_cast<double>(region.members.size());

    const Box b = boundingBox(region.members);
    region.u_min = b.u_min;
    region.u_max = b.u_max;
    region.v_min = b.v_min;
    region.v_max = b.v_max;

    // First and second order moments
    EVec2 mean = EVec2::Zero();
    for (const auto& p : region.members) {
        mean += EVec2(static_cast<double>(p.u), static_cast<double>(p.v));
    }
    mean /= n;

    EMat2 cov = EMat2::Zero();
    for (const auto& p : region.members) {
        const EVec2 d = EVec2(static_cast<double>(p.u), static_cast<double>(p.v)) - mean;
        cov += d * d.transpose();
    }
    cov /= n;

    region.u_cx = static_cast<float>(mean.x());
    region.v_cx = static_cast<float>(mean.y());

    Eigen::SelfAdjointEigenSolver<EMat2> es(cov);
    const EVec2 lambda = es.eigenvalues();        // ascending
    const double major = lambda(1);
    const double minor = std::max(0.0, lambda(0));

    if (es.info() != Eigen::Success || major <= 1e-12) {
        region.orientation_rad = 0.0f;
        region.elongation = 1.0f;
        return;
    }

    const EVec2 axis = es.eigenvectors().col(1);
    double theta = std::atan2(axis.y(), axis.x());
    if (theta < 0.0) theta += M_PI;
    if (theta >= M_PI) theta -= M_PI;

    region.orientation_rad = static_cast<float>(theta);
    region.elongation = static_cast<float>(std::sqrt(minor / major));
}

void GeometryMeasurer::aggregate(msg::Category category, const std::vector<RegionGeometry>& geometry,
                                 msg::AnalysisReport& report) {
    if (category == msg::Category::NONE) return;
    msg::CategoryTotals& t = report.of(category);
    for (const auto& g : geometry) {
        t.area += g.area;
        t.perimeter += g.perimeter;
    }
    t.region_count += static_cast<uint32_t>(geometry.size());
}

void GeometryMeasurer::aggregate(const std::vector<msg::Region>& regions, msg::AnalysisReport& report) {
    for (const auto& r : regions) {
        if (r.category == msg::Category::NONE) continue;
        msg::CategoryTotals& t = report.of(r.category);
        t.area += r.area;
        t.perimeter += r.perimeter;
        t.region_count += 1;
    }
}

} // namespace chroma
