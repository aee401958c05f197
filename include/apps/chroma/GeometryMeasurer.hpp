#pragma once
#include <cstdint>
#include <vector>
#include "msg/Region.hpp"
#include "msg/AnalysisReport.hpp"

namespace chroma {

struct RegionGeometry {
    uint64_t area = 0;
    uint64_t perimeter = 0;
};

// ---------------------------------------------------------------------------
// GeometryMeasurer
//
// area      = member count
// perimeter = sum over members of 4-neighbours that are not members
//             (cells outside the grid count as non-members)
//
// Under 4-connectivity a lone cell has perimeter 4 and every shared edge
// removes 2, so the perimeter is always even. Holes add their inner edges.
// ---------------------------------------------------------------------------
class GeometryMeasurer {
public:
    // One region on its own (mask over its bounding box).
    RegionGeometry measure(const msg::Region& region) const;

    // Every region of one label map in a single sweep of the grid.
    // `labels` holds region index + 1 per cell, 0 for unlabeled cells
    // (RegionLabeler::labelMap). Result k belongs to region index k.
    // Empty when `labels` does not hold width * height cells.
    std::vector<RegionGeometry> measure(const std::vector<uint32_t>& labels, uint32_t width,
                                        uint32_t height, uint32_t region_count) const;

    // Fills area, perimeter, bounding box, centroid, orientation, elongation.
    void describe(msg::Region& region) const;

    // Same, with area and perimeter already measured.
    void describe(msg::Region& region, const RegionGeometry& geometry) const;

    // Per-category sums; regions of different categories never combine.
    static void aggregate(const std::vector<msg::Region>& regions, msg::AnalysisReport& report);
    static void aggregate(msg::Category category, const std::vector<RegionGeometry>& geometry,
                          msg::AnalysisReport& report);
};

} // namespace chroma
