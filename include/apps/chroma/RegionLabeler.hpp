#pragma once
#include <cstdint>
#include <vector>
#include "msg/ClassifiedGrid.hpp"
#include "msg/Region.hpp"
#include "apps/chroma/CancelToken.hpp"

namespace chroma {

// ---------------------------------------------------------------------------
// RegionLabeler: two-pass union-find connected-component labeling.
//
// Connectivity is fixed at 4 (edge-sharing neighbours only). Diagonal
// contact never merges two cells; the exposed-edge perimeter relies on it.
//
// Pass 1 scans row-major from (0,0), gives each cell a provisional label
// and unites it with its up/left neighbour of the same category. The
// smaller label always becomes the root.
// Pass 2 resolves roots and renumbers them by first appearance in the same
// scan, so regions come out in a reproducible order with their members
// sorted row-major.
// ---------------------------------------------------------------------------
class RegionLabeler {
public:
    // Replaces `out` with every region of `category`. NONE yields no regions.
    // Returns false only when `cancel` fired (checked before each pass);
    // `out` is then left untouched.
    bool label(const msg::ClassifiedGrid& grid, msg::Category category,
               std::vector<msg::Region>& out, const CancelToken* cancel = nullptr) const;

    // Per-cell region index + 1 for `category` cells, 0 elsewhere.
    // Same numbering as label().
    bool labelMap(const msg::ClassifiedGrid& grid, msg::Category category,
                  std::vector<uint32_t>& labels, uint32_t& region_count,
                  const CancelToken* cancel = nullptr) const;

    // Region lists from a labelMap() result, members in row-major order.
    static void buildRegions(const std::vector<uint32_t>& labels, uint32_t width, uint32_t height,
                             msg::Category category, uint32_t region_count,
                             std::vector<msg::Region>& out);

private:
    static constexpr uint32_t NO_LABEL = 0;

    static uint32_t findRoot(std::vector<uint32_t>& parent, uint32_t x);
    static void unite(std::vector<uint32_t>& parent, uint32_t a, uint32_t b);
};

} // namespace chroma
