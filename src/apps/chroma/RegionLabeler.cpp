#include "apps/chroma/RegionLabeler.hpp"
#include <utility>

namespace chroma {

uint32_t RegionLabeler::findRoot(std::vector<uint32_t>& parent, uint32_t x) {
    uint32_t root = x;
    while (parent[root] != root) {
        root = parent[root];
    }
    // Path compression
    while (parent[x] != root) {
        const uint32_t next = parent[x];
        parent[x] = root;
        x = next;
    }
    return root;
}

void RegionLabeler::unite(std::vector<uint32_t>& parent, uint32_t a, uint32_t b) {
    a = findRoot(parent, a);
    b = findRoot(parent, b);
    if (a == b) return;
    // Smaller provisional label wins: the root is independent of merge order.
    if (a < b) parent[b] = a;
    else       parent[a] = b;
}

bool RegionLabeler::labelMap(const msg::ClassifiedGrid& grid, msg::Category category,
                             std::vector<uint32_t>& labels, uint32_t& region_count,
                             const CancelToken* cancel) const {
    const uint32_t w = grid.width;
    const uint32_t h = grid.height;

    std::vector<uint32_t> tmp(static_cast<std::size_t>(w) * h, NO_LABEL);
    region_count = 0;

    if (category == msg::Category::NONE) {
        labels.swap(tmp);
        return true;
    }

    // parent[0] is the unused NO_LABEL slot.
    std::vector<uint32_t> parent;
    parent.reserve(64);
    parent.push_back(NO_LABEL);

    // ---- Pass 1: provisional labels + equivalences ----
    if (Expired(cancel)) return false;

    for (uint32_t v = 0; v < h; ++v) {
        for (uint32_t u = 0; u < w; ++u) {
            const std::size_t i = grid.index(u, v);
            if (grid.cells[i] != category) continue;

            const uint32_t up   = (v > 0) ? tmp[i - w] : NO_LABEL;
            const uint32_t left = (u > 0) ? tmp[i - 1] : NO_LABEL;

            if (up == NO_LABEL && left == NO_LABEL) {
                const uint32_t fresh = static_cast<uint32_t>(parent.size());
                parent.push_back(fresh);
                tmp[i] = fresh;
            } else if (up != NO_LABEL && left != NO_LABEL) {
                tmp[i] = (up < left) ? up : left;
                unite(parent, up, left);
            } else {
                tmp[i] = (up != NO_LABEL) ? up : left;
            }
        }
    }

    // ---- Pass 2: resolve roots, renumber by first appearance ----
    if (Expired(cancel)) return false;

    std::vector<uint32_t> final_id(parent.size(), NO_LABEL);
    uint32_t next = 0;

    for (std::size_t i = 0; i < tmp.size(); ++i) {
        if (tmp[i] == NO_LABEL) continue;
        const uint32_t root = findRoot(parent, tmp[i]);
        if (final_id[root] == NO_LABEL) {
            final_id[root] = ++next;
        }
        tmp[i] = final_id[root];
    }

    labels.swap(tmp);
    region_count = next;
    return true;
}

void RegionLabeler::buildRegions(const std::vector<uint32_t>& labels, uint32_t width, uint32_t height,
                                 msg::Category category, uint32_t region_count,
                                 std::vector<msg::Region>& out) {
    if (labels.size() != static_cast<std::size_t>(width) * height) {
        out.clear();
        return;
    }

    std::vector<msg::Region> regions(region_count);
    for (uint32_t k = 0; k < region_count; ++k) {
        regions[k].category = category;
        regions[k].index = k;
    }

    // Row-major sweep keeps each member list in row-major order.
    std::size_t i = 0;
    for (uint32_t v = 0; v < height; ++v) {
        for (uint32_t u = 0; u < width; ++u, ++i) {
            const uint32_t id = labels[i];
            if (id == NO_LABEL || id > region_count) continue;
            regions[id - 1].members.push_back(msg::PixelCoord{u, v});
        }
    }

    out = std::move(regions);
}

bool RegionLabeler::label(const msg::ClassifiedGrid& grid, msg::Category category,
                          std::vector<msg::Region>& out, const CancelToken* cancel) const {
    std::vector<uint32_t> labels;
    uint32_t count = 0;
    if (!labelMap(grid, category, labels, count, cancel)) {
        return false;
    }

    buildRegions(labels, grid.width, grid.height, category, count, out);
    return true;
}

} // namespace chroma
