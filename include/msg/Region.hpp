#pragma once
#include <cstdint>
#include <vector>
#include "msg/ClassifiedGrid.hpp"

namespace msg {

struct PixelCoord {
    uint32_t u;   // column
    uint32_t v;   // row
};

// A maximal 4-connected set of cells sharing one non-NONE category.
struct Region {
    Category category = Category::NONE;
    uint32_t index = 0;                 // enumeration order within its category

    // Row-major order (the order the labeler's scan first reaches them).
    std::vector<PixelCoord> members;

    uint64_t area = 0;                  // member count
    uint64_t perimeter = 0;             // exposed 4-neighbour edges

    // Inclusive bounding box.
    uint32_t u_min = 0;
    uint32_t u_max = 0;
    uint32_t v_min = 0;
    uint32_t v_max = 0;

    float u_cx = 0.0f;                  // centroid column
    float v_cx = 0.0f;                  // centroid row

    float orientation_rad = 0.0f;       // major axis angle from +u toward +v, [0, pi)
    float elongation = 1.0f;            // sqrt(minor/major) second moment, (0, 1]
};

} // namespace msg
