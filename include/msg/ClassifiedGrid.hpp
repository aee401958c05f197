#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace msg {

// One label per pixel, decided from colour alone.
enum class Category : uint8_t { NONE = 0, RED = 1, BLUE = 2 };

constexpr std::size_t CATEGORY_COUNT = 3;

// Categories that form regions, in reporting order.
constexpr Category REGION_CATEGORIES[] = { Category::RED, Category::BLUE };

inline const char* CategoryName(Category c) {
    switch (c) {
        case Category::NONE: return "NONE";
        case Category::RED:  return "RED";
        case Category::BLUE: return "BLUE";
        default:             return "UNKNOWN";
    }
}

// Same dimensions as the source PixelBuffer, row-major.
// Filled once by the classifier, read-only afterwards.
struct ClassifiedGrid {
    uint32_t width  = 0;
    uint32_t height = 0;
    std::vector<Category> cells;

    void reset(uint32_t w, uint32_t h) {
        width  = w;
        height = h;
        cells.assign(static_cast<std::size_t>(w) * h, Category::NONE);
    }

    std::size_t index(uint32_t u, uint32_t v) const {
        return static_cast<std::size_t>(v) * width + u;
    }

    Category at(uint32_t u, uint32_t v) const { return cells[index(u, v)]; }
};

} // namespace msg
