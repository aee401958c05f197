#pragma once
#include <array>
#include <cstdint>
#include "msg/ClassifiedGrid.hpp"

namespace msg {

struct CategoryTotals {
    uint64_t area = 0;            // sum of member region areas
    uint64_t perimeter = 0;       // sum of member region perimeters
    uint32_t region_count = 0;
};

inline bool operator==(const CategoryTotals& a, const CategoryTotals& b) {
    return a.area == b.area && a.perimeter == b.perimeter && a.region_count == b.region_count;
}
inline bool operator!=(const CategoryTotals& a, const CategoryTotals& b) { return !(a == b); }

// Two-category view consumed by the presentation layer.
struct FlatReport {
    uint64_t red_area = 0;
    uint64_t blue_area = 0;
    uint64_t red_perimeter = 0;
    uint64_t blue_perimeter = 0;
};

// Sole output of one analysis run.
struct AnalysisReport {
    uint32_t width = 0;           // analysed image size
    uint32_t height = 0;

    // Indexed by static_cast<size_t>(Category). NONE stays zero.
    std::array<CategoryTotals, CATEGORY_COUNT> totals{};

    const CategoryTotals& of(Category c) const {
        return totals[static_cast<std::size_t>(c)];
    }
    CategoryTotals& of(Category c) {
        return totals[static_cast<std::size_t>(c)];
    }

    FlatReport flat() const {
        FlatReport f;
        f.red_area       = of(Category::RED).area;
        f.blue_area      = of(Category::BLUE).area;
        f.red_perimeter  = of(Category::RED).perimeter;
        f.blue_perimeter = of(Category::BLUE).perimeter;
        return f;
    }
};

inline bool operator==(const AnalysisReport& a, const AnalysisReport& b) {
    return a.width == b.width && a.height == b.height && a.totals == b.totals;
}
inline bool operator!=(const AnalysisReport& a, const AnalysisReport& b) { return !(a == b); }

} // namespace msg
