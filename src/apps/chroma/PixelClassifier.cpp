#include "apps/chroma/PixelClassifier.hpp"
#include <algorithm>
#include <cmath>

namespace {

bool validHueBound(float deg) {
    return deg >= 0.0f && deg < 360.0f;   // false for NaN
}

bool validUnit(float x) {
    return x >= 0.0f && x <= 1.0f;
}

// Closed arcs on the hue circle intersect iff one holds an endpoint of the other.
bool arcsOverlap(const chroma::HueRange& a, const chroma::HueRange& b) {
    return a.contains(b.MIN_DEG) || a.contains(b.MAX_DEG) ||
           b.contains(a.MIN_DEG) || b.contains(a.MAX_DEG);
}

} // anonymous namespace

namespace chroma {

const char* ConfigStatusStr(ConfigStatus s) {
    switch (s) {
        case ConfigStatus::OK:                     return "OK";
        case ConfigStatus::HUE_OUT_OF_RANGE:       return "HUE_OUT_OF_RANGE";
        case ConfigStatus::THRESHOLD_OUT_OF_RANGE: return "THRESHOLD_OUT_OF_RANGE";
        case ConfigStatus::HUE_RANGES_OVERLAP:     return "HUE_RANGES_OVERLAP";
        default:                                   return "UNKNOWN";
    }
}

ConfigStatus validate(const ClassificationConfig& cfg) {
    if (!validHueBound(cfg.RED_HUE.MIN_DEG)  || !validHueBound(cfg.RED_HUE.MAX_DEG) ||
        !validHueBound(cfg.BLUE_HUE.MIN_DEG) || !validHueBound(cfg.BLUE_HUE.MAX_DEG)) {
        return ConfigStatus::HUE_OUT_OF_RANGE;
    }

    if (!validUnit(cfg.MIN_SATURATION) || !validUnit(cfg.MIN_VALUE)) {
        return ConfigStatus::THRESHOLD_OUT_OF_RANGE;
    }

    // One category per pixel: the two hue families must be disjoint.
    if (arcsOverlap(cfg.RED_HUE, cfg.BLUE_HUE)) {
        return ConfigStatus::HUE_RANGES_OVERLAP;
    }

    return ConfigStatus::OK;
}

Hsv RgbToHsv(uint8_t r, uint8_t g, uint8_t b) {
    const int mx = std::max({int(r), int(g), int(b)});
    const int mn = std::min({int(r), int(g), int(b)});
    const int delta = mx - mn;

    Hsv out{0.0f, 0.0f, static_cast<float>(mx) / 255.0f};
    if (mx == 0 || delta == 0) {
        return out;   // black or grey: no hue
    }
    out.s = static_cast<float>(delta) / static_cast<float>(mx);

    const float d = static_cast<float>(delta);
    float h;
    if (mx == r) {
        h = 60.0f * (static_cast<float>(int(g) - int(b)) / d);
    } else if (mx == g) {
        h = 60.0f * (static_cast<float>(int(b) - int(r)) / d + 2.0f);
    } else {
        h = 60.0f * (static_cast<float>(int(r) - int(g)) / d + 4.0f);
    }
    if (h < 0.0f) h += 360.0f;
    if (h >= 360.0f) h -= 360.0f;

    out.h_deg = h;
    return out;
}

PixelClassifier::PixelClassifier(const ClassificationConfig& cfg) : m_cfg(cfg) {}

msg::Category PixelClassifier::classifyPixel(uint8_t r, uint8_t g, uint8_t b) const {
    const Hsv hsv = RgbToHsv(r, g, b);

    // Zero saturation has no hue; never coloured regardless of thresholds.
    if (hsv.s <= 0.0f) return msg::Category::NONE;
    if (!(hsv.s > m_cfg.MIN_SATURATION) || !(hsv.v > m_cfg.MIN_VALUE)) {
        return msg::Category::NONE;
    }

    if (m_cfg.RED_HUE.contains(hsv.h_deg))  return msg::Category::RED;
    if (m_cfg.BLUE_HUE.contains(hsv.h_deg)) return msg::Category::BLUE;
    return msg::Category::NONE;
}

bool PixelClassifier::classify(const msg::PixelBuffer& img, msg::ClassifiedGrid& out,
                               const CancelToken* cancel) const {
    out.reset(img.width, img.height);
    return classifyRows(img, 0, img.height, out, cancel);
}

bool PixelClassifier::classifyRows(const msg::PixelBuffer& img, uint32_t v_begin, uint32_t v_end,
                                   msg::ClassifiedGrid& out, const CancelToken* cancel) const {
    const uint32_t bpp = img.bytesPerPx();
    v_end = std::min(v_end, img.height);

    for (uint32_t v = v_begin; v < v_end; ++v) {
        if (Expired(cancel)) return false;

        const uint8_t* px = img.row(v);
        msg::Category* dst = out.cells.data() + out.index(0, v);

        for (uint32_t u = 0; u < img.width; ++u, px += bpp) {
            dst[u] = classifyPixel(px[0], px[1], px[2]);
        }
    }
    return true;
}

} // namespace chroma
