#pragma once
#include <cstdint>
#include "msg/PixelBuffer.hpp"
#include "msg/ClassifiedGrid.hpp"
#include "apps/chroma/CancelToken.hpp"

namespace chroma {

// Inclusive hue interval in degrees, each bound in [0, 360).
// MIN_DEG > MAX_DEG wraps through 0 (e.g. 345..15 for red).
struct HueRange {
    float MIN_DEG = 0.0f;
    float MAX_DEG = 0.0f;

    bool contains(float h_deg) const {
        if (MIN_DEG <= MAX_DEG) return h_deg >= MIN_DEG && h_deg <= MAX_DEG;
        return h_deg >= MIN_DEG || h_deg <= MAX_DEG;
    }
};

// ---------------------------------------------------------------------------
// Configuration for the PixelClassifier (tunable parameters, no state).
// A pixel is RED/BLUE only if its hue is in range AND S > MIN_SATURATION
// AND V > MIN_VALUE.
// ---------------------------------------------------------------------------
struct ClassificationConfig {
    HueRange RED_HUE  {345.0f, 15.0f};
    HueRange BLUE_HUE {200.0f, 250.0f};

    float MIN_SATURATION = 0.35f;   // [0, 1]
    float MIN_VALUE      = 0.20f;   // [0, 1]
};

enum class ConfigStatus : uint8_t {
    OK = 0,
    HUE_OUT_OF_RANGE,          // a bound outside [0, 360) or NaN
    THRESHOLD_OUT_OF_RANGE,    // saturation/value floor outside [0, 1] or NaN
    HUE_RANGES_OVERLAP,        // some hue would be both RED and BLUE
};

const char* ConfigStatusStr(ConfigStatus s);

// Checked before any pixel work.
ConfigStatus validate(const ClassificationConfig& cfg);

struct Hsv {
    float h_deg;   // [0, 360); 0 when s == 0 (undefined hue)
    float s;       // [0, 1]
    float v;       // [0, 1]
};

Hsv RgbToHsv(uint8_t r, uint8_t g, uint8_t b);

// ---------------------------------------------------------------------------
// PixelClassifier: pure per-pixel mapping RGB -> Category.
// ---------------------------------------------------------------------------
class PixelClassifier {
public:
    explicit PixelClassifier(const ClassificationConfig& cfg = {});

    void setConfig(const ClassificationConfig& cfg) { m_cfg = cfg; }
    const ClassificationConfig& getConfig() const { return m_cfg; }

    msg::Category classifyPixel(uint8_t r, uint8_t g, uint8_t b) const;

    // Whole image. Resizes `out` to the buffer's dimensions.
    // Returns false only when `cancel` fired (checked once per row).
    bool classify(const msg::PixelBuffer& img, msg::ClassifiedGrid& out,
                  const CancelToken* cancel = nullptr) const;

    // Rows [v_begin, v_end) only; `out` must already be sized.
    // Disjoint row bands may be classified concurrently into the same grid.
    bool classifyRows(const msg::PixelBuffer& img, uint32_t v_begin, uint32_t v_end,
                      msg::ClassifiedGrid& out, const CancelToken* cancel = nullptr) const;

private:
    ClassificationConfig m_cfg{};
};

} // namespace chroma
