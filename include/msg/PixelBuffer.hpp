#pragma once
#include <cstdint>

namespace msg {

// Sample layouts the classifier understands. Channels are 8-bit, interleaved.
enum class PixelFormat : uint8_t {
    RGB24  = 0,   // R,G,B
    RGBA32 = 1,   // R,G,B,A (alpha ignored)
};

// Pixel coords: origin = top-left; u -> right, v -> down (in pixels).
struct PixelBuffer {
    // Non-owning pointer to the first byte of row 0.
    // const: the analysis never writes into the caller's image.
    const uint8_t* data = nullptr;

    uint32_t width  = 0;     // pixels
    uint32_t height = 0;     // pixels

    // Stride = number of BYTES between the start of row v and row v+1.
    // Tightly packed: stride == width * bytesPerPx().
    uint32_t stride = 0;

    PixelFormat format = PixelFormat::RGB24;

    constexpr uint32_t bytesPerPx() const {
        return format == PixelFormat::RGBA32 ? 4u : 3u;
    }

    constexpr uint64_t byteSize() const {
        return static_cast<uint64_t>(stride) * height;
    }

    const uint8_t* row(uint32_t v) const {
        return data + static_cast<uint64_t>(v) * stride;
    }
};

} // namespace msg
