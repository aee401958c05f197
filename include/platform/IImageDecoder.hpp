#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "msg/PixelBuffer.hpp"

namespace platform {

enum class ImageFormat : uint8_t { UNKNOWN = 0, JPEG, PNG };

// Identifies JPEG/PNG from the leading magic bytes.
ImageFormat SniffFormat(const uint8_t* bytes, std::size_t size);

enum class DecodeStatus : uint8_t {
    OK = 0,
    EMPTY_INPUT,
    UNSUPPORTED_FORMAT,   // not JPEG or PNG
    DECODE_FAILED,        // right magic, corrupt payload
    FILE_NOT_FOUND,
};

const char* DecodeStatusStr(DecodeStatus s);

// Owning, tightly packed 8-bit RGB image.
struct DecodedImage {
    std::vector<uint8_t> pixels;
    uint32_t width = 0;
    uint32_t height = 0;
    ImageFormat source_format = ImageFormat::UNKNOWN;

    // Valid while this object lives and is not modified.
    msg::PixelBuffer view() const {
        msg::PixelBuffer b;
        b.data   = pixels.empty() ? nullptr : pixels.data();
        b.width  = width;
        b.height = height;
        b.stride = width * 3;
        b.format = msg::PixelFormat::RGB24;
        return b;
    }
};

class IImageDecoder {
public:
    // `out` is only written on OK.
    virtual DecodeStatus decode(const uint8_t* bytes, std::size_t size, DecodedImage& out) = 0;
    virtual DecodeStatus decodeFile(const std::string& path, DecodedImage& out) = 0;
    virtual ~IImageDecoder() = default;
};

} // namespace platform
