#pragma once
#include "platform/IImageDecoder.hpp"

namespace platform {

// JPEG/PNG via cv::imdecode. Grey and alpha inputs come out as 3-channel RGB.
class OpenCvImageDecoder final : public IImageDecoder {
public:
    DecodeStatus decode(const uint8_t* bytes, std::size_t size, DecodedImage& out) override;
    DecodeStatus decodeFile(const std::string& path, DecodedImage& out) override;
};

} // namespace platform
