#include "platform/linux/OpenCvImageDecoder.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <utility>

namespace platform {

ImageFormat SniffFormat(const uint8_t* bytes, std::size_t size) {
    static const uint8_t PNG_MAGIC[8]  = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    static const uint8_t JPEG_MAGIC[3] = {0xFF, 0xD8, 0xFF};

    if (bytes == nullptr) return ImageFormat::UNKNOWN;
    if (size >= sizeof(PNG_MAGIC) && std::memcmp(bytes, PNG_MAGIC, sizeof(PNG_MAGIC)) == 0) {
        return ImageFormat::PNG;
    }
    if (size >= sizeof(JPEG_MAGIC) && std::memcmp(bytes, JPEG_MAGIC, sizeof(JPEG_MAGIC)) == 0) {
        return ImageFormat::JPEG;
    }
    return ImageFormat::UNKNOWN;
}

const char* DecodeStatusStr(DecodeStatus s) {
    switch (s) {
        case DecodeStatus::OK:                 return "OK";
        case DecodeStatus::EMPTY_INPUT:        return "EMPTY_INPUT";
        case DecodeStatus::UNSUPPORTED_FORMAT: return "UNSUPPORTED_FORMAT";
        case DecodeStatus::DECODE_FAILED:      return "DECODE_FAILED";
        case DecodeStatus::FILE_NOT_FOUND:     return "FILE_NOT_FOUND";
        default:                               return "UNKNOWN";
    }
}

DecodeStatus OpenCvImageDecoder::decode(const uint8_t* bytes, std::size_t size, DecodedImage& out) {
    if (bytes == nullptr || size == 0) {
        return DecodeStatus::EMPTY_INPUT;
    }

    const ImageFormat fmt = SniffFormat(bytes, size);
    if (fmt == ImageFormat::UNKNOWN) {
        return DecodeStatus::UNSUPPORTED_FORMAT;
    }

    // No copy: wrap the caller's bytes for the duration of this call.
    const cv::Mat raw(1, static_cast<int>(size), CV_8UC1, const_cast<uint8_t*>(bytes));
    cv::Mat bgr = cv::imdecode(raw, cv::IMREAD_COLOR);
    if (bgr.empty() || bgr.type() != CV_8UC3) {
        std::cerr << "[DECODER] imdecode failed (" << size << " bytes)\n";
        return DecodeStatus::DECODE_FAILED;
    }

    cv::Mat rgb;
    cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);
    if (!rgb.isContinuous()) rgb = rgb.clone();

    DecodedImage img;
    img.width  = static_cast<uint32_t>(rgb.cols);
    img.height = static_cast<uint32_t>(rgb.rows);
    img.source_format = fmt;
    img.pixels.assign(rgb.data, rgb.data + rgb.total() * rgb.elemSize());

    out = std::move(img);
    return DecodeStatus::OK;
}

DecodeStatus OpenCvImageDecoder::decodeFile(const std::string& path, DecodedImage& out) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        return DecodeStatus::FILE_NOT_FOUND;
    }
    const std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)),
                                     std::istreambuf_iterator<char>());
    return decode(bytes.data(), bytes.size(), out);
}

} // namespace platform
