#pragma once
#include <cstdint>
#include <iosfwd>
#include <string>

#include "apps/chroma/AnalysisPipeline.hpp"

namespace chroma {

// ---------------------------------------------------------------------------
// ConfigLoader: `key = value` text files -> AnalysisPipelineConfig.
//
//   # red wraps through 0 degrees
//   red_hue_min_deg  = 345
//   red_hue_max_deg  = 15
//   blue_hue_min_deg = 200
//   blue_hue_max_deg = 250
//   min_saturation   = 0.35
//   min_value        = 0.20
//   classify_threads = 4
//
// Keys not present keep the value already in `cfg` (pass a default-built
// config to get the documented defaults). `cfg` is only written on OK.
// ---------------------------------------------------------------------------
class ConfigLoader {
public:
    enum class Status : uint8_t {
        OK = 0,
        FILE_NOT_FOUND,
        PARSE_ERROR,          // unknown key, missing '=', bad number
        UNSUPPORTED_CONFIG,   // parsed, but validate() rejected it
    };

    static const char* StatusStr(Status s);

    static Status parse(std::istream& in, AnalysisPipelineConfig& cfg, std::string* error = nullptr);
    static Status load(const std::string& path, AnalysisPipelineConfig& cfg, std::string* error = nullptr);

    // Same keys, loadable by parse().
    static void write(std::ostream& os, const AnalysisPipelineConfig& cfg);
};

} // namespace chroma
