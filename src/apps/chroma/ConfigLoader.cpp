#include "apps/chroma/ConfigLoader.hpp"
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <istream>
#include <limits>
#include <ostream>

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    const auto b = s.find_first_not_of(ws);
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

bool parseFloat(const std::string& text, float& out) {
    if (text.empty()) return false;
    errno = 0;
    char* end = nullptr;
    const float v = std::strtof(text.c_str(), &end);
    if (errno != 0 || end != text.c_str() + text.size()) return false;
    out = v;
    return true;
}

bool parseUint(const std::string& text, uint32_t& out) {
    if (text.empty() || text[0] == '-') return false;
    errno = 0;
    char* end = nullptr;
    const unsigned long v = std::strtoul(text.c_str(), &end, 10);
    if (errno != 0 || end != text.c_str() + text.size() || v > 0xFFFFFFFFul) return false;
    out = static_cast<uint32_t>(v);
    return true;
}

void setError(std::string* error, const std::string& msg) {
    if (error) *error = msg;
}

} // anonymous namespace

namespace chroma {

const char* ConfigLoader::StatusStr(Status s) {
    switch (s) {
        case Status::OK:                 return "OK";
        case Status::FILE_NOT_FOUND:     return "FILE_NOT_FOUND";
        case Status::PARSE_ERROR:        return "PARSE_ERROR";
        case Status::UNSUPPORTED_CONFIG: return "UNSUPPORTED_CONFIG";
        default:                         return "UNKNOWN";
    }
}

ConfigLoader::Status ConfigLoader::parse(std::istream& in, AnalysisPipelineConfig& cfg, std::string* error) {
    AnalysisPipelineConfig next = cfg;
    ClassificationConfig& c = next.CLASSIFY;

    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;

        const auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        line = trim(line);
        if (line.empty()) continue;

        const auto eq = line.find('=');
        if (eq == std::string::npos) {
            setError(error, "line " + std::to_string(line_no) + ": expected 'key = value'");
            return Status::PARSE_ERROR;
        }
        const std::string key = trim(line.substr(0, eq));
        const std::string val = trim(line.substr(eq + 1));

        bool ok = true;
        if      (key == "red_hue_min_deg")  ok = parseFloat(val, c.RED_HUE.MIN_DEG);
        else if (key == "red_hue_max_deg")  ok = parseFloat(val, c.RED_HUE.MAX_DEG);
        else if (key == "blue_hue_min_deg") ok = parseFloat(val, c.BLUE_HUE.MIN_DEG);
        else if (key == "blue_hue_max_deg") ok = parseFloat(val, c.BLUE_HUE.MAX_DEG);
        else if (key == "min_saturation")   ok = parseFloat(val, c.MIN_SATURATION);
        else if (key == "min_value")        ok = parseFloat(val, c.MIN_VALUE);
        else if (key == "classify_threads") ok = parseUint(val, next.CLASSIFY_THREADS);
        else {
            setError(error, "line " + std::to_string(line_no) + ": unknown key '" + key + "'");
            return Status::PARSE_ERROR;
        }

        if (!ok) {
            setError(error, "line " + std::to_string(line_no) + ": bad value '" + val + "' for " + key);
            return Status::PARSE_ERROR;
        }
    }

    const ConfigStatus cs = validate(c);
    if (cs != ConfigStatus::OK) {
        setError(error, ConfigStatusStr(cs));
        return Status::UNSUPPORTED_CONFIG;
    }

    cfg = next;
    return Status::OK;
}

ConfigLoader::Status ConfigLoader::load(const std::string& path, AnalysisPipelineConfig& cfg, std::string* error) {
    std::ifstream f(path);
    if (!f) {
        setError(error, "cannot open " + path);
        return Status::FILE_NOT_FOUND;
    }
    return parse(f, cfg, error);
}

void ConfigLoader::write(std::ostream& os, const AnalysisPipelineConfig& cfg) {
    const ClassificationConfig& c = cfg.CLASSIFY;
    // Enough digits for every float to parse back to the same value.
    const std::ios::fmtflags flags = os.flags();
    const std::streamsize prev = os.precision(std::numeric_limits<float>::max_digits10);
    os.unsetf(std::ios::floatfield);
    os << "red_hue_min_deg = "  << c.RED_HUE.MIN_DEG  << "\n";
    os << "red_hue_max_deg = "  << c.RED_HUE.MAX_DEG  << "\n";
    os << "blue_hue_min_deg = " << c.BLUE_HUE.MIN_DEG << "\n";
    os << "blue_hue_max_deg = " << c.BLUE_HUE.MAX_DEG << "\n";
    os << "min_saturation = "   << c.MIN_SATURATION   << "\n";
    os << "min_value = "        << c.MIN_VALUE        << "\n";
    os << "classify_threads = " << cfg.CLASSIFY_THREADS << "\n";
    os.precision(prev);
    os.flags(flags);
}

} // namespace chroma
