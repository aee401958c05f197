// test/chroma_configloader_test.cpp
//
// ConfigLoader test: parsing, comments, partial files, rejections, and a
// write -> load cycle through a temp file.

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "apps/chroma/ConfigLoader.hpp"

#include "check.hpp"

using chroma::AnalysisPipelineConfig;
using chroma::ConfigLoader;
using Status = chroma::ConfigLoader::Status;

using test::check;

static Status parse_text(const std::string& text, AnalysisPipelineConfig& cfg, std::string* err = nullptr) {
    std::istringstream in(text);
    return ConfigLoader::parse(in, cfg, err);
}

static void test_full_file() {
    AnalysisPipelineConfig cfg;
    const std::string text =
        "# tuned for the lab lighting\n"
        "red_hue_min_deg  = 350\n"
        "red_hue_max_deg  = 10   # narrow\n"
        "\n"
        "blue_hue_min_deg = 190\n"
        "blue_hue_max_deg = 260\n"
        "min_saturation   = 0.5\n"
        "min_value        = 0.25\n"
        "classify_threads = 3\n";
    check(parse_text(text, cfg) == Status::OK, __LINE__, "parse_text(text, cfg) == Status::OK");
    check(cfg.CLASSIFY.RED_HUE.MIN_DEG == 350.0f, __LINE__, "cfg.CLASSIFY.RED_HUE.MIN_DEG == 350.0f");
    check(cfg.CLASSIFY.RED_HUE.MAX_DEG == 10.0f, __LINE__, "cfg.CLASSIFY.RED_HUE.MAX_DEG == 10.0f");
    check(cfg.CLASSIFY.BLUE_HUE.MIN_DEG == 190.0f, __LINE__, "cfg.CLASSIFY.BLUE_HUE.MIN_DEG == 190.0f");
    check(cfg.CLASSIFY.BLUE_HUE.MAX_DEG == 260.0f, __LINE__, "cfg.CLASSIFY.BLUE_HUE.MAX_DEG == 260.0f");
    check(cfg.CLASSIFY.MIN_SATURATION == 0.5f, __LINE__, "cfg.CLASSIFY.MIN_SATURATION == 0.5f");
    check(cfg.CLASSIFY.MIN_VALUE == 0.25f, __LINE__, "cfg.CLASSIFY.MIN_VALUE == 0.25f");
    check(cfg.CLASSIFY_THREADS == 3, __LINE__, "cfg.CLASSIFY_THREADS == 3");
    std::cout << "[TEST] full_file done\n";
}

static void test_partial_keeps_defaults() {
    AnalysisPipelineConfig cfg;
    check(parse_text("min_value = 0.1\n", cfg) == Status::OK, __LINE__, "parse_text(\"min_value = 0.1\\n\", cfg) == Status::OK");
    check(cfg.CLASSIFY.MIN_VALUE == 0.1f, __LINE__, "cfg.CLASSIFY.MIN_VALUE == 0.1f");
    check(cfg.CLASSIFY.RED_HUE.MIN_DEG == 345.0f, __LINE__, "cfg.CLASSIFY.RED_HUE.MIN_DEG == 345.0f");
    check(cfg.CLASSIFY.BLUE_HUE.MAX_DEG == 250.0f, __LINE__, "cfg.CLASSIFY.BLUE_HUE.MAX_DEG == 250.0f");
    check(cfg.CLASSIFY_THREADS == 1, __LINE__, "cfg.CLASSIFY_THREADS == 1");

    AnalysisPipelineConfig empty;
    check(parse_text("", empty) == Status::OK, __LINE__, "parse_text(\"\", empty) == Status::OK");
    check(empty.CLASSIFY.MIN_SATURATION == 0.35f, __LINE__, "empty.CLASSIFY.MIN_SATURATION == 0.35f");
    std::cout << "[TEST] partial_keeps_defaults done\n";
}

static void test_rejections() {
    AnalysisPipelineConfig cfg;
    std::string err;

    check(parse_text("min_value = 0.1\nbogus_key = 3\n", cfg, &err) == Status::PARSE_ERROR, __LINE__, "parse_text(\"min_value = 0.1\\nbogus_key = 3\\n\", cfg, &err) == Status::PARSE_ERROR");
    check(err.find("line 2") != std::string::npos, __LINE__, "err.find(\"line 2\") != std::string::npos");
    check(cfg.CLASSIFY.MIN_VALUE == 0.20f, __LINE__, "cfg.CLASSIFY.MIN_VALUE == 0.20f");   // untouched on failure

    check(parse_text("min_value 0.1\n", cfg, &err) == Status::PARSE_ERROR, __LINE__, "parse_text(\"min_value 0.1\\n\", cfg, &err) == Status::PARSE_ERROR");
    check(parse_text("min_value = abc\n", cfg) == Status::PARSE_ERROR, __LINE__, "parse_text(\"min_value = abc\\n\", cfg) == Status::PARSE_ERROR");
    check(parse_text("min_value = 0.1x\n", cfg) == Status::PARSE_ERROR, __LINE__, "parse_text(\"min_value = 0.1x\\n\", cfg) == Status::PARSE_ERROR");
    check(parse_text("min_value =\n", cfg) == Status::PARSE_ERROR, __LINE__, "parse_text(\"min_value =\\n\", cfg) == Status::PARSE_ERROR");
    check(parse_text("classify_threads = -2\n", cfg) == Status::PARSE_ERROR, __LINE__, "parse_text(\"classify_threads = -2\\n\", cfg) == Status::PARSE_ERROR");
    check(parse_text("classify_threads = 2.5\n", cfg) == Status::PARSE_ERROR, __LINE__, "parse_text(\"classify_threads = 2.5\\n\", cfg) == Status::PARSE_ERROR");

    // Well-formed but rejected by validation.
    check(parse_text("blue_hue_min_deg = 0\n", cfg, &err) == Status::UNSUPPORTED_CONFIG, __LINE__, "parse_text(\"blue_hue_min_deg = 0\\n\", cfg, &err) == Status::UNSUPPORTED_CONFIG");
    check(err == "HUE_RANGES_OVERLAP", __LINE__, "err == \"HUE_RANGES_OVERLAP\"");
    check(parse_text("red_hue_min_deg = 400\n", cfg) == Status::UNSUPPORTED_CONFIG, __LINE__, "parse_text(\"red_hue_min_deg = 400\\n\", cfg) == Status::UNSUPPORTED_CONFIG");
    check(parse_text("min_saturation = 1.2\n", cfg) == Status::UNSUPPORTED_CONFIG, __LINE__, "parse_text(\"min_saturation = 1.2\\n\", cfg) == Status::UNSUPPORTED_CONFIG");

    check(ConfigLoader::load("/nonexistent/dir/chroma.cfg", cfg, &err) == Status::FILE_NOT_FOUND, __LINE__, "ConfigLoader::load(\"/nonexistent/dir/chroma.cfg\", cfg, &err) == Status::FILE_NOT_FOUND");
    check(std::string(ConfigLoader::StatusStr(Status::PARSE_ERROR)) == "PARSE_ERROR", __LINE__, "std::string(ConfigLoader::StatusStr(Status::PARSE_ERROR)) == \"PARSE_ERROR\"");
    std::cout << "[TEST] rejections done\n";
}

static void test_write_then_load() {
    AnalysisPipelineConfig cfg;
    cfg.CLASSIFY.RED_HUE = chroma::HueRange{340.0f, 20.0f};
    cfg.CLASSIFY.BLUE_HUE = chroma::HueRange{195.0f, 255.0f};
    cfg.CLASSIFY.MIN_SATURATION = 0.5f;
    cfg.CLASSIFY.MIN_VALUE = 0.25f;
    cfg.CLASSIFY_THREADS = 6;

    const std::filesystem::path path =
        std::filesystem::temp_directory_path() / "chroma_configloader_test.cfg";
    {
        std::ofstream f(path);
        ConfigLoader::write(f, cfg);
    }

    AnalysisPipelineConfig loaded;
    std::string err;
    check(ConfigLoader::load(path.string(), loaded, &err) == Status::OK, __LINE__, "ConfigLoader::load(path.string(), loaded, &err) == Status::OK");
    check(loaded.CLASSIFY.RED_HUE.MIN_DEG == 340.0f, __LINE__, "loaded.CLASSIFY.RED_HUE.MIN_DEG == 340.0f");
    check(loaded.CLASSIFY.RED_HUE.MAX_DEG == 20.0f, __LINE__, "loaded.CLASSIFY.RED_HUE.MAX_DEG == 20.0f");
    check(loaded.CLASSIFY.BLUE_HUE.MIN_DEG == 195.0f, __LINE__, "loaded.CLASSIFY.BLUE_HUE.MIN_DEG == 195.0f");
    check(loaded.CLASSIFY.BLUE_HUE.MAX_DEG == 255.0f, __LINE__, "loaded.CLASSIFY.BLUE_HUE.MAX_DEG == 255.0f");
    check(loaded.CLASSIFY.MIN_SATURATION == 0.5f, __LINE__, "loaded.CLASSIFY.MIN_SATURATION == 0.5f");
    check(loaded.CLASSIFY.MIN_VALUE == 0.25f, __LINE__, "loaded.CLASSIFY.MIN_VALUE == 0.25f");
    check(loaded.CLASSIFY_THREADS == 6, __LINE__, "loaded.CLASSIFY_THREADS == 6");

    std::error_code ec;
    std::filesystem::remove(path, ec);
    std::cout << "[TEST] write_then_load done\n";
}

static void test_write_keeps_every_digit() {
    AnalysisPipelineConfig cfg;
    cfg.CLASSIFY.RED_HUE = chroma::HueRange{345.987654f, 14.0000019f};
    cfg.CLASSIFY.BLUE_HUE = chroma::HueRange{201.123456f, 249.999985f};
    cfg.CLASSIFY.MIN_SATURATION = 0.123456789f;
    cfg.CLASSIFY.MIN_VALUE = 0.200000003f;

    // Caller's stream state must not leak into the output.
    std::stringstream ss;
    ss << std::fixed;
    ss.precision(2);
    ConfigLoader::write(ss, cfg);
    check((ss.flags() & std::ios::floatfield) == std::ios::fixed, __LINE__, "(ss.flags() & std::ios::floatfield) == std::ios::fixed");
    check(ss.precision() == 2, __LINE__, "ss.precision() == 2");

    AnalysisPipelineConfig loaded;
    check(ConfigLoader::parse(ss, loaded) == Status::OK, __LINE__, "ConfigLoader::parse(ss, loaded) == Status::OK");
    check(loaded.CLASSIFY.RED_HUE.MIN_DEG == cfg.CLASSIFY.RED_HUE.MIN_DEG, __LINE__, "loaded.CLASSIFY.RED_HUE.MIN_DEG == cfg.CLASSIFY.RED_HUE.MIN_DEG");
    check(loaded.CLASSIFY.RED_HUE.MAX_DEG == cfg.CLASSIFY.RED_HUE.MAX_DEG, __LINE__, "loaded.CLASSIFY.RED_HUE.MAX_DEG == cfg.CLASSIFY.RED_HUE.MAX_DEG");
    check(loaded.CLASSIFY.BLUE_HUE.MIN_DEG == cfg.CLASSIFY.BLUE_HUE.MIN_DEG, __LINE__, "loaded.CLASSIFY.BLUE_HUE.MIN_DEG == cfg.CLASSIFY.BLUE_HUE.MIN_DEG");
    check(loaded.CLASSIFY.BLUE_HUE.MAX_DEG == cfg.CLASSIFY.BLUE_HUE.MAX_DEG, __LINE__, "loaded.CLASSIFY.BLUE_HUE.MAX_DEG == cfg.CLASSIFY.BLUE_HUE.MAX_DEG");
    check(loaded.CLASSIFY.MIN_SATURATION == cfg.CLASSIFY.MIN_SATURATION, __LINE__, "loaded.CLASSIFY.MIN_SATURATION == cfg.CLASSIFY.MIN_SATURATION");
    check(loaded.CLASSIFY.MIN_VALUE == cfg.CLASSIFY.MIN_VALUE, __LINE__, "loaded.CLASSIFY.MIN_VALUE == cfg.CLASSIFY.MIN_VALUE");
    std::cout << "[TEST] write_keeps_every_digit done\n";
}

int main() {
    test_full_file();
    test_partial_keeps_defaults();
    test_rejections();
    test_write_then_load();
    test_write_keeps_every_digit();

    return test::finish();
}
