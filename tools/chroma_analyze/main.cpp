// chroma_analyze: red/blue region area and perimeter for one image or a
// folder of case directories.
//
//   chroma_analyze --image photo.png [--config cfg.txt] [--threads N]
//   chroma_analyze --cases_root DIR [--image_name image.png] [--config cfg.txt]
//                  [--workers N] [--threads N] [--write_annotated 0|1]
//
// Cases mode writes DIR/<case>/results.txt for every case holding the image,
// DIR/summary.csv with one row per case, and optionally
// DIR/<case>/image_annotated.png with region boundaries drawn in.

#include "apps/chroma/AnalysisPipeline.hpp"
#include "apps/chroma/BatchAnalyzer.hpp"
#include "apps/chroma/ConfigLoader.hpp"
#include "apps/core/StateMachine.hpp"
#include "platform/linux/OpenCvImageDecoder.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

struct Args {
    fs::path image;
    fs::path cases_root;
    fs::path config;
    std::string image_name = "image.png";
    bool write_annotated = false;
    int workers = 2;
    int threads = -1;   // -1 = keep config file / default
};

static void print_usage(const char* exe) {
    std::cerr
        << "Usage:\n"
        << "  " << exe << " --image <FILE> [--config <FILE>] [--threads N]\n"
        << "  " << exe << " --cases_root <DIR> [--image_name image.png] [--config <FILE>]\n"
        << "       [--workers N] [--threads N] [--write_annotated 0|1]\n"
        << "\nExample:\n"
        << "  " << exe << " --cases_root ./data/cases --workers 4 --write_annotated 1\n";
}

static bool parse_args(int argc, char** argv, Args& out) {
    if (argc < 3) return false;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];

        auto need_value = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << name << "\n";
                return nullptr;
            }
            return argv[++i];
        };

        const char* v = nullptr;
        if (a == "--image") {
            if (!(v = need_value("--image"))) return false;
            out.image = fs::path(v);
        } else if (a == "--cases_root") {
            if (!(v = need_value("--cases_root"))) return false;
            out.cases_root = fs::path(v);
        } else if (a == "--config") {
            if (!(v = need_value("--config"))) return false;
            out.config = fs::path(v);
        } else if (a == "--image_name") {
            if (!(v = need_value("--image_name"))) return false;
            out.image_name = v;
        } else if (a == "--write_annotated") {
            if (!(v = need_value("--write_annotated"))) return false;
            out.write_annotated = (std::stoi(v) != 0);
        } else if (a == "--workers") {
            if (!(v = need_value("--workers"))) return false;
            out.workers = std::stoi(v);
        } else if (a == "--threads") {
            if (!(v = need_value("--threads"))) return false;
            out.threads = std::stoi(v);
        } else {
            std::cerr << "Unknown arg: " << a << "\n";
            return false;
        }
    }

    // exactly one mode
    return out.image.empty() != out.cases_root.empty();
}

static bool load_config(const Args& args, chroma::AnalysisPipelineConfig& cfg) {
    if (!args.config.empty()) {
        std::string why;
        const auto st = chroma::ConfigLoader::load(args.config.string(), cfg, &why);
        if (st != chroma::ConfigLoader::Status::OK) {
            std::cerr << "[CONFIG] " << args.config.string() << ": "
                      << chroma::ConfigLoader::StatusStr(st) << " (" << why << ")\n";
            return false;
        }
        std::cout << "[CONFIG] loaded " << args.config.string() << "\n";
    } else {
        std::cout << "[CONFIG] no config file, using defaults\n";
    }
    if (args.threads > 0) {
        cfg.CLASSIFY_THREADS = static_cast<uint32_t>(args.threads);
    }
    return true;
}

static void write_report(std::ostream& os, const msg::AnalysisReport& r) {
    const msg::FlatReport f = r.flat();
    os << "red_area = "       << f.red_area << "\n";
    os << "red_perimeter = "  << f.red_perimeter << "\n";
    os << "red_regions = "    << r.of(msg::Category::RED).region_count << "\n";
    os << "blue_area = "      << f.blue_area << "\n";
    os << "blue_perimeter = " << f.blue_perimeter << "\n";
    os << "blue_regions = "   << r.of(msg::Category::BLUE).region_count << "\n";
}

// Boundary cells (any exposed edge) get the category's marker colour.
static void annotate(const platform::DecodedImage& img, const std::vector<msg::Region>& regions,
                     const fs::path& out_path) {
    cv::Mat rgb(static_cast<int>(img.height), static_cast<int>(img.width), CV_8UC3,
                const_cast<uint8_t*>(img.pixels.data()));
    cv::Mat annotated;
    cv::cvtColor(rgb, annotated, cv::COLOR_RGB2BGR);

    cv::Mat owner(annotated.size(), CV_32SC1, cv::Scalar(-1));
    for (std::size_t k = 0; k < regions.size(); ++k) {
        for (const auto& p : regions[k].members) {
            owner.at<int>(static_cast<int>(p.v), static_cast<int>(p.u)) = static_cast<int>(k);
        }
    }

    for (std::size_t k = 0; k < regions.size(); ++k) {
        const msg::Region& r = regions[k];
        const cv::Vec3b mark = (r.category == msg::Category::RED) ? cv::Vec3b(0, 255, 255)   // yellow
                                                                  : cv::Vec3b(0, 255, 0);    // green
        for (const auto& p : r.members) {
            const int u = static_cast<int>(p.u);
            const int v = static_cast<int>(p.v);
            const bool edge =
                u == 0 || v == 0 || u == owner.cols - 1 || v == owner.rows - 1 ||
                owner.at<int>(v, u - 1) != int(k) || owner.at<int>(v, u + 1) != int(k) ||
                owner.at<int>(v - 1, u) != int(k) || owner.at<int>(v + 1, u) != int(k);
            if (edge) annotated.at<cv::Vec3b>(v, u) = mark;
        }

        if (r.area >= 50) {
            const cv::Point c(static_cast<int>(r.u_cx), static_cast<int>(r.v_cx));
            cv::drawMarker(annotated, c, cv::Scalar(255, 255, 255), cv::MARKER_CROSS, 10, 1);
            cv::putText(annotated, std::to_string(r.index), c + cv::Point(5, -5),
                        cv::FONT_HERSHEY_SIMPLEX, 0.4, cv::Scalar(255, 255, 255), 1);
        }
    }

    if (!cv::imwrite(out_path.string(), annotated)) {
        std::cerr << "[ANNOTATE] failed to write " << out_path.string() << "\n";
    }
}

static void on_stage(chroma::Stage stage, void* user) {
    const char* tag = static_cast<const char*>(user);
    std::cout << "[" << tag << "] stage " << chroma::StageStr(stage) << "\n";
}

static int run_single(const Args& args, const chroma::AnalysisPipelineConfig& cfg) {
    StateMachine session;
    platform::OpenCvImageDecoder decoder;

    session.update(SessionEvent::FILE_SELECTED);
    std::cout << "[SESSION] " << session.getStateName() << " " << args.image.string() << "\n";

    platform::DecodedImage img;
    const auto ds = decoder.decodeFile(args.image.string(), img);
    if (ds != platform::DecodeStatus::OK) {
        std::cerr << "[DECODER] " << args.image.string() << ": " << platform::DecodeStatusStr(ds) << "\n";
        session.update(SessionEvent::ANALYSIS_FAILED);
        std::cout << "[SESSION] " << session.getStateName() << "\n";
        return 1;
    }

    chroma::AnalysisPipeline pipeline(cfg);
    static char tag[] = "ANALYZE";
    pipeline.setProgressHook(chroma::ProgressHook{on_stage, tag});

    msg::AnalysisReport report;
    const uint64_t t0 = Rtos::NowUs();
    const auto st = pipeline.analyze(img.view(), report);
    const double ms = static_cast<double>(Rtos::NowUs() - t0) / 1000.0;

    if (st != chroma::AnalysisPipeline::Status::OK) {
        session.update(SessionEvent::ANALYSIS_FAILED);
        std::cerr << "[ANALYZE] " << chroma::AnalysisPipeline::StatusStr(st) << "\n";
        std::cout << "[SESSION] " << session.getStateName() << "\n";
        return 1;
    }

    session.update(SessionEvent::ANALYSIS_COMPLETED);
    std::cout << "[SESSION] " << session.getStateName() << "\n";
    std::cout << "width = " << report.width << "\nheight = " << report.height << "\n";
    write_report(std::cout, report);
    std::cout << "analyze_time_ms = " << std::fixed << std::setprecision(3) << ms << "\n";
    return 0;
}

static int run_cases(const Args& args, const chroma::AnalysisPipelineConfig& cfg) {
    if (!fs::exists(args.cases_root) || !fs::is_directory(args.cases_root)) {
        std::cerr << "ERROR: --cases_root is not a directory: " << args.cases_root.string() << "\n";
        return 2;
    }

    // Sorted so summary.csv rows come out in a stable order.
    std::vector<fs::path> case_dirs;
    for (const auto& e : fs::directory_iterator(args.cases_root)) {
        if (e.is_directory()) case_dirs.push_back(e.path());
    }
    std::sort(case_dirs.begin(), case_dirs.end());

    platform::OpenCvImageDecoder decoder;
    std::vector<fs::path> cases;
    std::vector<platform::DecodedImage> images;
    for (const auto& dir : case_dirs) {
        const fs::path input_path = dir / args.image_name;
        if (!fs::exists(input_path)) continue;   // not a case folder

        platform::DecodedImage img;
        const auto ds = decoder.decodeFile(input_path.string(), img);
        if (ds != platform::DecodeStatus::OK) {
            std::cerr << "[CASE] " << dir.string() << " : " << platform::DecodeStatusStr(ds) << "\n";
            continue;
        }
        cases.push_back(dir);
        images.push_back(std::move(img));
    }

    std::vector<msg::PixelBuffer> views;
    views.reserve(images.size());
    for (const auto& img : images) views.push_back(img.view());

    chroma::BatchAnalyzerConfig bcfg;
    bcfg.PIPELINE = cfg;
    bcfg.WORKERS = static_cast<uint32_t>(std::max(1, args.workers));
    chroma::BatchAnalyzer batch(bcfg);

    std::vector<chroma::BatchResult> results;
    batch.run(views, results);

    std::ofstream csv(args.cases_root / "summary.csv");
    csv << "case_id,status,width,height,red_area,red_perimeter,red_regions,"
           "blue_area,blue_perimeter,blue_regions,exec_ms\n";

    const chroma::AnalysisPipeline annotator(cfg);
    for (std::size_t i = 0; i < cases.size(); ++i) {
        const chroma::BatchResult& res = results[i];
        const msg::AnalysisReport& r = res.report;
        const double ms = static_cast<double>(res.exec_us) / 1000.0;
        const char* status = chroma::AnalysisPipeline::StatusStr(res.status);

        {
            std::ofstream rf(cases[i] / "results.txt");
            rf << "case_id = " << cases[i].filename().string() << "\n";
            rf << "input_image = " << (cases[i] / args.image_name).string() << "\n";
            rf << "width = " << images[i].width << "\n";
            rf << "height = " << images[i].height << "\n\n";

            rf << "[CONFIG]\n";
            chroma::ConfigLoader::write(rf, cfg);

            rf << "\n[ANALYSIS]\n";
            rf << "status = " << status << "\n";
            rf << "exec_ms = " << std::fixed << std::setprecision(3) << ms << "\n";
            if (res.status == chroma::AnalysisPipeline::Status::OK) {
                write_report(rf, r);
            }
        }

        csv << cases[i].filename().string() << "," << status << ","
            << images[i].width << "," << images[i].height << ","
            << r.of(msg::Category::RED).area << "," << r.of(msg::Category::RED).perimeter << ","
            << r.of(msg::Category::RED).region_count << ","
            << r.of(msg::Category::BLUE).area << "," << r.of(msg::Category::BLUE).perimeter << ","
            << r.of(msg::Category::BLUE).region_count << ","
            << std::fixed << std::setprecision(3) << ms << "\n";

        if (args.write_annotated && res.status == chroma::AnalysisPipeline::Status::OK) {
            msg::AnalysisReport again;
            std::vector<msg::Region> regions;
            if (annotator.analyze(views[i], again, &regions) == chroma::AnalysisPipeline::Status::OK) {
                annotate(images[i], regions, cases[i] / "image_annotated.png");
            }
        }
    }

    std::cout << "[BATCH] cases_root = " << args.cases_root.string() << "\n";
    std::cout << "[BATCH] subdirs_seen = " << case_dirs.size() << "\n";
    std::cout << "[BATCH] cases_processed = " << cases.size() << "\n";
    return 0;
}

int main(int argc, char** argv) {
    Args args;
    try {
        if (!parse_args(argc, argv, args)) {
            print_usage(argv[0]);
            return 2;
        }
    } catch (const std::exception& e) {
        std::cerr << "Bad argument value: " << e.what() << "\n";
        print_usage(argv[0]);
        return 2;
    }

    chroma::AnalysisPipelineConfig cfg;
    if (!load_config(args, cfg)) {
        return 2;
    }

    return args.image.empty() ? run_cases(args, cfg) : run_single(args, cfg);
}
