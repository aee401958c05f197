#include "apps/chroma/AnalysisPipeline.hpp"
#include "os/rtos.hpp"
#include <algorithm>
#include <array>
#include <iostream>
#include <iterator>
#include <utility>

namespace {

// Work order for one classification row band.
struct BandCtx {
    const chroma::PixelClassifier* classifier = nullptr;
    const msg::PixelBuffer* img = nullptr;
    msg::ClassifiedGrid* grid = nullptr;
    const chroma::CancelToken* cancel = nullptr;
    uint32_t v_begin = 0;
    uint32_t v_end = 0;
    bool ok = false;
};

void BandEntry(void* arg) {
    auto* ctx = static_cast<BandCtx*>(arg);
    ctx->ok = ctx->classifier->classifyRows(*ctx->img, ctx->v_begin, ctx->v_end,
                                            *ctx->grid, ctx->cancel);
}

// One category's label image and the geometry measured from it.
struct LabelMap {
    msg::Category category = msg::Category::NONE;
    std::vector<uint32_t> labels;
    uint32_t count = 0;
    std::vector<chroma::RegionGeometry> geometry;
};

} // anonymous namespace

namespace chroma {

static inline AnalysisPipelineConfig sanitise(const AnalysisPipelineConfig& in) {
    AnalysisPipelineConfig cfg = in;
    if (cfg.CLASSIFY_THREADS < 1) cfg.CLASSIFY_THREADS = 1;
    if (cfg.CLASSIFY_THREADS > 64) cfg.CLASSIFY_THREADS = 64;
    return cfg;
}

const char* StageStr(Stage s) {
    switch (s) {
        case Stage::CLASSIFY: return "CLASSIFY";
        case Stage::LABEL:    return "LABEL";
        case Stage::MEASURE:  return "MEASURE";
        case Stage::REPORT:   return "REPORT";
        default:              return "UNKNOWN";
    }
}

const char* AnalysisPipeline::StatusStr(Status s) {
    switch (s) {
        case Status::OK:                 return "OK";
        case Status::INVALID_INPUT:      return "INVALID_INPUT";
        case Status::UNSUPPORTED_CONFIG: return "UNSUPPORTED_CONFIG";
        case Status::CANCELLED:          return "CANCELLED";
        default:                         return "UNKNOWN";
    }
}

AnalysisPipeline::AnalysisPipeline(const AnalysisPipelineConfig& cfg) : m_cfg(sanitise(cfg)) {}

void AnalysisPipeline::setConfig(const AnalysisPipelineConfig& cfg) {
    m_cfg = sanitise(cfg);
}

bool AnalysisPipeline::validInput(const msg::PixelBuffer& img) {
    if (img.data == nullptr) return false;
    if (img.width == 0 || img.height == 0) return false;
    const uint64_t row_bytes = static_cast<uint64_t>(img.width) * img.bytesPerPx();
    return img.stride >= row_bytes;
}

void AnalysisPipeline::notify(Stage s) const {
    if (m_progress.fn) m_progress.fn(s, m_progress.user);
}

bool AnalysisPipeline::classify(const PixelClassifier& classifier, const msg::PixelBuffer& img,
                                msg::ClassifiedGrid& grid, const CancelToken* cancel) const {
    const uint32_t bands = std::min(m_cfg.CLASSIFY_THREADS, img.height);
    if (bands <= 1) {
        return classifier.classify(img, grid, cancel);
    }

    grid.reset(img.width, img.height);

    // Equal row bands; the last one runs on this thread.
    std::vector<BandCtx> ctx(bands);
    const uint32_t rows_per_band = img.height / bands;
    const uint32_t extra = img.height % bands;
    uint32_t v = 0;
    for (uint32_t k = 0; k < bands; ++k) {
        const uint32_t rows = rows_per_band + (k < extra ? 1u : 0u);
        ctx[k].classifier = &classifier;
        ctx[k].img = &img;
        ctx[k].grid = &grid;
        ctx[k].cancel = cancel;
        ctx[k].v_begin = v;
        ctx[k].v_end = v + rows;
        v += rows;
    }

    std::vector<Rtos::Task> workers(bands - 1);
    std::vector<bool> spawned(bands - 1, false);
    for (uint32_t k = 0; k + 1 < bands; ++k) {
        spawned[k] = workers[k].Create("classify_band", BandEntry, &ctx[k]);
    }

    BandEntry(&ctx[bands - 1]);

    bool ok = ctx[bands - 1].ok;
    for (uint32_t k = 0; k + 1 < bands; ++k) {
        if (spawned[k]) {
            workers[k].Join();
        } else {
            // Could not start a thread: do the band here.
            BandEntry(&ctx[k]);
        }
        ok = ok && ctx[k].ok;
    }
    return ok;
}

AnalysisPipeline::Status AnalysisPipeline::analyze(const msg::PixelBuffer& img, msg::AnalysisReport& out,
                                                   std::vector<msg::Region>* regions_out,
                                                   const CancelToken* cancel) const {
    // ---- Validation (before any pixel work) ----
    if (!validInput(img)) {
        std::cerr << "[PIPELINE] rejected: INVALID_INPUT (w=" << img.width << " h=" << img.height
                  << " stride=" << img.stride << (img.data ? "" : " data=null") << ")\n";
        return Status::INVALID_INPUT;
    }

    const ConfigStatus cs = validate(m_cfg.CLASSIFY);
    if (cs != ConfigStatus::OK) {
        std::cerr << "[PIPELINE] rejected: UNSUPPORTED_CONFIG (" << ConfigStatusStr(cs) << ")\n";
        return Status::UNSUPPORTED_CONFIG;
    }

    // ---- Classification ----
    notify(Stage::CLASSIFY);
    const PixelClassifier classifier(m_cfg.CLASSIFY);
    msg::ClassifiedGrid grid;
    if (!classify(classifier, img, grid, cancel)) {
        std::cerr << "[PIPELINE] cancelled during " << StageStr(Stage::CLASSIFY) << "\n";
        return Status::CANCELLED;
    }

    // ---- Labeling, one pass per category ----
    notify(Stage::LABEL);
    const RegionLabeler labeler{};
    std::array<LabelMap, std::size(msg::REGION_CATEGORIES)> maps;
    for (std::size_t k = 0; k < maps.size(); ++k) {
        maps[k].category = msg::REGION_CATEGORIES[k];
        if (!labeler.labelMap(grid, maps[k].category, maps[k].labels, maps[k].count, cancel)) {
            std::cerr << "[PIPELINE] cancelled during " << StageStr(Stage::LABEL) << "\n";
            return Status::CANCELLED;
        }
    }

    // ---- Measurement: one sweep per label map ----
    notify(Stage::MEASURE);
    const GeometryMeasurer measurer{};
    for (auto& m : maps) {
        m.geometry = measurer.measure(m.labels, grid.width, grid.height, m.count);
    }

    // Per-region records only when the caller asked for them.
    std::vector<msg::Region> regions;
    if (regions_out) {
        for (const auto& m : maps) {
            std::vector<msg::Region> found;
            RegionLabeler::buildRegions(m.labels, grid.width, grid.height, m.category, m.count, found);
            for (std::size_t k = 0; k < found.size(); ++k) {
                measurer.describe(found[k], m.geometry[k]);
            }
            regions.insert(regions.end(),
                           std::make_move_iterator(found.begin()),
                           std::make_move_iterator(found.end()));
        }
    }

    // ---- Report ----
    notify(Stage::REPORT);
    msg::AnalysisReport report;
    report.width = img.width;
    report.height = img.height;
    for (const auto& m : maps) {
        GeometryMeasurer::aggregate(m.category, m.geometry, report);
    }

    out = report;
    if (regions_out) {
        *regions_out = std::move(regions);
    }
    return Status::OK;
}

} // namespace chroma
