#pragma once
#include <cstdint>
#include <vector>

#include "msg/PixelBuffer.hpp"
#include "msg/ClassifiedGrid.hpp"
#include "msg/Region.hpp"
#include "msg/AnalysisReport.hpp"

#include "apps/chroma/CancelToken.hpp"
#include "apps/chroma/PixelClassifier.hpp"
#include "apps/chroma/RegionLabeler.hpp"
#include "apps/chroma/GeometryMeasurer.hpp"

namespace chroma {

// ---------------------------------------------------------------------------
// Configuration for one AnalysisPipeline (tunable parameters, no state).
// ---------------------------------------------------------------------------
struct AnalysisPipelineConfig {
    ClassificationConfig CLASSIFY{};

    // Row bands classified concurrently. 1 = inline on the caller's thread.
    // The report does not depend on this value.
    uint32_t CLASSIFY_THREADS = 1;
};

enum class Stage : uint8_t {
    CLASSIFY = 0,   // pixels -> categories
    LABEL,          // categories -> regions
    MEASURE,        // regions -> area/perimeter
    REPORT,         // per-category totals
};

const char* StageStr(Stage s);

// Optional observer, called on the analyzing thread as each stage starts.
struct ProgressHook {
    void (*fn)(Stage stage, void* user) = nullptr;
    void* user = nullptr;
};

// ---------------------------------------------------------------------------
// AnalysisPipeline: classify -> label -> measure -> report for one image.
// analyze() is const and keeps all per-run state on its own stack, so one
// pipeline may serve several threads at once.
// ---------------------------------------------------------------------------
class AnalysisPipeline {
public:
    enum class Status : uint8_t {
        OK = 0,
        INVALID_INPUT,        // zero dimension, null data, stride < row size
        UNSUPPORTED_CONFIG,   // see ConfigStatus
        CANCELLED,            // token fired or deadline passed
    };

    static const char* StatusStr(Status s);

    explicit AnalysisPipeline(const AnalysisPipelineConfig& cfg = {});

    void setConfig(const AnalysisPipelineConfig& cfg);
    const AnalysisPipelineConfig& getConfig() const { return m_cfg; }

    void setProgressHook(const ProgressHook& hook) { m_progress = hook; }

    // Validation of the current configuration (no pixel work).
    ConfigStatus configStatus() const { return validate(m_cfg.CLASSIFY); }

    static bool validInput(const msg::PixelBuffer& img);

    // Core API: consume one PixelBuffer, produce one AnalysisReport.
    // `out` (and `regions_out` when given) are written only on OK.
    // Regions come RED first then BLUE, each in row-major enumeration order.
    Status analyze(const msg::PixelBuffer& img, msg::AnalysisReport& out,
                   std::vector<msg::Region>* regions_out = nullptr,
                   const CancelToken* cancel = nullptr) const;

private:
    AnalysisPipelineConfig m_cfg{};
    ProgressHook m_progress{};

    void notify(Stage s) const;

    bool classify(const PixelClassifier& classifier, const msg::PixelBuffer& img,
                  msg::ClassifiedGrid& grid, const CancelToken* cancel) const;
};

} // namespace chroma
