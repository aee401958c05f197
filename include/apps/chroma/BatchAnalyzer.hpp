#pragma once
#include <cstdint>
#include <vector>

#include "os/rtos.hpp"
#include "msg/PixelBuffer.hpp"
#include "msg/AnalysisReport.hpp"
#include "apps/chroma/AnalysisPipeline.hpp"
#include "apps/chroma/CancelToken.hpp"

namespace chroma {

struct BatchAnalyzerConfig {
    AnalysisPipelineConfig PIPELINE{};
    uint32_t WORKERS = 2;   // worker tasks, each with its own pipeline
};

struct BatchResult {
    AnalysisPipeline::Status status = AnalysisPipeline::Status::INVALID_INPUT;
    msg::AnalysisReport report{};
    uint64_t exec_us = 0;   // time spent in analyze()
};

// ---------------------------------------------------------------------------
// BatchAnalyzer: fans independent images out to worker tasks.
//
// The caller's thread feeds image indices through a bounded job queue;
// workers pull, analyze and write into results[index]. Every slot has a
// single writer, so the queue is the only synchronised object.
// ---------------------------------------------------------------------------
class BatchAnalyzer {
public:
    explicit BatchAnalyzer(const BatchAnalyzerConfig& cfg = {});

    const BatchAnalyzerConfig& getConfig() const { return m_cfg; }

    // results[i] belongs to images[i]. Returns true when every image was OK.
    // Images must stay alive until run() returns.
    bool run(const std::vector<msg::PixelBuffer>& images,
             std::vector<BatchResult>& results,
             const CancelToken* cancel = nullptr);

private:
    struct Job {
        uint32_t index = 0;
        bool stop = false;   // poison pill, one per worker
    };

    static constexpr std::size_t JOB_QUEUE_DEPTH = 16;
    using JobQueue = Rtos::Queue<Job, JOB_QUEUE_DEPTH>;

    struct WorkerCtx {
        AnalysisPipeline pipeline;
        JobQueue* jobs = nullptr;
        const std::vector<msg::PixelBuffer>* images = nullptr;
        std::vector<BatchResult>* results = nullptr;
        const CancelToken* cancel = nullptr;
        uint32_t processed = 0;
    };

    static void WorkerEntry(void* arg);
    static void process(WorkerCtx& ctx, uint32_t index);

    BatchAnalyzerConfig m_cfg{};
};

} // namespace chroma
