#include "apps/chroma/BatchAnalyzer.hpp"
#include <algorithm>
#include <iostream>
#include <memory>

namespace chroma {

static inline BatchAnalyzerConfig sanitise(const BatchAnalyzerConfig& in) {
    BatchAnalyzerConfig cfg = in;
    if (cfg.WORKERS < 1) cfg.WORKERS = 1;
    if (cfg.WORKERS > 64) cfg.WORKERS = 64;
    return cfg;
}

BatchAnalyzer::BatchAnalyzer(const BatchAnalyzerConfig& cfg) : m_cfg(sanitise(cfg)) {}

void BatchAnalyzer::process(WorkerCtx& ctx, uint32_t index) {
    BatchResult& slot = (*ctx.results)[index];

    const uint64_t t0 = Rtos::NowUs();
    msg::AnalysisReport report{};
    slot.status = ctx.pipeline.analyze((*ctx.images)[index], report, nullptr, ctx.cancel);
    slot.exec_us = Rtos::NowUs() - t0;

    if (slot.status == AnalysisPipeline::Status::OK) {
        slot.report = report;
    }
    ++ctx.processed;
}

void BatchAnalyzer::WorkerEntry(void* arg) {
    auto* ctx = static_cast<WorkerCtx*>(arg);
    if (!ctx || !ctx->jobs || !ctx->images || !ctx->results) {
        return;
    }

    while (true) {
        Job job{};
        ctx->jobs->receive(job);
        if (job.stop) break;
        process(*ctx, job.index);
    }
}

bool BatchAnalyzer::run(const std::vector<msg::PixelBuffer>& images,
                        std::vector<BatchResult>& results,
                        const CancelToken* cancel) {
    results.assign(images.size(), BatchResult{});
    if (images.empty()) return true;

    const uint32_t n_workers = static_cast<uint32_t>(
        std::min<std::size_t>(m_cfg.WORKERS, images.size()));

    JobQueue jobs;
    std::vector<WorkerCtx> ctx(n_workers, WorkerCtx{AnalysisPipeline(m_cfg.PIPELINE)});
    std::unique_ptr<Rtos::Task[]> tasks(new Rtos::Task[n_workers]);

    uint32_t spawned = 0;
    for (uint32_t k = 0; k < n_workers; ++k) {
        ctx[k].jobs = &jobs;
        ctx[k].images = &images;
        ctx[k].results = &results;
        ctx[k].cancel = cancel;
        if (tasks[spawned].Create("batch_worker", WorkerEntry, &ctx[k])) {
            ++spawned;
        }
    }

    if (spawned == 0) {
        // No threads available: analyze sequentially on this one.
        std::cerr << "[BATCH] no worker task started, running inline\n";
        for (uint32_t i = 0; i < images.size(); ++i) {
            process(ctx[0], i);
        }
    } else {
        for (uint32_t i = 0; i < images.size(); ++i) {
            jobs.send(Job{i, false});
        }
        for (uint32_t k = 0; k < spawned; ++k) {
            jobs.send(Job{0, true});
        }
        for (uint32_t k = 0; k < spawned; ++k) {
            tasks[k].Join();
        }
    }

    uint32_t ok = 0;
    for (const auto& r : results) {
        if (r.status == AnalysisPipeline::Status::OK) ++ok;
    }
    std::cout << "[BATCH] images=" << images.size() << " ok=" << ok
              << " workers=" << (spawned == 0 ? 1u : spawned) << "\n";
    return ok == images.size();
}

} // namespace chroma
