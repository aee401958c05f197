// test/chroma_batch_test.cpp
//
// BatchAnalyzer test: a mixed batch (valid, invalid and repeated images)
// through several worker tasks must give the same per-image result as
// analysing each image alone, in input order.

#include <iostream>
#include <string>
#include <vector>

#include "apps/chroma/AnalysisPipeline.hpp"
#include "apps/chroma/BatchAnalyzer.hpp"

#include "check.hpp"

using chroma::AnalysisPipeline;
using chroma::BatchAnalyzer;
using chroma::BatchAnalyzerConfig;
using chroma::BatchResult;
using Status = chroma::AnalysisPipeline::Status;

using test::check;

// Square of red side `red`, then a blue bar of length `blue`, on black.
static std::vector<uint8_t> make_bytes(uint32_t w, uint32_t h, uint32_t red, uint32_t blue) {
    std::vector<uint8_t> px(static_cast<std::size_t>(w) * h * 3, 0);
    for (uint32_t v = 0; v < red && v < h; ++v) {
        for (uint32_t u = 0; u < red && u < w; ++u) {
            px[(v * w + u) * 3 + 0] = 255;
        }
    }
    const uint32_t row = h - 1;
    for (uint32_t u = 0; u < blue && u < w; ++u) {
        px[(row * w + u) * 3 + 2] = 255;
    }
    return px;
}

static msg::PixelBuffer view(const std::vector<uint8_t>& px, uint32_t w, uint32_t h) {
    msg::PixelBuffer b;
    b.data = px.data();
    b.width = w;
    b.height = h;
    b.stride = w * 3;
    return b;
}

int main() {
    const uint32_t W = 40, H = 30;

    // 20 images: more than the job queue holds, so the feeder blocks.
    std::vector<std::vector<uint8_t>> storage;
    for (uint32_t k = 0; k < 20; ++k) {
        storage.push_back(make_bytes(W, H, k % 7, k % 5));
    }
    std::vector<msg::PixelBuffer> images;
    for (const auto& px : storage) images.push_back(view(px, W, H));

    // One bad image in the middle.
    images[9].data = nullptr;

    BatchAnalyzerConfig cfg;
    cfg.WORKERS = 4;
    cfg.PIPELINE.CLASSIFY_THREADS = 2;
    BatchAnalyzer batch(cfg);

    std::vector<BatchResult> results;
    const bool all_ok = batch.run(images, results);
    check(!all_ok, __LINE__, "!all_ok");
    check(results.size() == images.size(), __LINE__, "results.size() == images.size()");

    const AnalysisPipeline reference(cfg.PIPELINE);
    for (std::size_t i = 0; i < images.size() && i < results.size(); ++i) {
        msg::AnalysisReport expected;
        const Status st = reference.analyze(images[i], expected);
        check(results[i].status == st, __LINE__, "results[i].status == st");
        if (st == Status::OK) {
            check(results[i].report == expected, __LINE__, "results[i].report == expected");
        }
    }
    check(results[9].status == Status::INVALID_INPUT, __LINE__, "results[9].status == Status::INVALID_INPUT");

    // k = 3: 3x3 red square, 3-cell blue bar.
    check(results[3].report.of(msg::Category::RED).area == 9, __LINE__, "results[3].report.of(msg::Category::RED).area == 9");
    check(results[3].report.of(msg::Category::RED).perimeter == 12, __LINE__, "results[3].report.of(msg::Category::RED).perimeter == 12");
    check(results[3].report.of(msg::Category::BLUE).area == 3, __LINE__, "results[3].report.of(msg::Category::BLUE).area == 3");
    std::cout << "[TEST] mixed batch done\n";

    // All-valid batch, one worker.
    images[9] = view(storage[9], W, H);
    cfg.WORKERS = 1;
    BatchAnalyzer single(cfg);
    check(single.run(images, results), __LINE__, "single.run(images, results)");
    check(results[9].status == Status::OK, __LINE__, "results[9].status == Status::OK");

    // Empty batch
    std::vector<msg::PixelBuffer> none;
    check(single.run(none, results), __LINE__, "single.run(none, results)");
    check(results.empty(), __LINE__, "results.empty()");

    // Cancelled batch: every image reports CANCELLED.
    chroma::CancelToken token;
    token.RequestCancel();
    check(!batch.run(images, results, &token), __LINE__, "!batch.run(images, results, &token)");
    for (const auto& r : results) check(r.status == Status::CANCELLED, __LINE__, "r.status == Status::CANCELLED");

    // Worker count clamp
    cfg.WORKERS = 0;
    check(BatchAnalyzer(cfg).getConfig().WORKERS == 1, __LINE__, "BatchAnalyzer(cfg).getConfig().WORKERS == 1");
    std::cout << "[TEST] edge batches done\n";

    return test::finish();
}
