#pragma once
#include <atomic>
#include <cstdint>

#include "os/rtos.hpp"

namespace chroma {

// Caller-owned cancellation flag with an optional deadline.
// Polled by the pipeline between classification rows and between
// labeling passes only. Thread-safe.
class CancelToken {
public:
    void RequestCancel() { m_cancelled.store(true); }

    // Absolute deadline on the Rtos::NowUs() clock; 0 disables it.
    void SetDeadlineUs(uint64_t deadline_us) { m_deadline_us.store(deadline_us); }

    // Deadline relative to now.
    void SetTimeoutMs(uint32_t timeout_ms) {
        m_deadline_us.store(Rtos::NowUs() + static_cast<uint64_t>(timeout_ms) * 1000ull);
    }

    bool Expired() const {
        if (m_cancelled.load()) return true;
        const uint64_t deadline = m_deadline_us.load();
        return deadline != 0 && Rtos::NowUs() >= deadline;
    }

private:
    std::atomic<bool> m_cancelled{false};
    std::atomic<uint64_t> m_deadline_us{0};
};

// Null token never expires.
inline bool Expired(const CancelToken* token) {
    return token != nullptr && token->Expired();
}

} // namespace chroma
