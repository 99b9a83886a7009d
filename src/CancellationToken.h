#pragma once

#include "DedupeErrors.h"

#include <atomic>
#include <chrono>
#include <optional>
#include <string>

// Cooperative cancellation for one batch: an explicit flag, an optional
// deadline, or both. Checked per file and per pair.
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken() = default;
    explicit CancellationToken(Clock::time_point deadline)
        : m_deadline(deadline)
    {
    }

    static CancellationToken withTimeout(std::chrono::milliseconds timeout)
    {
        return CancellationToken(Clock::now() + timeout);
    }

    void cancel() noexcept { m_cancelled.store(true, std::memory_order_relaxed); }

    bool cancelled() const noexcept
    {
        if (m_cancelled.load(std::memory_order_relaxed))
            return true;
        return m_deadline && Clock::now() >= *m_deadline;
    }

    void throwIfCancelled(char const* stage) const
    {
        if (cancelled())
            throw BatchCancelledError(std::string("batch cancelled during ") + stage);
    }

private:
    std::atomic<bool> m_cancelled { false };
    std::optional<Clock::time_point> m_deadline;
};
