#pragma once

#include <cstdint>
#include <functional>
#include <core/constants.hpp>
#include <core/utils.hpp>

// Rate limiter for progress events: at most one per interval, with the final
// event (done == total) always let through.
class ProgressThrottle {
public:
    using Clock = std::function<int64_t()>;

    explicit ProgressThrottle(int interval_ms = PROGRESS_THROTTLE_MS, Clock clock = nullptr)
        : interval_ms_(interval_ms), clock_(clock ? std::move(clock) : Clock(now_ms)) {}

    bool should_emit(uint64_t done, uint64_t total) {
        int64_t now = clock_();
        if (done >= total || last_ < 0 || now - last_ >= interval_ms_) {
            last_ = now;
            return true;
        }
        return false;
    }

private:
    int interval_ms_;
    Clock clock_;
    int64_t last_ = -1;
};
