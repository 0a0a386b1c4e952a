// core/clock/clock.cc
#include "core/clock/clock.h"

#include <chrono>

namespace idlease {

TimestampMs SystemClock::now_ms() {
    auto dur = std::chrono::system_clock::now().time_since_epoch();
    TimestampMs ms = std::chrono::duration_cast<std::chrono::milliseconds>(dur).count();

    std::lock_guard<std::mutex> g(mu_);
    if (ms < last_ms_) {
        ms = last_ms_;
    }
    last_ms_ = ms;
    return ms;
}

} // namespace idlease
