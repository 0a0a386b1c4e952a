// core/clock/clock.h
#pragma once

#include <atomic>
#include <mutex>

#include "common/types.h"

namespace idlease {

/**
 * 时间源：返回自 epoch 起的毫秒数。
 * 通过构造函数注入到 IdAllocator，测试里换成 ManualClock。
 */
class IClock {
public:
    virtual ~IClock() = default;

    virtual TimestampMs now_ms() = 0;
};

// 系统时钟。返回值单调不减：系统时间被往回调时钳到上一次的值
class SystemClock : public IClock {
public:
    SystemClock() = default;

    TimestampMs now_ms() override;

private:
    std::mutex mu_;
    TimestampMs last_ms_ {0};
};

// 测试用，时间只在 set / advance 时变化
class ManualClock : public IClock {
public:
    explicit ManualClock(TimestampMs start_ms = 0) : now_(start_ms) {}

    TimestampMs now_ms() override { return now_.load(); }

    void set(TimestampMs ms) { now_.store(ms); }
    void advance(DurationMs delta_ms) { now_.fetch_add(delta_ms); }

private:
    std::atomic<TimestampMs> now_;
};

} // namespace idlease
