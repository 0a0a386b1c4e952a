// core/lease/id_allocator.h
#pragma once

#include <cstddef>
#include <memory>
#include <mutex>

#include "common/status.h"
#include "common/types.h"
#include "core/clock/clock.h"
#include "core/lease/lease_pool.h"

namespace idlease {

struct AllocatorOptions {
    LeaseId min_id {kDefaultMinId};
    LeaseId max_id {kDefaultMaxId};
    DurationMs timeout_ms {kDefaultTimeoutMs};
};

struct AllocatorStats {
    std::size_t size {0};
    std::size_t available {0};
    std::size_t leased {0};
};

class IIdAllocator {
public:
    virtual ~IIdAllocator() = default;

    virtual Status acquire_next(LeaseGrant& out) = 0;
    virtual Status heartbeat(LeaseId id, LeaseGrant& out) = 0;
};

/**
 * LeasePool + IClock 的同步外观。
 * 每个操作只读一次时钟，整个 sweep/修改/返回过程持有同一把锁；
 * 锁内不做 I/O（包括日志），也不回调外部。
 */
class IdAllocator : public IIdAllocator {
public:
    // 校验 opts 后构造，参数非法时返回 InvalidArgument
    static Status create(const AllocatorOptions& opts,
                         std::shared_ptr<IClock> clock,
                         std::unique_ptr<IdAllocator>& out);
    static Status validate(const AllocatorOptions& opts);

    Status acquire_next(LeaseGrant& out) override;
    Status heartbeat(LeaseId id, LeaseGrant& out) override;

    AllocatorStats stats();
    const AllocatorOptions& options() const { return opts_; }

    // 在锁内对 pool 做只读访问，测试和诊断用
    template <typename Fn>
    void inspect(Fn&& fn) {
        std::lock_guard<std::mutex> g(mu_);
        fn(static_cast<const LeasePool&>(pool_));
    }

private:
    IdAllocator(const AllocatorOptions& opts, std::shared_ptr<IClock> clock);

    AllocatorOptions opts_;
    std::shared_ptr<IClock> clock_;

    std::mutex mu_;  // 同时保护 available 队列和租约表
    LeasePool pool_;
};

} // namespace idlease
