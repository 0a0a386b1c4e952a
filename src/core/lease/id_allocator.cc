// core/lease/id_allocator.cc
#include "core/lease/id_allocator.h"
#include "common/logging.h"

#include <cstdint>
#include <string>
#include <utility>

namespace idlease {

IdAllocator::IdAllocator(const AllocatorOptions& opts, std::shared_ptr<IClock> clock)
    : opts_(opts),
      clock_(std::move(clock)),
      pool_(opts.min_id, opts.max_id) {}

Status IdAllocator::validate(const AllocatorOptions& opts) {
    if (opts.min_id > opts.max_id) {
        return Status::InvalidArgument("min id " + std::to_string(opts.min_id) +
                                       " is greater than max id " +
                                       std::to_string(opts.max_id));
    }
    std::uint64_t pool_size = static_cast<std::uint64_t>(opts.max_id) - opts.min_id + 1;
    if (pool_size > kMaxPoolSize) {
        return Status::InvalidArgument("pool size " + std::to_string(pool_size) +
                                       " exceeds limit " + std::to_string(kMaxPoolSize));
    }
    if (opts.timeout_ms <= 0 || opts.timeout_ms > kMaxTimeoutMs) {
        return Status::InvalidArgument("lease timeout must be in 1.." +
                                       std::to_string(kMaxTimeoutMs) + " ms, got " +
                                       std::to_string(opts.timeout_ms));
    }
    return Status::OK();
}

Status IdAllocator::create(const AllocatorOptions& opts,
                           std::shared_ptr<IClock> clock,
                           std::unique_ptr<IdAllocator>& out) {
    Status st = validate(opts);
    if (!st.ok()) {
        return st;
    }
    if (!clock) {
        return Status::InvalidArgument("clock is null");
    }
    // 构造函数私有，只能经过这里的校验
    out.reset(new IdAllocator(opts, std::move(clock)));
    log(LogLevel::INFO, "IdAllocator: pool=[%u, %u] size=%zu timeout=%lldms",
        opts.min_id, opts.max_id, out->pool_.size(),
        static_cast<long long>(opts.timeout_ms));
    return Status::OK();
}

// 日志都在锁外打，锁内只改 pool

Status IdAllocator::acquire_next(LeaseGrant& out) {
    TimestampMs now = clock_->now_ms();

    Status st = Status::OK();
    LeaseGrant grant;
    std::size_t reclaimed = 0;
    std::size_t available = 0;
    {
        std::lock_guard<std::mutex> g(mu_);
        st = pool_.acquire(now, opts_.timeout_ms, grant, &reclaimed);
        available = pool_.available_count();
    }

    if (reclaimed > 0) {
        log(LogLevel::DEBUG, "acquire_next: now=%lld swept %zu expired lease(s)",
            static_cast<long long>(now), reclaimed);
    }
    if (st.ok()) {
        out = grant;
        log(LogLevel::DEBUG, "acquire_next: id=%u exp=%lld available=%zu",
            out.id, static_cast<long long>(out.exp), available);
    } else if (st.code() == Status::kNoIdAvailable) {
        log(LogLevel::DEBUG, "acquire_next: pool exhausted");
    } else {
        log(LogLevel::ERROR, "acquire_next: %s", st.message().c_str());
    }
    return st;
}

Status IdAllocator::heartbeat(LeaseId id, LeaseGrant& out) {
    TimestampMs now = clock_->now_ms();

    Status st = Status::OK();
    TimestampMs exp = 0;
    {
        std::lock_guard<std::mutex> g(mu_);
        st = pool_.renew(id, now, opts_.timeout_ms, exp);
    }

    if (st.code() == Status::kIdExpired) {
        // 持有者在过期后可能还在用这个 id
        log(LogLevel::WARN, "heartbeat: id=%u expired at %lld (now=%lld), reclaimed",
            id, static_cast<long long>(exp), static_cast<long long>(now));
        return st;
    }
    if (!st.ok()) {
        log(LogLevel::DEBUG, "heartbeat: id=%u failed code=%d", id, st.code());
        return st;
    }
    out.id = id;
    out.exp = exp;
    return st;
}

AllocatorStats IdAllocator::stats() {
    std::lock_guard<std::mutex> g(mu_);
    AllocatorStats s;
    s.size = pool_.size();
    s.available = pool_.available_count();
    s.leased = pool_.leased_count();
    return s;
}

} // namespace idlease
