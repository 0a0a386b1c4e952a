// core/lease/lease_pool.h
#pragma once

#include <cstddef>
#include <deque>
#include <map>
#include <string>

#include "common/status.h"
#include "common/types.h"

namespace idlease {

/**
 * 标识符池：[min, max] 内每个 id 要么在 available_ 队列里，要么在 leases_ 表里，
 * 二者不重叠、不遗漏、不重复。
 *
 * - available_: FIFO，从头部取，回收的追加到尾部（最早释放的最先复用）
 * - leases_:    id -> 过期时间(ms)，有序，sweep 时按 id 升序回收
 *
 * 本类不加锁，由 IdAllocator 在同一把锁下调用；也不打日志，锁内不做 I/O。
 * 要求 min <= max，由 IdAllocator::validate 保证。
 */
class LeasePool {
public:
    LeasePool(LeaseId min_id, LeaseId max_id);

    // 回收所有 expiry <= now 的租约，返回回收数量
    std::size_t sweep_expired(TimestampMs now);

    // 先 sweep(now)，再从队头取一个 id，过期时间 now + timeout。
    // reclaimed 非空时写入本次 sweep 回收的数量
    Status acquire(TimestampMs now, DurationMs timeout, LeaseGrant& out,
                   std::size_t* reclaimed = nullptr);

    // 续约，成功时 out_exp 为新的过期时间。
    // 已过期的租约在这里顺便回收并返回 IdExpired，out_exp 为原来的过期时间
    Status renew(LeaseId id, TimestampMs now, DurationMs timeout,
                 TimestampMs& out_exp);

    LeaseId min_id() const { return min_id_; }
    LeaseId max_id() const { return max_id_; }

    std::size_t size() const {
        return min_id_ > max_id_ ? 0 : static_cast<std::size_t>(max_id_ - min_id_) + 1;
    }
    std::size_t available_count() const { return available_.size(); }
    std::size_t leased_count() const { return leases_.size(); }

    const std::deque<LeaseId>& available() const { return available_; }
    const std::map<LeaseId, TimestampMs>& leases() const { return leases_; }

    bool contains(LeaseId id) const { return id >= min_id_ && id <= max_id_; }

    // 校验分区不变式，失败时 why 给出第一个违例
    bool check_invariant(std::string* why = nullptr) const;

private:
    LeaseId min_id_;
    LeaseId max_id_;
    std::deque<LeaseId> available_;
    std::map<LeaseId, TimestampMs> leases_;
};

} // namespace idlease
