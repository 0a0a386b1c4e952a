// core/lease/lease_pool.cc
#include "core/lease/lease_pool.h"

#include <cstdint>
#include <vector>

namespace idlease {

LeasePool::LeasePool(LeaseId min_id, LeaseId max_id)
    : min_id_(min_id), max_id_(max_id) {
    // 用 64 位计数，max_id 为 UINT32_MAX 或 min > max 时都不会回绕
    for (std::uint64_t id = min_id_; id <= max_id_; ++id) {
        available_.push_back(static_cast<LeaseId>(id));
    }
}

std::size_t LeasePool::sweep_expired(TimestampMs now) {
    // std::map 按 id 升序迭代，同时过期的多个 id 按升序追加到队尾
    std::size_t reclaimed = 0;
    for (auto it = leases_.begin(); it != leases_.end();) {
        if (it->second <= now) {
            available_.push_back(it->first);
            it = leases_.erase(it);
            ++reclaimed;
        } else {
            ++it;
        }
    }
    return reclaimed;
}

Status LeasePool::acquire(TimestampMs now, DurationMs timeout, LeaseGrant& out,
                         std::size_t* reclaimed) {
    std::size_t n = sweep_expired(now);
    if (reclaimed) {
        *reclaimed = n;
    }

    if (available_.empty()) {
        return Status::NoIdAvailable();
    }

    LeaseId id = available_.front();
    TimestampMs exp = now + timeout;
    auto res = leases_.emplace(id, exp);
    if (!res.second) {
        // 队列里的 id 同时出现在租约表中，说明不变式已被破坏，不能把它发出去
        return Status::Internal("lease pool invariant violated: id " + std::to_string(id) +
                                " in available queue is already leased");
    }
    available_.pop_front();

    out.id = id;
    out.exp = exp;
    return Status::OK();
}

Status LeasePool::renew(LeaseId id, TimestampMs now, DurationMs timeout,
                        TimestampMs& out_exp) {
    auto it = leases_.find(id);
    if (it == leases_.end()) {
        return Status::IdNonexistent();
    }

    if (it->second > now) {
        it->second = now + timeout;
        out_exp = it->second;
        return Status::OK();
    }

    // 已过期但还没被 sweep 掉：这里回收。
    // 注意持有者在 expiry 之后可能仍在使用该 id，这段时间内如果 id 被别人拿走就是共享了。
    // 同样，如果别人已经重新拿到这个 id，旧持有者的 renew 会续到别人的租约上，这里无法区分。
    out_exp = it->second;
    leases_.erase(it);
    available_.push_back(id);
    return Status::IdExpired();
}

bool LeasePool::check_invariant(std::string* why) const {
    auto fail = [why](const std::string& msg) {
        if (why) {
            *why = msg;
        }
        return false;
    };

    if (available_.size() + leases_.size() != size()) {
        return fail("available(" + std::to_string(available_.size()) + ") + leased(" +
                    std::to_string(leases_.size()) + ") != pool size(" +
                    std::to_string(size()) + ")");
    }

    std::vector<bool> seen(size(), false);
    for (LeaseId id : available_) {
        if (!contains(id)) {
            return fail("available id " + std::to_string(id) + " out of range");
        }
        std::size_t slot = id - min_id_;
        if (seen[slot]) {
            return fail("id " + std::to_string(id) + " duplicated in available queue");
        }
        seen[slot] = true;
    }
    for (const auto& kv : leases_) {
        if (!contains(kv.first)) {
            return fail("leased id " + std::to_string(kv.first) + " out of range");
        }
        std::size_t slot = kv.first - min_id_;
        if (seen[slot]) {
            return fail("id " + std::to_string(kv.first) + " both available and leased");
        }
        seen[slot] = true;
    }
    return true;
}

} // namespace idlease
