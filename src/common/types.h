#pragma once

#include <cstdint>

namespace idlease {

using LeaseId = std::uint32_t;       // 池内标识符，取值 [min, max]
using TimestampMs = std::int64_t;    // 自 Unix epoch 起的毫秒数
using DurationMs = std::int64_t;

inline constexpr LeaseId kDefaultMinId = 1;
inline constexpr LeaseId kDefaultMaxId = 65535;
inline constexpr DurationMs kDefaultTimeoutMs = 3000;

// 上限：超时最长 24h，保证 now + timeout 不会溢出；池最多 2^24 个 id
inline constexpr DurationMs kMaxTimeoutMs = 24LL * 60 * 60 * 1000;
inline constexpr std::uint64_t kMaxPoolSize = 1ULL << 24;

// Acquire / Heartbeat 成功时的结果: {id, exp}
struct LeaseGrant {
    LeaseId id {0};
    TimestampMs exp {0};
};

inline bool operator==(const LeaseGrant& a, const LeaseGrant& b) {
    return a.id == b.id && a.exp == b.exp;
}

inline bool operator!=(const LeaseGrant& a, const LeaseGrant& b) {
    return !(a == b);
}

} // namespace idlease
