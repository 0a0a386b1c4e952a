// src/rpc/rpc_defs.h
#pragma once

#include <cstddef>
#include <cstdint>

namespace idlease {
namespace rpc {

/**
 * 帧格式（请求和响应相同）:
 *   uint32 length    网络序，后面字节数
 *   uint16 method    网络序
 *   uint16 reserved  0
 *   bytes  payload   protobuf
 */
enum class MethodId : std::uint16_t {
    UNKNOWN   = 0,
    ACQUIRE   = 1,
    HEARTBEAT = 2,
};

inline constexpr std::size_t kFrameHeaderLen = sizeof(std::uint16_t) * 2;
inline constexpr std::uint32_t kMaxFrameLen = 1u << 20;

inline const char* to_string(MethodId m) {
    switch (m) {
    case MethodId::ACQUIRE:   return "Acquire";
    case MethodId::HEARTBEAT: return "Heartbeat";
    default:                  return "Unknown";
    }
}

/**
 * 把 methodId 转成枚举，非法值返回 UNKNOWN
 */
inline MethodId method_from_uint16(std::uint16_t v) {
    switch (v) {
    case 1: return MethodId::ACQUIRE;
    case 2: return MethodId::HEARTBEAT;
    default: return MethodId::UNKNOWN;
    }
}

inline std::uint16_t to_uint16(MethodId m) {
    return static_cast<std::uint16_t>(m);
}

} // namespace rpc
} // namespace idlease
