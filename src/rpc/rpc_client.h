// src/rpc/rpc_client.h
#pragma once

#include <cstdint>
#include <string>

#include "rpc/rpc_defs.h"
#include "idlease.pb.h"

namespace idlease {
namespace rpc {

/**
 * 简单同步 client：
 * - 每个 RpcClient 持有一个 TCP 连接
 * - 每次调用都是：序列化 req -> 发送一帧 -> 收一帧 -> parse rsp
 * - 不做并发、多路复用，一个 client 只能被一个线程使用
 */
class RpcClient {
public:
    RpcClient(const std::string& host, std::uint16_t port);
    ~RpcClient();

    RpcClient(const RpcClient&) = delete;
    RpcClient& operator=(const RpcClient&) = delete;

    // 显式 connect / close
    bool connect();
    void close();

    bool is_connected() const { return sock_fd_ >= 0; }

    // ---- RPC 封装 ----
    // 返回 false 表示传输失败；业务错误在 rsp.error() 里
    bool Acquire(const wire::AcquireRequest& req,
                 wire::LeaseReply& rsp);

    bool Heartbeat(const wire::HeartbeatRequest& req,
                   wire::LeaseReply& rsp);

private:
    std::string host_;
    std::uint16_t port_;
    int sock_fd_ {-1};

    static bool read_full(int fd, void* buf, size_t len);
    static bool write_full(int fd, const void* buf, size_t len);

    // 通用发送/接收 + 反序列化
    bool call(MethodId method,
              const ::google::protobuf::Message& req,
              ::google::protobuf::Message& rsp);
};

} // namespace rpc
} // namespace idlease
