// src/rpc/rpc_server.h
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "rpc/lease_service.h"
#include "rpc/rpc_defs.h"

namespace idlease {
namespace rpc {

class RpcServer {
public:
    explicit RpcServer(std::shared_ptr<ILeaseService> service);
    ~RpcServer();

    // bind_addr 例如 "0.0.0.0"；port 为 0 时由内核分配，用 bound_port() 取实际端口
    int start(const std::string& bind_addr, std::uint16_t port);
    int stop();

    bool running() const { return running_; }
    std::uint16_t bound_port() const { return bound_port_; }

    // 尚未回收的连接线程数（包括已结束但还没被 join 的）
    std::size_t worker_count();

private:
    std::shared_ptr<ILeaseService> service_;
    int listen_fd_ {-1};
    std::uint16_t bound_port_ {0};
    std::atomic<bool> running_ {false};
    std::thread accept_thread_;

    // 连接线程结束时置 done，accept 新连接前 join 掉已结束的
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    std::mutex conns_mu_;  // 保护 client_fds_ 和 workers_
    std::set<int> client_fds_;
    std::list<Worker> workers_;

    void accept_loop();
    void reap_finished_workers();

    void handle_client(int client_fd, std::shared_ptr<std::atomic<bool>> done);

    // Tool: 读写固定长度数据
    static bool read_full(int fd, void* buf, size_t len);
    static bool write_full(int fd, const void* buf, size_t len);

    // 处理单个 RPC 请求帧，返回 false 表示连接应关闭
    bool handle_one_request(int client_fd);

    bool write_reply(int client_fd, MethodId mid,
                     const ::google::protobuf::Message& rsp);
};

} // namespace rpc
} // namespace idlease
