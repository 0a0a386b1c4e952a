// src/rpc/rpc_server.cc
#include "rpc/rpc_server.h"
#include "common/logging.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <iterator>
#include <utility>

namespace idlease {
namespace rpc {

RpcServer::RpcServer(std::shared_ptr<ILeaseService> service)
    : service_(std::move(service)) {}

RpcServer::~RpcServer() {
    stop();
}

int RpcServer::start(const std::string& bind_addr, std::uint16_t port) {
    if (running_) {
        return 0;
    }

    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd_ < 0) {
        log(LogLevel::ERROR, "RpcServer: socket() failed: %s",
            std::strerror(errno));
        return -1;
    }

    int opt = 1;
    if (::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        log(LogLevel::WARN, "RpcServer: setsockopt(SO_REUSEADDR) failed: %s",
            std::strerror(errno));
    }

    sockaddr_in addr {};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (::inet_pton(AF_INET, bind_addr.c_str(), &addr.sin_addr) <= 0) {
        log(LogLevel::ERROR, "RpcServer: invalid bind_addr=%s",
            bind_addr.c_str());
        ::close(listen_fd_);
        listen_fd_ = -1;
        return -1;
    }

    if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        log(LogLevel::ERROR, "RpcServer: bind(%s:%u) failed: %s",
            bind_addr.c_str(), port, std::strerror(errno));
        ::close(listen_fd_);
        listen_fd_ = -1;
        return -1;
    }

    if (::listen(listen_fd_, 128) < 0) {
        log(LogLevel::ERROR, "RpcServer: listen failed: %s",
            std::strerror(errno));
        ::close(listen_fd_);
        listen_fd_ = -1;
        return -1;
    }

    sockaddr_in bound {};
    socklen_t bound_len = sizeof(bound);
    if (::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = port;
    }

    running_ = true;
    accept_thread_ = std::thread(&RpcServer::accept_loop, this);

    log(LogLevel::INFO, "RpcServer started at %s:%u",
        bind_addr.c_str(), bound_port_);
    return 0;
}

int RpcServer::stop() {
    if (!running_) {
        return 0;
    }
    running_ = false;

    if (listen_fd_ >= 0) {
        ::shutdown(listen_fd_, SHUT_RDWR);
        ::close(listen_fd_);
        listen_fd_ = -1;
    }

    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    // 唤醒阻塞在 read 上的连接线程，fd 由各自线程关闭
    {
        std::lock_guard<std::mutex> g(conns_mu_);
        for (int fd : client_fds_) {
            ::shutdown(fd, SHUT_RDWR);
        }
    }

    std::list<Worker> workers;
    {
        std::lock_guard<std::mutex> g(conns_mu_);
        workers.swap(workers_);
    }
    for (auto& w : workers) {
        if (w.thread.joinable()) {
            w.thread.join();
        }
    }

    log(LogLevel::INFO, "RpcServer stopped");
    return 0;
}

void RpcServer::accept_loop() {
    while (running_) {
        sockaddr_in cli_addr {};
        socklen_t cli_len = sizeof(cli_addr);

        int client_fd = ::accept(listen_fd_, reinterpret_cast<sockaddr*>(&cli_addr), &cli_len);
        if (client_fd < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (!running_) {
                break;
            }
            log(LogLevel::ERROR, "RpcServer: accept failed: %s",
                std::strerror(errno));
            continue;
        }

        char peer[INET_ADDRSTRLEN] = {0};
        ::inet_ntop(AF_INET, &cli_addr.sin_addr, peer, sizeof(peer));
        log(LogLevel::DEBUG, "RpcServer: accepted %s:%u fd=%d",
            peer, ntohs(cli_addr.sin_port), client_fd);

        reap_finished_workers();

        // 简单：每个连接一个线程
        auto done = std::make_shared<std::atomic<bool>>(false);
        std::lock_guard<std::mutex> g(conns_mu_);
        client_fds_.insert(client_fd);
        workers_.push_back(Worker{
            std::thread(&RpcServer::handle_client, this, client_fd, done), done});
    }
}

void RpcServer::reap_finished_workers() {
    std::list<Worker> finished;
    {
        std::lock_guard<std::mutex> g(conns_mu_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (it->done->load()) {
                auto next = std::next(it);
                finished.splice(finished.end(), workers_, it);
                it = next;
            } else {
                ++it;
            }
        }
    }
    // 锁外 join，线程已经跑完，不会阻塞
    for (auto& w : finished) {
        if (w.thread.joinable()) {
            w.thread.join();
        }
    }
}

std::size_t RpcServer::worker_count() {
    reap_finished_workers();
    std::lock_guard<std::mutex> g(conns_mu_);
    return workers_.size();
}

void RpcServer::handle_client(int client_fd, std::shared_ptr<std::atomic<bool>> done) {
    // 一个连接上顺序处理多个请求，直到对端关闭或出错
    while (running_) {
        if (!handle_one_request(client_fd)) {
            break;
        }
    }

    {
        std::lock_guard<std::mutex> g(conns_mu_);
        client_fds_.erase(client_fd);
    }
    ::close(client_fd);
    done->store(true);
}

bool RpcServer::read_full(int fd, void* buf, size_t len) {
    std::uint8_t* p = static_cast<std::uint8_t*>(buf);
    size_t nread = 0;
    while (nread < len) {
        ssize_t r = ::read(fd, p + nread, len - nread);
        if (r < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (r == 0) {
            // 对端关闭
            return false;
        }
        nread += static_cast<size_t>(r);
    }
    return true;
}

bool RpcServer::write_full(int fd, const void* buf, size_t len) {
    const std::uint8_t* p = static_cast<const std::uint8_t*>(buf);
    size_t nwritten = 0;
    while (nwritten < len) {
        ssize_t r = ::send(fd, p + nwritten, len - nwritten, MSG_NOSIGNAL);
        if (r < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (r == 0) {
            return false;
        }
        nwritten += static_cast<size_t>(r);
    }
    return true;
}

bool RpcServer::write_reply(int client_fd, MethodId mid,
                            const ::google::protobuf::Message& rsp) {
    std::string out;
    if (!rsp.SerializeToString(&out)) {
        log(LogLevel::ERROR, "Serialize %s response failed", to_string(mid));
        return false;
    }

    std::uint16_t out_mid = htons(to_uint16(mid));
    std::uint16_t out_reserved = 0;
    std::uint32_t out_len = htonl(static_cast<std::uint32_t>(
        sizeof(out_mid) + sizeof(out_reserved) + out.size()));

    if (!write_full(client_fd, &out_len, sizeof(out_len))) return false;
    if (!write_full(client_fd, &out_mid, sizeof(out_mid))) return false;
    if (!write_full(client_fd, &out_reserved, sizeof(out_reserved))) return false;
    if (!write_full(client_fd, out.data(), out.size())) return false;
    return true;
}

bool RpcServer::handle_one_request(int client_fd) {
    // 1. 读取 4 字节 length
    std::uint32_t net_len = 0;
    if (!read_full(client_fd, &net_len, sizeof(net_len))) {
        // 连接关闭或错误
        return false;
    }
    std::uint32_t len = ntohl(net_len);
    if (len < kFrameHeaderLen || len > kMaxFrameLen) {
        log(LogLevel::ERROR, "RpcServer: invalid frame length=%u", len);
        return false;
    }

    // 2. 读取 method_id + reserved + payload
    std::vector<std::uint8_t> buf(len);
    if (!read_full(client_fd, buf.data(), buf.size())) {
        return false;
    }

    std::uint16_t net_mid = 0;
    std::memcpy(&net_mid, buf.data(), sizeof(net_mid));
    MethodId mid = method_from_uint16(ntohs(net_mid));

    const std::uint8_t* payload = buf.data() + kFrameHeaderLen;
    size_t payload_len = buf.size() - kFrameHeaderLen;

    log(LogLevel::DEBUG, "RpcServer: received method=%s payload_len=%zu",
        to_string(mid), payload_len);

    switch (mid) {
    case MethodId::ACQUIRE: {
        wire::AcquireRequest req;
        if (!req.ParseFromArray(payload, static_cast<int>(payload_len))) {
            log(LogLevel::ERROR, "Parse AcquireRequest failed");
            return false;
        }
        wire::LeaseReply rsp;
        service_->Acquire(req, rsp);
        return write_reply(client_fd, mid, rsp);
    }
    case MethodId::HEARTBEAT: {
        wire::HeartbeatRequest req;
        if (!req.ParseFromArray(payload, static_cast<int>(payload_len))) {
            log(LogLevel::ERROR, "Parse HeartbeatRequest failed");
            return false;
        }
        wire::LeaseReply rsp;
        service_->Heartbeat(req, rsp);
        return write_reply(client_fd, mid, rsp);
    }
    default:
        log(LogLevel::ERROR, "RpcServer: unknown method id=%u",
            static_cast<unsigned>(ntohs(net_mid)));
        return false;
    }
}

} // namespace rpc
} // namespace idlease
