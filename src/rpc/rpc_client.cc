// src/rpc/rpc_client.cc
#include "rpc/rpc_client.h"
#include "common/logging.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

namespace idlease {
namespace rpc {

RpcClient::RpcClient(const std::string& host, std::uint16_t port)
    : host_(host), port_(port) {}

RpcClient::~RpcClient() {
    close();
}

bool RpcClient::connect() {
    if (sock_fd_ >= 0) {
        return true;
    }

    sock_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (sock_fd_ < 0) {
        log(LogLevel::ERROR, "RpcClient: socket() failed: %s",
            std::strerror(errno));
        return false;
    }

    sockaddr_in addr {};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port_);
    if (::inet_pton(AF_INET, host_.c_str(), &addr.sin_addr) <= 0) {
        log(LogLevel::ERROR, "RpcClient: invalid host=%s",
            host_.c_str());
        ::close(sock_fd_);
        sock_fd_ = -1;
        return false;
    }

    if (::connect(sock_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        log(LogLevel::ERROR, "RpcClient: connect(%s:%u) failed: %s",
            host_.c_str(), port_, std::strerror(errno));
        ::close(sock_fd_);
        sock_fd_ = -1;
        return false;
    }

    log(LogLevel::DEBUG, "RpcClient connected to %s:%u",
        host_.c_str(), port_);
    return true;
}

void RpcClient::close() {
    if (sock_fd_ >= 0) {
        ::shutdown(sock_fd_, SHUT_RDWR);
        ::close(sock_fd_);
        sock_fd_ = -1;
    }
}

bool RpcClient::read_full(int fd, void* buf, size_t len) {
    std::uint8_t* p = static_cast<std::uint8_t*>(buf);
    size_t nread = 0;
    while (nread < len) {
        ssize_t r = ::read(fd, p + nread, len - nread);
        if (r < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (r == 0) {
            // peer closed
            return false;
        }
        nread += static_cast<size_t>(r);
    }
    return true;
}

bool RpcClient::write_full(int fd, const void* buf, size_t len) {
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

bool RpcClient::call(MethodId method,
                     const ::google::protobuf::Message& req,
                     ::google::protobuf::Message& rsp) {
    if (sock_fd_ < 0 && !connect()) {
        return false;
    }

    std::string payload;
    if (!req.SerializeToString(&payload)) {
        log(LogLevel::ERROR, "RpcClient: serialize request failed");
        return false;
    }

    std::uint16_t mid = htons(to_uint16(method));
    std::uint16_t reserved = 0;
    std::uint32_t len = htonl(static_cast<std::uint32_t>(
        sizeof(mid) + sizeof(reserved) + payload.size()));

    // 发送头+体，失败后连接状态未知，直接关掉
    if (!write_full(sock_fd_, &len, sizeof(len)) ||
        !write_full(sock_fd_, &mid, sizeof(mid)) ||
        !write_full(sock_fd_, &reserved, sizeof(reserved)) ||
        !write_full(sock_fd_, payload.data(), payload.size())) {
        log(LogLevel::ERROR, "RpcClient: send %s request failed: %s",
            to_string(method), std::strerror(errno));
        close();
        return false;
    }

    // 读响应 length
    std::uint32_t net_len = 0;
    if (!read_full(sock_fd_, &net_len, sizeof(net_len))) {
        log(LogLevel::ERROR, "RpcClient: read response length failed");
        close();
        return false;
    }
    std::uint32_t resp_len = ntohl(net_len);
    if (resp_len < kFrameHeaderLen || resp_len > kMaxFrameLen) {
        log(LogLevel::ERROR, "RpcClient: invalid resp length=%u", resp_len);
        close();
        return false;
    }

    // 读 method_id + reserved + payload
    std::vector<std::uint8_t> buf(resp_len);
    if (!read_full(sock_fd_, buf.data(), buf.size())) {
        log(LogLevel::ERROR, "RpcClient: read response body failed");
        close();
        return false;
    }

    std::uint16_t net_mid = 0;
    std::memcpy(&net_mid, buf.data(), sizeof(net_mid));
    MethodId resp_mid = method_from_uint16(ntohs(net_mid));

    if (resp_mid != method) {
        log(LogLevel::ERROR,
            "RpcClient: unexpected resp method=%u (expected %u)",
            static_cast<unsigned>(resp_mid),
            static_cast<unsigned>(method));
        close();
        return false;
    }

    const std::uint8_t* resp_payload = buf.data() + kFrameHeaderLen;
    size_t resp_payload_len = buf.size() - kFrameHeaderLen;

    if (!rsp.ParseFromArray(resp_payload, static_cast<int>(resp_payload_len))) {
        log(LogLevel::ERROR, "RpcClient: parse resp failed");
        return false;
    }
    return true;
}

bool RpcClient::Acquire(const wire::AcquireRequest& req,
                        wire::LeaseReply& rsp) {
    return call(MethodId::ACQUIRE, req, rsp);
}

bool RpcClient::Heartbeat(const wire::HeartbeatRequest& req,
                          wire::LeaseReply& rsp) {
    return call(MethodId::HEARTBEAT, req, rsp);
}

} // namespace rpc
} // namespace idlease
