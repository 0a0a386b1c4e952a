#include "server/allocator_server.h"
#include "common/logging.h"
#include "rpc/lease_service_impl.h"

#include <utility>

namespace idlease {

AllocatorServer::AllocatorServer(const ServerConfig& cfg, std::shared_ptr<IClock> clock)
    : cfg_(cfg), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = std::make_shared<SystemClock>();
    }
}

AllocatorServer::~AllocatorServer() {
    if (running_) {
        stop();
    }
}

int AllocatorServer::init() {
    Status st = validate_config(cfg_);
    if (!st.ok()) {
        log(LogLevel::ERROR, "invalid config: %s", st.message().c_str());
        return st.code();
    }

    std::unique_ptr<IdAllocator> alloc;
    st = IdAllocator::create(cfg_.pool, clock_, alloc);
    if (!st.ok()) {
        log(LogLevel::ERROR, "Failed to create IdAllocator: %s", st.message().c_str());
        return st.code();
    }
    allocator_ = std::move(alloc);

    service_ = std::make_shared<LeaseServiceImpl>(allocator_);
    rpc_server_ = std::make_unique<rpc::RpcServer>(service_);
    return 0;
}

int AllocatorServer::start() {
    if (!rpc_server_) {
        log(LogLevel::ERROR, "AllocatorServer: start() called before init()");
        return -1;
    }

    int rc = rpc_server_->start(cfg_.bind, cfg_.port);
    if (rc != 0) {
        log(LogLevel::ERROR, "start RPC server failed rc=%d", rc);
        return rc;
    }
    running_ = true;

    log(LogLevel::INFO, "AllocatorServer started on %s:%u",
        cfg_.bind.c_str(), rpc_server_->bound_port());
    return 0;
}

int AllocatorServer::stop() {
    if (!running_) return 0;

    if (rpc_server_) {
        rpc_server_->stop();
    }
    running_ = false;

    AllocatorStats s = allocator_->stats();
    log(LogLevel::INFO, "AllocatorServer stopped (leased=%zu available=%zu)",
        s.leased, s.available);
    return 0;
}

std::uint16_t AllocatorServer::port() const {
    return rpc_server_ ? rpc_server_->bound_port() : 0;
}

} // namespace idlease
