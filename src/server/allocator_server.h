#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "core/clock/clock.h"
#include "core/lease/id_allocator.h"
#include "rpc/lease_service.h"
#include "rpc/rpc_server.h"
#include "server/server_config.h"

namespace idlease {

class AllocatorServer {
public:
    // clock 为空时使用 SystemClock
    explicit AllocatorServer(const ServerConfig& cfg,
                             std::shared_ptr<IClock> clock = nullptr);
    ~AllocatorServer();

    int init();
    int start();
    int stop();

    std::uint16_t port() const;
    std::shared_ptr<IdAllocator> allocator() const { return allocator_; }

private:
    ServerConfig cfg_;
    std::shared_ptr<IClock> clock_;

    std::shared_ptr<IdAllocator> allocator_;
    std::shared_ptr<ILeaseService> service_;
    std::unique_ptr<rpc::RpcServer> rpc_server_;

    bool running_ {false};
};

} // namespace idlease
