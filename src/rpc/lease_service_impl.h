// src/rpc/lease_service_impl.h
#pragma once

#include <memory>

#include "rpc/lease_service.h"
#include "core/lease/id_allocator.h"
#include "common/status.h"
#include "common/types.h"

namespace idlease {

class LeaseServiceImpl : public ILeaseService {
public:
    explicit LeaseServiceImpl(std::shared_ptr<IIdAllocator> allocator);

    void Acquire(const wire::AcquireRequest& req,
                 wire::LeaseReply& rsp) override;

    void Heartbeat(const wire::HeartbeatRequest& req,
                   wire::LeaseReply& rsp) override;

    // Status -> LeaseReply: ok 填 grant，否则填 error{code, msg}
    static void fill_reply(const Status& st, const LeaseGrant& grant,
                           wire::LeaseReply& rsp);

private:
    std::shared_ptr<IIdAllocator> allocator_;
};

} // namespace idlease
