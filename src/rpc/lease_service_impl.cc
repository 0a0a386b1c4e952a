// src/rpc/lease_service_impl.cc
#include "rpc/lease_service_impl.h"
#include "common/logging.h"

#include <utility>

namespace idlease {

LeaseServiceImpl::LeaseServiceImpl(std::shared_ptr<IIdAllocator> allocator)
    : allocator_(std::move(allocator)) {}

void LeaseServiceImpl::fill_reply(const Status& st, const LeaseGrant& grant,
                                  wire::LeaseReply& rsp) {
    rsp.Clear();
    if (st.ok()) {
        wire::LeaseGrant* g = rsp.mutable_grant();
        g->set_id(grant.id);
        g->set_exp(grant.exp);
        return;
    }
    wire::RpcError* err = rsp.mutable_error();
    err->set_code(st.code());
    err->set_msg(st.message());
}

// ---------- Acquire ----------

void LeaseServiceImpl::Acquire(const wire::AcquireRequest& req,
                               wire::LeaseReply& rsp) {
    (void)req;

    LeaseGrant grant;
    Status st = allocator_->acquire_next(grant);
    if (st.ok()) {
        log(LogLevel::INFO, "Acquire: id=%u exp=%lld",
            grant.id, static_cast<long long>(grant.exp));
    } else if (st.code() == Status::kInternal) {
        log(LogLevel::ERROR, "Acquire failed: %s", st.message().c_str());
    } else {
        log(LogLevel::WARN, "Acquire: code=%d msg=%s",
            st.code(), st.message().c_str());
    }
    fill_reply(st, grant, rsp);
}

// ---------- Heartbeat ----------

void LeaseServiceImpl::Heartbeat(const wire::HeartbeatRequest& req,
                                 wire::LeaseReply& rsp) {
    LeaseGrant grant;
    Status st = allocator_->heartbeat(req.id(), grant);
    if (st.ok()) {
        log(LogLevel::DEBUG, "Heartbeat: id=%u exp=%lld",
            grant.id, static_cast<long long>(grant.exp));
    } else {
        log(LogLevel::INFO, "Heartbeat: id=%u code=%d msg=%s",
            req.id(), st.code(), st.message().c_str());
    }
    fill_reply(st, grant, rsp);
}

} // namespace idlease
