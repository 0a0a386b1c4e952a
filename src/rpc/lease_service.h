// src/rpc/lease_service.h
#pragma once

#include "idlease.pb.h" // 由 proto 生成

namespace idlease {

/**
 * 对外服务接口：每个方法对应一个 RPC method。
 * 不使用 protobuf 生成的 service 基类，便于和 core 层解耦。
 */
class ILeaseService {
public:
    virtual ~ILeaseService() = default;

    virtual void Acquire(const wire::AcquireRequest& req,
                         wire::LeaseReply& rsp) = 0;

    virtual void Heartbeat(const wire::HeartbeatRequest& req,
                           wire::LeaseReply& rsp) = 0;
};

} // namespace idlease
