#include "rpc/lease_service_impl.h"
#include "core/clock/clock.h"
#include "core/lease/id_allocator.h"

#include <gtest/gtest.h>

#include <memory>
#include <utility>

using namespace idlease;

namespace {

// 固定返回预设结果，验证 Status -> LeaseReply 的翻译
class FakeAllocator : public IIdAllocator {
public:
    Status acquire_next(LeaseGrant& out) override {
        out = grant;
        return status;
    }
    Status heartbeat(LeaseId id, LeaseGrant& out) override {
        last_heartbeat_id = id;
        out = grant;
        return status;
    }

    Status status = Status::OK();
    LeaseGrant grant;
    LeaseId last_heartbeat_id {0};
};

} // namespace

TEST(LeaseServiceTest, AcquireSuccessFillsGrant) {
    auto fake = std::make_shared<FakeAllocator>();
    fake->grant = LeaseGrant{7, 1700000000123};
    LeaseServiceImpl svc(fake);

    wire::LeaseReply rsp;
    svc.Acquire(wire::AcquireRequest(), rsp);
    ASSERT_EQ(rsp.result_case(), wire::LeaseReply::kGrant);
    EXPECT_EQ(rsp.grant().id(), 7u);
    EXPECT_EQ(rsp.grant().exp(), 1700000000123);
    EXPECT_FALSE(rsp.has_error());
}

TEST(LeaseServiceTest, AcquireExhaustedFillsError) {
    auto fake = std::make_shared<FakeAllocator>();
    fake->status = Status::NoIdAvailable();
    LeaseServiceImpl svc(fake);

    wire::LeaseReply rsp;
    svc.Acquire(wire::AcquireRequest(), rsp);
    ASSERT_EQ(rsp.result_case(), wire::LeaseReply::kError);
    EXPECT_EQ(rsp.error().code(), 1);
    EXPECT_EQ(rsp.error().msg(), "No id available!");
}

TEST(LeaseServiceTest, HeartbeatErrorCodes) {
    auto fake = std::make_shared<FakeAllocator>();
    LeaseServiceImpl svc(fake);

    wire::HeartbeatRequest req;
    req.set_id(12);

    fake->status = Status::IdExpired();
    wire::LeaseReply rsp;
    svc.Heartbeat(req, rsp);
    EXPECT_EQ(fake->last_heartbeat_id, 12u);
    ASSERT_TRUE(rsp.has_error());
    EXPECT_EQ(rsp.error().code(), 2);
    EXPECT_EQ(rsp.error().msg(), "Id expired!");

    fake->status = Status::IdNonexistent();
    svc.Heartbeat(req, rsp);
    ASSERT_TRUE(rsp.has_error());
    EXPECT_EQ(rsp.error().code(), 3);
    EXPECT_EQ(rsp.error().msg(), "Id nonexistent!");
}

TEST(LeaseServiceTest, ReplyIsResetBetweenCalls) {
    auto fake = std::make_shared<FakeAllocator>();
    LeaseServiceImpl svc(fake);

    wire::LeaseReply rsp;
    fake->status = Status::IdNonexistent();
    svc.Heartbeat(wire::HeartbeatRequest(), rsp);
    ASSERT_TRUE(rsp.has_error());

    fake->status = Status::OK();
    fake->grant = LeaseGrant{3, 99};
    svc.Heartbeat(wire::HeartbeatRequest(), rsp);
    EXPECT_FALSE(rsp.has_error());
    ASSERT_TRUE(rsp.has_grant());
    EXPECT_EQ(rsp.grant().id(), 3u);
    EXPECT_EQ(rsp.grant().exp(), 99);
}

TEST(LeaseServiceTest, WithRealAllocator) {
    auto clock = std::make_shared<ManualClock>(1000);
    AllocatorOptions opts;
    opts.min_id = 1;
    opts.max_id = 1;
    opts.timeout_ms = 500;
    std::unique_ptr<IdAllocator> alloc;
    ASSERT_TRUE(IdAllocator::create(opts, clock, alloc).ok());
    LeaseServiceImpl svc(std::shared_ptr<IdAllocator>(std::move(alloc)));

    wire::LeaseReply rsp;
    svc.Acquire(wire::AcquireRequest(), rsp);
    ASSERT_TRUE(rsp.has_grant());
    EXPECT_EQ(rsp.grant().id(), 1u);
    EXPECT_EQ(rsp.grant().exp(), 1500);

    svc.Acquire(wire::AcquireRequest(), rsp);
    ASSERT_TRUE(rsp.has_error());
    EXPECT_EQ(rsp.error().code(), Status::kNoIdAvailable);

    clock->set(1499);
    wire::HeartbeatRequest req;
    req.set_id(1);
    svc.Heartbeat(req, rsp);
    ASSERT_TRUE(rsp.has_grant());
    EXPECT_EQ(rsp.grant().exp(), 1999);
}
