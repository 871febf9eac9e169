#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "policy/approval_broker.hpp"

namespace {

using namespace std::chrono_literals;
using toolgate::core::errors::ErrorCategory;
using toolgate::core::errors::get_error;
using toolgate::core::errors::get_value;
using toolgate::core::errors::is_error;
using toolgate::policy::ApprovalBroker;
using toolgate::policy::PendingApproval;
using toolgate::protocol::make_context;
using toolgate::protocol::Origin;

TEST(ApprovalBrokerTest, ListenerAnswersRequest) {
    ApprovalBroker broker(5ms);
    PendingApproval seen;
    broker.set_listener([&](const PendingApproval& request) {
        seen = request;
        EXPECT_TRUE(broker.resolve(request.request_id, true));
    });

    auto hook = broker.hook();
    auto result = hook(make_context(Origin::Comm, "sess-1"), "req-0001", "shell",
                       {{"command", "make"}});
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result));
    EXPECT_EQ(seen.tool_name, "shell");
    EXPECT_EQ(seen.origin, Origin::Comm);
    EXPECT_EQ(seen.session_id, "sess-1");
    EXPECT_EQ(seen.input["command"], "make");
    EXPECT_TRUE(broker.pending().empty());
}

TEST(ApprovalBrokerTest, ResolveFromAnotherThread) {
    ApprovalBroker broker(5ms);
    auto hook = broker.hook();

    std::thread answer([&broker]() {
        while (broker.pending().empty()) {
            std::this_thread::sleep_for(2ms);
        }
        EXPECT_EQ(broker.pending().front().request_id, "req-0002");
        broker.resolve("req-0002", false);
    });

    auto result = hook(make_context(Origin::User), "req-0002", "file", {});
    answer.join();
    ASSERT_FALSE(is_error(result));
    EXPECT_FALSE(get_value(result));
}

TEST(ApprovalBrokerTest, CancelledCallerStopsWaiting) {
    ApprovalBroker broker(5ms);
    auto ctx = make_context(Origin::User);
    broker.set_listener([&ctx](const PendingApproval&) { ctx.cancel_token->store(true); });

    auto result = broker.hook()(ctx, "req-0003", "shell", {});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "approval_cancelled");
    EXPECT_EQ(get_error(result).category, ErrorCategory::Cancelled);
    EXPECT_TRUE(broker.pending().empty());
    EXPECT_FALSE(broker.resolve("req-0003", true));
}

TEST(ApprovalBrokerTest, ExpiredDeadlineTimesOut) {
    ApprovalBroker broker(5ms);
    const auto ctx = make_context(Origin::User).with_timeout(30ms);

    auto result = broker.hook()(ctx, "req-0004", "shell", {});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "approval_timeout");
}

TEST(ApprovalBrokerTest, ResolveUnknownRequestReturnsFalse) {
    ApprovalBroker broker;
    EXPECT_FALSE(broker.resolve("req-missing", true));
}

TEST(ApprovalBrokerTest, DenyAllReleasesWaiters) {
    ApprovalBroker broker(5ms);
    auto hook = broker.hook();

    std::thread closer([&broker]() {
        while (broker.pending().size() < 1) {
            std::this_thread::sleep_for(2ms);
        }
        broker.deny_all();
    });

    auto result = hook(make_context(Origin::User), "req-0005", "shell", {});
    closer.join();
    ASSERT_FALSE(is_error(result));
    EXPECT_FALSE(get_value(result));
    EXPECT_TRUE(broker.pending().empty());
}

TEST(ApprovalBrokerTest, ThrowingListenerReleasesRequest) {
    ApprovalBroker broker(5ms);
    broker.set_listener([](const PendingApproval&) { throw std::runtime_error("ui gone"); });

    auto result = broker.hook()(make_context(Origin::User), "req-0006", "shell", {});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "approval_listener_failed");
    EXPECT_NE(get_error(result).message.find("ui gone"), std::string::npos);
    EXPECT_TRUE(broker.pending().empty());
    EXPECT_FALSE(broker.resolve("req-0006", true));
}

TEST(ApprovalBrokerTest, DuplicateRequestIdIsRejected) {
    ApprovalBroker broker(5ms);
    auto hook = broker.hook();
    bool inner_seen = false;
    broker.set_listener([&](const PendingApproval& request) {
        if (inner_seen) {
            return;
        }
        inner_seen = true;
        auto inner = hook(make_context(Origin::User), request.request_id, "file", {});
        ASSERT_TRUE(is_error(inner));
        EXPECT_EQ(get_error(inner).code, "approval_duplicate_id");
        EXPECT_EQ(broker.pending().size(), 1u);
        EXPECT_TRUE(broker.resolve(request.request_id, true));
    });

    auto result = hook(make_context(Origin::User), "req-0007", "shell", {});
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result));
    EXPECT_TRUE(inner_seen);
    EXPECT_TRUE(broker.pending().empty());
}

}  // namespace
