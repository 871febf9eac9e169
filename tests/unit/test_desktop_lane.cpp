#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "runtime/desktop_lane.hpp"

namespace {

using namespace std::chrono_literals;
using toolgate::protocol::make_context;
using toolgate::protocol::Origin;
using toolgate::protocol::ToolResult;
using toolgate::runtime::DesktopLane;

// Starts a task that holds the lane until the gate opens; returns once it runs.
std::future<ToolResult> occupy_lane(DesktopLane& lane, std::shared_future<void> gate) {
    auto started = std::make_shared<std::promise<void>>();
    auto running = started->get_future();
    auto blocker = std::async(std::launch::async, [&lane, gate, started]() {
        return lane.enqueue(make_context(Origin::User), [gate, started]() {
            started->set_value();
            gate.wait();
            return ToolResult::ok("blocker");
        });
    });
    running.wait();
    return blocker;
}

TEST(DesktopLaneTest, RunsTaskAndReturnsResult) {
    DesktopLane lane(5ms);
    EXPECT_TRUE(lane.is_running());
    const auto result = lane.enqueue(make_context(Origin::User),
                                     []() { return ToolResult::ok("clicked"); });
    EXPECT_FALSE(result.is_error);
    EXPECT_EQ(result.content, "clicked");
}

TEST(DesktopLaneTest, TasksNeverOverlap) {
    DesktopLane lane(5ms);
    std::atomic_int active{0};
    std::atomic_int max_active{0};
    auto task = [&]() {
        const int now = ++active;
        int seen = max_active.load();
        while (now > seen && !max_active.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(20ms);
        --active;
        return ToolResult::ok("done");
    };

    std::vector<std::future<ToolResult>> calls;
    for (int i = 0; i < 4; ++i) {
        calls.push_back(std::async(std::launch::async, [&lane, &task]() {
            return lane.enqueue(make_context(Origin::User), task);
        }));
    }
    for (auto& call : calls) {
        EXPECT_FALSE(call.get().is_error);
    }
    EXPECT_EQ(max_active.load(), 1);
}

TEST(DesktopLaneTest, CancelWhileQueuedSkipsTask) {
    DesktopLane lane(5ms);
    std::promise<void> release;
    auto blocker = occupy_lane(lane, release.get_future().share());

    std::atomic_bool ran{false};
    auto ctx = make_context(Origin::User);
    auto waiting = std::async(std::launch::async, [&lane, &ran, ctx]() {
        return lane.enqueue(ctx, [&ran]() {
            ran = true;
            return ToolResult::ok("late");
        });
    });
    std::this_thread::sleep_for(30ms);
    ctx.cancel_token->store(true);

    const auto cancelled = waiting.get();
    EXPECT_TRUE(cancelled.is_error);
    EXPECT_EQ(cancelled.content, "Cancelled while waiting for the desktop lane.");

    release.set_value();
    EXPECT_EQ(blocker.get().content, "blocker");
    lane.shutdown();
    EXPECT_FALSE(ran.load());
}

TEST(DesktopLaneTest, DeadlineWhileQueuedReportsTimeout) {
    DesktopLane lane(5ms);
    std::promise<void> release;
    auto blocker = occupy_lane(lane, release.get_future().share());

    const auto result = lane.enqueue(make_context(Origin::User).with_timeout(30ms),
                                     []() { return ToolResult::ok("late"); });
    EXPECT_TRUE(result.is_error);
    EXPECT_EQ(result.content, "Timed out while waiting for the desktop lane.");
    release.set_value();
    blocker.get();
}

TEST(DesktopLaneTest, ShutdownFailsQueuedJobs) {
    DesktopLane lane(5ms);
    std::promise<void> release;
    auto blocker = occupy_lane(lane, release.get_future().share());
    auto queued = std::async(std::launch::async, [&lane]() {
        return lane.enqueue(make_context(Origin::User),
                            []() { return ToolResult::ok("never"); });
    });
    while (lane.pending() != 1) {
        std::this_thread::sleep_for(2ms);
    }

    auto stopper = std::async(std::launch::async, [&lane]() { lane.shutdown(); });
    const auto failed = queued.get();
    EXPECT_TRUE(failed.is_error);
    EXPECT_EQ(failed.content, "Desktop lane shut down before the call ran.");

    release.set_value();
    EXPECT_EQ(blocker.get().content, "blocker");
    stopper.get();
    EXPECT_FALSE(lane.is_running());

    const auto refused = lane.enqueue(make_context(Origin::User),
                                      []() { return ToolResult::ok("x"); });
    EXPECT_EQ(refused.content, "Desktop lane is shut down.");
}

TEST(DesktopLaneTest, ThrowingTaskBecomesError) {
    DesktopLane lane(5ms);
    const auto result = lane.enqueue(make_context(Origin::User), []() -> ToolResult {
        throw std::runtime_error("window vanished");
    });
    EXPECT_TRUE(result.is_error);
    EXPECT_EQ(result.content, "Tool failed: window vanished");

    const auto next = lane.enqueue(make_context(Origin::User),
                                   []() { return ToolResult::ok("still alive"); });
    EXPECT_EQ(next.content, "still alive");
}

}  // namespace
