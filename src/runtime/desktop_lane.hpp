#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include "protocol/request_context.hpp"
#include "protocol/tool_contract.hpp"

namespace toolgate::runtime {

using LaneTask = std::function<protocol::ToolResult()>;

// Single worker thread that runs desktop-category executions one at a time,
// in arrival order. Anything that drives the shared screen, keyboard or
// focus goes through here.
class DesktopLane {
public:
    explicit DesktopLane(
        std::chrono::milliseconds poll_interval = std::chrono::milliseconds(20));
    ~DesktopLane();

    DesktopLane(const DesktopLane&) = delete;
    DesktopLane& operator=(const DesktopLane&) = delete;

    // Blocks until the task has run on the lane. A caller whose context is
    // cancelled or expired while the task is still queued gets an error and
    // the task never runs; once started, the task runs to completion.
    protocol::ToolResult enqueue(const protocol::RequestContext& ctx, LaneTask task);

    std::size_t pending() const;
    bool is_running() const;

    // Stops the worker after the job in flight. Queued jobs fail.
    void shutdown();

private:
    enum class JobState { Queued, Running, Abandoned };

    struct Job {
        LaneTask task;
        std::atomic<JobState> state{JobState::Queued};
        std::promise<protocol::ToolResult> result;
    };

    void worker();
    static protocol::ToolResult run_task(const LaneTask& task);

    std::chrono::milliseconds poll_interval_;
    std::deque<std::shared_ptr<Job>> jobs_;
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    bool stop_ = false;
    std::thread thread_;
};

}  // namespace toolgate::runtime
