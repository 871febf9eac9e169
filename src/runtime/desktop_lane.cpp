#include "runtime/desktop_lane.hpp"

#include <exception>
#include <utility>
#include "core/logging/logger.hpp"

namespace toolgate::runtime {

using protocol::ToolResult;

DesktopLane::DesktopLane(const std::chrono::milliseconds poll_interval)
    : poll_interval_(poll_interval) {
    thread_ = std::thread([this] { worker(); });
    LOG_INFO("DesktopLane: started");
}

DesktopLane::~DesktopLane() { shutdown(); }

ToolResult DesktopLane::enqueue(const protocol::RequestContext& ctx, LaneTask task) {
    auto job = std::make_shared<Job>();
    job->task = std::move(task);
    std::future<ToolResult> result = job->result.get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            return ToolResult::error("Desktop lane is shut down.");
        }
        jobs_.push_back(job);
    }
    condition_.notify_one();

    bool abandon_attempted = false;
    while (result.wait_for(poll_interval_) != std::future_status::ready) {
        if (abandon_attempted || !ctx.done()) {
            continue;
        }
        abandon_attempted = true;
        JobState expected = JobState::Queued;
        if (job->state.compare_exchange_strong(expected, JobState::Abandoned)) {
            LOG_INFO("DesktopLane: caller gave up on a queued job");
            return ToolResult::error(ctx.cancelled()
                                         ? "Cancelled while waiting for the desktop lane."
                                         : "Timed out while waiting for the desktop lane.");
        }
        // Already running: wait for it to finish.
    }
    return result.get();
}

std::size_t DesktopLane::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

bool DesktopLane::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !stop_;
}

void DesktopLane::shutdown() {
    std::deque<std::shared_ptr<Job>> orphaned;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            return;
        }
        stop_ = true;
        orphaned.swap(jobs_);
    }
    condition_.notify_all();

    for (const auto& job : orphaned) {
        JobState expected = JobState::Queued;
        if (job->state.compare_exchange_strong(expected, JobState::Abandoned)) {
            job->result.set_value(ToolResult::error("Desktop lane shut down before the call ran."));
        }
    }

    if (thread_.joinable()) {
        thread_.join();
    }
    LOG_INFO("DesktopLane: stopped");
}

ToolResult DesktopLane::run_task(const LaneTask& task) {
    try {
        return task();
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("DesktopLane: task threw: ") + e.what());
        return ToolResult::error(std::string("Tool failed: ") + e.what());
    } catch (...) {
        LOG_ERROR("DesktopLane: task threw a non-standard exception");
        return ToolResult::error("Tool failed with an unknown exception.");
    }
}

void DesktopLane::worker() {
    while (true) {
        std::shared_ptr<Job> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            condition_.wait(lock, [this] { return stop_ || !jobs_.empty(); });
            if (stop_) {
                return;
            }
            job = jobs_.front();
            jobs_.pop_front();
        }

        JobState expected = JobState::Queued;
        if (!job->state.compare_exchange_strong(expected, JobState::Running)) {
            continue;  // abandoned by its caller
        }
        job->result.set_value(run_task(job->task));
    }
}

}  // namespace toolgate::runtime
