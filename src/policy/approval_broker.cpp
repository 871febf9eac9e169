#include "policy/approval_broker.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace toolgate::policy {

using core::errors::ErrorCategory;
using core::errors::GateError;

ApprovalBroker::ApprovalBroker(const std::chrono::milliseconds poll_interval)
    : poll_interval_(poll_interval) {}

void ApprovalBroker::set_listener(ApprovalListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

ApprovalHook ApprovalBroker::hook() {
    return [this](const protocol::RequestContext& ctx, const std::string& request_id,
                  const std::string& tool_name, const nlohmann::json& input) {
        return wait(ctx, request_id, tool_name, input);
    };
}

core::errors::Result<bool> ApprovalBroker::wait(const protocol::RequestContext& ctx,
                                                const std::string& request_id,
                                                const std::string& tool_name,
                                                const nlohmann::json& input) {
    PendingApproval request{request_id, tool_name, input, ctx.origin, ctx.session_id};
    std::future<bool> decision;
    ApprovalListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Entry entry{request, std::promise<bool>()};
        decision = entry.decision.get_future();
        if (!pending_.emplace(request_id, std::move(entry)).second) {
            LOG_ERROR("ApprovalBroker: request id " + request_id + " is already pending");
            return GateError{ErrorCategory::Internal,
                             "Approval request " + request_id + " is already pending.",
                             "approval_duplicate_id"};
        }
        listener = listener_;
    }

    if (listener) {
        bool failed = false;
        std::string failure;
        try {
            listener(request);
        } catch (const std::exception& e) {
            failed = true;
            failure = e.what();
        } catch (...) {
            failed = true;
            failure = "unknown exception";
        }
        if (failed) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                pending_.erase(request_id);
            }
            LOG_ERROR("ApprovalBroker: listener failed for " + request_id + ": " + failure);
            return GateError{ErrorCategory::Internal,
                             "Approval listener failed for " + tool_name + ": " + failure,
                             "approval_listener_failed"};
        }
    } else {
        LOG_WARN("ApprovalBroker: no listener, " + request_id + " waits for resolve()");
    }

    while (decision.wait_for(poll_interval_) != std::future_status::ready) {
        if (!ctx.done()) {
            continue;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            // Not found means resolve() won the race; its answer stands.
            if (pending_.erase(request_id) == 0) {
                break;
            }
        }
        LOG_INFO("ApprovalBroker: " + request_id + " abandoned by caller");
        if (ctx.cancelled()) {
            return GateError{ErrorCategory::Cancelled,
                             "Approval for " + tool_name + " was cancelled.",
                             "approval_cancelled"};
        }
        return GateError{ErrorCategory::Cancelled,
                         "Approval for " + tool_name + " timed out.",
                         "approval_timeout"};
    }
    return decision.get();
}

bool ApprovalBroker::resolve(const std::string& request_id, const bool approved) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = pending_.find(request_id);
    if (it == pending_.end()) {
        LOG_WARN("ApprovalBroker: resolve for unknown request " + request_id);
        return false;
    }
    it->second.decision.set_value(approved);
    pending_.erase(it);
    LOG_INFO("ApprovalBroker: " + request_id + (approved ? " approved" : " denied"));
    return true;
}

std::vector<PendingApproval> ApprovalBroker::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PendingApproval> requests;
    for (const auto& entry : pending_) {
        requests.push_back(entry.second.request);
    }
    return requests;
}

void ApprovalBroker::deny_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : pending_) {
        entry.second.decision.set_value(false);
    }
    pending_.clear();
}

}  // namespace toolgate::policy
