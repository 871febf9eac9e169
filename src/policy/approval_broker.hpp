#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "policy/access_policy.hpp"

namespace toolgate::policy {

struct PendingApproval {
    std::string request_id;
    std::string tool_name;
    nlohmann::json input;
    protocol::Origin origin = protocol::Origin::User;
    std::string session_id;
};

using ApprovalListener = std::function<void(const PendingApproval&)>;

// Correlates approval requests with answers by request id. The waiting call
// parks on a future; a host UI sees the request through the listener and
// answers with resolve(). The broker must outlive any policy holding hook().
class ApprovalBroker {
public:
    explicit ApprovalBroker(
        std::chrono::milliseconds poll_interval = std::chrono::milliseconds(20));

    // Called on the requesting thread each time a request is parked.
    void set_listener(ApprovalListener listener);

    ApprovalHook hook();

    // False when no request with that id is pending.
    bool resolve(const std::string& request_id, bool approved);

    std::vector<PendingApproval> pending() const;

    // Denies every pending request, e.g. on shutdown.
    void deny_all();

private:
    core::errors::Result<bool> wait(const protocol::RequestContext& ctx,
                                    const std::string& request_id,
                                    const std::string& tool_name,
                                    const nlohmann::json& input);

    struct Entry {
        PendingApproval request;
        std::promise<bool> decision;
    };

    std::chrono::milliseconds poll_interval_;
    mutable std::mutex mutex_;
    std::map<std::string, Entry> pending_;
    ApprovalListener listener_;
};

}  // namespace toolgate::policy
