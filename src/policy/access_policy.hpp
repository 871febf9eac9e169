#pragma once

#include <functional>
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/gate_errors.hpp"
#include "protocol/origin.hpp"
#include "protocol/request_context.hpp"

namespace toolgate::policy {

// Overall posture of the policy.
enum class AccessLevel {
    Deny,       // Every command needs approval
    Allowlist,  // Safe commands run, everything else is classified then approved
    Full        // Auto-approve everything except origin-denied tools
};

enum class AskMode {
    Off,     // Never ask
    OnMiss,  // Ask only for commands outside the allowlist
    Always   // Ask even for allowlisted commands
};

std::string to_string(AccessLevel level);
std::string to_string(AskMode mode);
std::optional<AccessLevel> parse_access_level(const std::string& value);
std::optional<AskMode> parse_ask_mode(const std::string& value);

// Supplied by the host UI/CLI. Blocks until a decision is made or the
// context is cancelled; returns the decision or an error.
using ApprovalHook = std::function<core::errors::Result<bool>(
    const protocol::RequestContext& ctx, const std::string& request_id,
    const std::string& tool_name, const nlohmann::json& input)>;

// Re-read on every check so a host settings toggle takes effect immediately.
using AutonomousCheck = std::function<bool()>;

using OriginDenyList = std::map<protocol::Origin, std::set<std::string>>;

// Commands that never require approval under the allowlist level.
const std::vector<std::string>& safe_bins();

// Non-user origins lose the shell; user and system are unrestricted.
OriginDenyList default_origin_deny_list();

// Heuristic used for logging and to keep compound commands off the allowlist.
bool is_dangerous(const std::string& command);

class AccessPolicy {
public:
    AccessPolicy();

    AccessLevel level() const;
    void set_level(AccessLevel level);

    AskMode ask_mode() const;
    void set_ask_mode(AskMode mode);

    void set_approval_hook(ApprovalHook hook);
    bool has_approval_hook() const;
    void set_autonomous_check(AutonomousCheck check);

    void add_to_allowlist(const std::string& pattern);
    bool is_allowed(const std::string& command) const;

    void set_origin_deny_list(OriginDenyList deny_list);
    void deny_for_origin(protocol::Origin origin, const std::string& tool_name);
    void allow_for_origin(protocol::Origin origin, const std::string& tool_name);
    bool is_denied_for_origin(protocol::Origin origin,
                              const std::string& tool_name) const;

    // Command classifier: true when the concrete command must be approved
    // under the current level and ask mode.
    bool command_requires_approval(const std::string& command) const;

    // Asks for approval of one call. System-origin calls, autonomous mode and
    // the Full level approve without asking. With no hook configured the call
    // is denied.
    core::errors::Result<bool> request_approval(
        const protocol::RequestContext& ctx, const std::string& tool_name,
        const nlohmann::json& input) const;

private:
    bool autonomous() const;

    mutable std::shared_mutex mutex_;
    AccessLevel level_ = AccessLevel::Allowlist;
    AskMode ask_mode_ = AskMode::OnMiss;
    std::set<std::string> allowlist_;
    OriginDenyList origin_deny_list_;
    ApprovalHook approval_hook_;
    AutonomousCheck autonomous_check_;
};

}  // namespace toolgate::policy
