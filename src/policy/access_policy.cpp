#include "policy/access_policy.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <sstream>
#include <utility>
#include "core/config/request_id.hpp"
#include "core/logging/logger.hpp"

namespace toolgate::policy {

using core::errors::ErrorCategory;
using core::errors::GateError;
using protocol::Origin;

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::vector<std::string> split_words(const std::string& value) {
    std::istringstream in(value);
    std::vector<std::string> words;
    std::string word;
    while (in >> word) {
        words.push_back(word);
    }
    return words;
}

// Chaining, substitution and redirection let an allowlisted prefix smuggle
// in an arbitrary second command.
bool is_compound(const std::string& command) {
    static const std::vector<std::string> kOperators = {
        ";", "&&", "||", "|", "`", "$(", ">", "<", "\n"};
    for (const auto& op : kOperators) {
        if (command.find(op) != std::string::npos) {
            return true;
        }
    }
    return false;
}

}  // namespace

std::string to_string(const AccessLevel level) {
    switch (level) {
        case AccessLevel::Deny:
            return "deny";
        case AccessLevel::Allowlist:
            return "allowlist";
        case AccessLevel::Full:
            return "full";
        default:
            return "unknown";
    }
}

std::string to_string(const AskMode mode) {
    switch (mode) {
        case AskMode::Off:
            return "off";
        case AskMode::OnMiss:
            return "on-miss";
        case AskMode::Always:
            return "always";
        default:
            return "unknown";
    }
}

std::optional<AccessLevel> parse_access_level(const std::string& value) {
    const std::string lowered = lowercase(value);
    if (lowered == "deny") return AccessLevel::Deny;
    if (lowered == "allowlist") return AccessLevel::Allowlist;
    if (lowered == "full") return AccessLevel::Full;
    return std::nullopt;
}

std::optional<AskMode> parse_ask_mode(const std::string& value) {
    const std::string lowered = lowercase(value);
    if (lowered == "off") return AskMode::Off;
    if (lowered == "on-miss" || lowered == "on_miss") return AskMode::OnMiss;
    if (lowered == "always") return AskMode::Always;
    return std::nullopt;
}

const std::vector<std::string>& safe_bins() {
    static const std::vector<std::string> kSafeBins = {
        "ls", "pwd", "cat", "head", "tail", "grep", "find", "which", "type",
        "jq", "cut", "sort", "uniq", "wc", "echo", "date", "env", "printenv",
        "git status", "git log", "git diff", "git branch", "git show",
        "go version", "node --version", "python --version"};
    return kSafeBins;
}

OriginDenyList default_origin_deny_list() {
    return OriginDenyList{
        {Origin::Comm, {"shell"}},
        {Origin::Plugin, {"shell"}},
        {Origin::Skill, {"shell"}},
    };
}

bool is_dangerous(const std::string& command) {
    static const std::vector<std::string> kDangerous = {
        "rm -rf", "rm -r", "rmdir", "sudo", "su ", "chmod 777", "chown",
        "dd ", "mkfs", "> /dev/", ">/dev/", "curl | sh", "curl | bash",
        "wget | sh", "eval ", "exec ", ":(){ :|:& };:"};
    const std::string lowered = lowercase(command);
    for (const auto& pattern : kDangerous) {
        if (lowered.find(pattern) != std::string::npos) {
            return true;
        }
    }
    return false;
}

AccessPolicy::AccessPolicy()
    : allowlist_(safe_bins().begin(), safe_bins().end()),
      origin_deny_list_(default_origin_deny_list()) {}

AccessLevel AccessPolicy::level() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return level_;
}

void AccessPolicy::set_level(const AccessLevel level) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    level_ = level;
}

AskMode AccessPolicy::ask_mode() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return ask_mode_;
}

void AccessPolicy::set_ask_mode(const AskMode mode) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    ask_mode_ = mode;
}

void AccessPolicy::set_approval_hook(ApprovalHook hook) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    approval_hook_ = std::move(hook);
}

bool AccessPolicy::has_approval_hook() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return static_cast<bool>(approval_hook_);
}

void AccessPolicy::set_autonomous_check(AutonomousCheck check) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    autonomous_check_ = std::move(check);
}

void AccessPolicy::add_to_allowlist(const std::string& pattern) {
    const std::string trimmed = trim(pattern);
    if (trimmed.empty()) {
        return;
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    allowlist_.insert(trimmed);
}

bool AccessPolicy::is_allowed(const std::string& command) const {
    const std::string cmd = trim(command);
    if (cmd.empty() || is_compound(cmd) || is_dangerous(cmd)) {
        return false;
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (allowlist_.count(cmd) != 0) {
        return true;
    }

    const auto words = split_words(cmd);
    if (words.empty()) {
        return false;
    }
    if (allowlist_.count(words[0]) != 0) {
        return true;
    }
    return words.size() > 1 && allowlist_.count(words[0] + " " + words[1]) != 0;
}

void AccessPolicy::set_origin_deny_list(OriginDenyList deny_list) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    origin_deny_list_ = std::move(deny_list);
}

void AccessPolicy::deny_for_origin(const Origin origin,
                                   const std::string& tool_name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    origin_deny_list_[origin].insert(tool_name);
}

void AccessPolicy::allow_for_origin(const Origin origin,
                                    const std::string& tool_name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = origin_deny_list_.find(origin);
    if (it != origin_deny_list_.end()) {
        it->second.erase(tool_name);
    }
}

bool AccessPolicy::is_denied_for_origin(const Origin origin,
                                        const std::string& tool_name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto it = origin_deny_list_.find(origin);
    if (it == origin_deny_list_.end()) {
        return false;
    }
    return it->second.count(tool_name) != 0;
}

bool AccessPolicy::autonomous() const {
    AutonomousCheck check;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        check = autonomous_check_;
    }
    return check && check();
}

bool AccessPolicy::command_requires_approval(const std::string& command) const {
    if (autonomous()) {
        return false;
    }

    AccessLevel level;
    AskMode mode;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        level = level_;
        mode = ask_mode_;
    }

    if (level == AccessLevel::Full) {
        return false;
    }
    if (level == AccessLevel::Deny) {
        return true;
    }
    if (is_allowed(command)) {
        return mode == AskMode::Always;
    }
    return mode != AskMode::Off;
}

core::errors::Result<bool> AccessPolicy::request_approval(
    const protocol::RequestContext& ctx, const std::string& tool_name,
    const nlohmann::json& input) const {
    if (ctx.origin == Origin::System) {
        LOG_DEBUG("AccessPolicy: auto-approving " + tool_name + " (system origin)");
        return true;
    }
    if (autonomous()) {
        LOG_DEBUG("AccessPolicy: auto-approving " + tool_name + " (autonomous)");
        return true;
    }

    ApprovalHook hook;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (level_ == AccessLevel::Full) {
            LOG_DEBUG("AccessPolicy: auto-approving " + tool_name + " (full level)");
            return true;
        }
        hook = approval_hook_;
    }

    if (ctx.done()) {
        return GateError{ErrorCategory::Cancelled,
                         "Call was cancelled before approval was requested.",
                         "approval_cancelled"};
    }

    if (!hook) {
        LOG_WARN("AccessPolicy: no approval hook configured, denying " + tool_name);
        return false;
    }

    const std::string request_id = core::config::generate_request_id();
    LOG_INFO("AccessPolicy: requesting approval " + request_id + " for " +
             tool_name + " (" + protocol::to_string(ctx.origin) + " origin)");
    return hook(ctx, request_id, tool_name, input);
}

}  // namespace toolgate::policy
