#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/gate_errors.hpp"
#include "policy/access_policy.hpp"

namespace toolgate::core::config {

constexpr std::size_t kDefaultMaxResultChars = 100000;

struct PolicyConfig {
    policy::AccessLevel level = policy::AccessLevel::Allowlist;
    policy::AskMode ask_mode = policy::AskMode::OnMiss;
    std::vector<std::string> allowlist;  // added on top of the safe bins
    bool autonomous = false;
    // Per-origin overrides of the default deny list. An origin listed here
    // replaces its default set (an empty list clears it); others keep theirs.
    std::optional<policy::OriginDenyList> origin_deny;
};

struct GateConfig {
    PolicyConfig policy;
    std::size_t max_result_chars = kDefaultMaxResultChars;
    bool desktop_lane = true;
    // Category permissions; absent means every category is allowed.
    std::optional<std::map<std::string, bool>> permissions;
    std::filesystem::path workspace = ".";
    std::optional<std::filesystem::path> audit_log;
};

// Missing keys keep their defaults. Malformed JSON, wrong value types and
// unknown enum strings are Input errors.
errors::Result<GateConfig> parse_config(const std::string& json_text);
errors::Result<GateConfig> load_config_file(const std::filesystem::path& path);

// Pushes the policy section onto a live AccessPolicy.
void apply_policy_config(const PolicyConfig& config, policy::AccessPolicy& access);

}  // namespace toolgate::core::config
