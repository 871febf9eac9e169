#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/gate_errors.hpp"

namespace toolgate::policy {

struct CommandPolicy {
    // Extra substrings rejected on top of the built-in hard limits.
    std::vector<std::string> blocked_substrings = {"shutdown", "reboot"};
};

// Hard safety limits. Unlike the AccessPolicy these cannot be lifted by the
// access level, autonomous mode or an approval: they protect the host.
class Safeguard {
public:
    explicit Safeguard(CommandPolicy command_policy = {});

    core::errors::Result<std::filesystem::path> validate_path_in_workspace(
        const std::filesystem::path& workspace_root,
        const std::filesystem::path& target_path) const;

    // Rejects writes/edits to system directories and credential stores.
    core::errors::Result<std::filesystem::path> validate_writable_path(
        const std::filesystem::path& path) const;

    // Relative arguments of rm/chmod/chown are resolved against cwd.
    core::errors::Result<std::string> validate_command(
        const std::string& command,
        const std::filesystem::path& cwd = std::filesystem::current_path()) const;

    // Human-readable reason when the absolute path is protected.
    static std::optional<std::string> protected_path_reason(
        const std::filesystem::path& absolute_path);

private:
    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);
    static std::string lowercase(std::string value);

    CommandPolicy command_policy_;
};

}  // namespace toolgate::policy
