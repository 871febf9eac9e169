#include "policy/safeguard.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <system_error>
#include <utility>

namespace toolgate::policy {

using core::errors::ErrorCategory;
using core::errors::GateError;

namespace {

constexpr const char* kHardLimitHint =
    "This is a hard safety limit that cannot be overridden. "
    "If the operation is really needed, run it manually in a terminal.";

struct ProtectedPrefix {
    const char* prefix;
    const char* reason;
};

#if defined(__APPLE__)
constexpr ProtectedPrefix kSystemPrefixes[] = {
    {"/System", "macOS system files (SIP-protected)"},
    {"/usr/bin", "system binaries"},
    {"/usr/sbin", "system admin binaries"},
    {"/usr/lib", "system libraries"},
    {"/usr/libexec", "system executables"},
    {"/usr/share", "system shared data"},
    {"/bin", "core system binaries"},
    {"/sbin", "core system admin binaries"},
    {"/private/var/db", "macOS system databases"},
    {"/Library/LaunchDaemons", "system launch daemons"},
    {"/Library/LaunchAgents", "system launch agents"},
    {"/etc", "system configuration"},
};
#else
constexpr ProtectedPrefix kSystemPrefixes[] = {
    {"/bin", "core system binaries"},
    {"/sbin", "core system admin binaries"},
    {"/usr/bin", "system binaries"},
    {"/usr/sbin", "system admin binaries"},
    {"/usr/lib", "system libraries"},
    {"/usr/libexec", "system executables"},
    {"/usr/share", "system shared data"},
    {"/boot", "boot loader and kernel"},
    {"/etc", "system configuration"},
    {"/proc", "kernel process filesystem"},
    {"/sys", "kernel sysfs"},
    {"/dev", "device files"},
    {"/root", "root user home directory"},
    {"/var/lib/dpkg", "package manager database"},
    {"/var/lib/rpm", "package manager database"},
    {"/var/lib/apt", "package manager cache"},
};
#endif

constexpr ProtectedPrefix kSensitiveHomePaths[] = {
    {".ssh", "SSH keys and configuration"},
    {".gnupg", "GPG keys and configuration"},
    {".aws/credentials", "AWS credentials"},
    {".aws/config", "AWS configuration"},
    {".kube/config", "Kubernetes credentials"},
    {".docker/config.json", "Docker registry credentials"},
};

struct BlockedTool {
    const char* pattern;
    const char* reason;
};

constexpr BlockedTool kDiskTools[] = {
    {"mkfs", "cannot format filesystems"},
    {"fdisk", "cannot modify disk partition tables"},
    {"gdisk", "cannot modify GPT partition tables"},
    {"parted", "cannot modify disk partitions"},
    {"sfdisk", "cannot modify disk partition tables"},
    {"cfdisk", "cannot modify disk partition tables"},
    {"wipefs", "cannot wipe filesystem signatures"},
    {"sgdisk", "cannot modify GPT partition tables"},
    {"partprobe", "cannot probe partition changes"},
    {"diskutil erasedisk", "cannot erase disks"},
    {"diskutil erasevolume", "cannot erase volumes"},
    {"diskutil partitiondisk", "cannot partition disks"},
    {"diskutil apfs deletecontainer", "cannot delete APFS containers"},
    {"format", "cannot format drives"},
};

bool starts_with(const std::string& value, const std::string& prefix) {
    return value.rfind(prefix, 0) == 0;
}

bool contains(const std::string& value, const std::string& needle) {
    return value.find(needle) != std::string::npos;
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

bool has_sudo(const std::string& lowered) {
    if (starts_with(lowered, "sudo ") || starts_with(lowered, "sudo\t") ||
        lowered == "sudo") {
        return true;
    }
    for (const char* sep : {"| sudo ", "&& sudo ", "; sudo ", "|| sudo ",
                            "$(sudo ", "`sudo "}) {
        if (contains(lowered, sep)) {
            return true;
        }
    }
    return false;
}

bool has_su(const std::string& lowered) {
    if (starts_with(lowered, "su ") || starts_with(lowered, "su\t") ||
        lowered == "su") {
        return true;
    }
    for (const char* sep : {" | su ", " && su ", " ; su ", " || su "}) {
        if (contains(lowered, sep)) {
            return true;
        }
    }
    return false;
}

bool is_root_wipe(const std::string& lowered) {
    static const std::vector<std::string> kWipePatterns = {
        "rm -rf --no-preserve-root /", "rm -rf /", "rm -fr /"};
    for (const auto& pattern : kWipePatterns) {
        std::size_t pos = lowered.find(pattern);
        while (pos != std::string::npos) {
            const std::string after = lowered.substr(pos + pattern.size());
            if (after.empty() || after[0] == '*' || after[0] == ' ' ||
                after[0] == '\n' || after[0] == ';' || after[0] == '&') {
                return true;
            }
            pos = lowered.find(pattern, pos + 1);
        }
    }
    return false;
}

bool writes_to_device(const std::string& lowered) {
    if (!contains(lowered, "> /dev/") && !contains(lowered, ">/dev/")) {
        return false;
    }
    for (const char* safe : {"/dev/null", "/dev/stdout", "/dev/stderr"}) {
        if (contains(lowered, std::string("> ") + safe) ||
            contains(lowered, std::string(">") + safe)) {
            return false;
        }
    }
    return true;
}

}  // namespace

Safeguard::Safeguard(CommandPolicy command_policy)
    : command_policy_(std::move(command_policy)) {}

bool Safeguard::is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end();
}

std::string Safeguard::lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

std::optional<std::string> Safeguard::protected_path_reason(
    const std::filesystem::path& absolute_path) {
    const std::filesystem::path path = absolute_path.lexically_normal();
    if (path == path.root_path()) {
        return std::string("this is the root filesystem");
    }

    for (const auto& entry : kSystemPrefixes) {
        if (is_within_root(std::filesystem::path(entry.prefix), path)) {
            return std::string(entry.reason);
        }
    }

    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        return std::nullopt;
    }
    const std::filesystem::path home_path(home);
    for (const auto& entry : kSensitiveHomePaths) {
        if (is_within_root((home_path / entry.prefix).lexically_normal(), path)) {
            return std::string(entry.reason);
        }
    }
    return std::nullopt;
}

core::errors::Result<std::filesystem::path> Safeguard::validate_path_in_workspace(
    const std::filesystem::path& workspace_root,
    const std::filesystem::path& target_path) const {
    std::error_code ec;
    if (!std::filesystem::exists(workspace_root, ec) || ec) {
        return GateError{ErrorCategory::Input,
                         "Workspace root does not exist: " + workspace_root.string(),
                         "invalid_workspace_root"};
    }
    if (!std::filesystem::is_directory(workspace_root, ec) || ec) {
        return GateError{ErrorCategory::Input,
                         "Workspace root is not a directory: " +
                             workspace_root.string(),
                         "invalid_workspace_root"};
    }

    const std::filesystem::path canonical_root =
        std::filesystem::weakly_canonical(workspace_root, ec);
    if (ec) {
        return GateError{ErrorCategory::Input,
                         "Unable to resolve workspace root: " +
                             workspace_root.string(),
                         "invalid_workspace_root"};
    }

    std::filesystem::path candidate = target_path;
    if (candidate.is_relative()) {
        candidate = canonical_root / candidate;
    }

    const std::filesystem::path canonical_candidate =
        std::filesystem::weakly_canonical(candidate, ec);
    if (ec) {
        return GateError{ErrorCategory::Input,
                         "Unable to resolve target path: " + target_path.string(),
                         "invalid_path"};
    }

    if (!is_within_root(canonical_root, canonical_candidate)) {
        return GateError{ErrorCategory::Policy,
                         "Path escapes workspace root: " +
                             canonical_candidate.string(),
                         "path_outside_workspace"};
    }

    return canonical_candidate;
}

core::errors::Result<std::filesystem::path> Safeguard::validate_writable_path(
    const std::filesystem::path& path) const {
    std::error_code ec;
    const std::filesystem::path absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        return GateError{ErrorCategory::Input,
                         "Unable to resolve path: " + path.string(), "invalid_path"};
    }

    // Check the literal path first, then the resolved one to catch symlinks.
    auto reason = protected_path_reason(absolute);
    if (!reason.has_value()) {
        const auto resolved = std::filesystem::weakly_canonical(absolute, ec);
        if (!ec && resolved != absolute) {
            reason = protected_path_reason(resolved);
        }
    }

    if (reason.has_value()) {
        return GateError{ErrorCategory::Policy,
                         "BLOCKED: cannot modify \"" + path.string() + "\": " +
                             reason.value(),
                         "protected_path", kHardLimitHint};
    }
    return absolute;
}

core::errors::Result<std::string> Safeguard::validate_command(
    const std::string& command, const std::filesystem::path& cwd) const {
    const auto first = command.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return GateError{ErrorCategory::Input, "Command cannot be empty.",
                         "empty_command"};
    }
    const std::string trimmed = command.substr(first);
    const std::string lowered = lowercase(trimmed);

    auto blocked = [](const std::string& reason) {
        return GateError{ErrorCategory::Policy, "BLOCKED: " + reason,
                         "blocked_command", kHardLimitHint};
    };

    if (has_sudo(lowered)) {
        return blocked("sudo is not permitted; commands never run with elevated privileges");
    }
    if (has_su(lowered)) {
        return blocked("su is not permitted; commands never run as another user");
    }
    if (is_root_wipe(lowered)) {
        return blocked("cannot delete the root filesystem");
    }
    if (contains(lowered, "dd ") &&
        (contains(lowered, "of=/dev/") || contains(lowered, "of= /dev/"))) {
        return blocked("cannot write to block devices with dd");
    }
    for (const auto& tool : kDiskTools) {
        const std::string pattern(tool.pattern);
        if (starts_with(lowered, pattern) || contains(lowered, " " + pattern)) {
            return blocked(tool.reason);
        }
    }
    if (contains(trimmed, ":(){ :|:& };:")) {
        return blocked("fork bomb detected");
    }
    if (writes_to_device(lowered)) {
        return blocked("cannot write to device files");
    }

    const auto words = split_words(trimmed);
    const bool is_rm = !words.empty() && (words[0] == "rm" || words[0] == "rmdir");
    const bool is_perm = !words.empty() && (words[0] == "chmod" || words[0] == "chown");
    if (is_rm || is_perm) {
        for (std::size_t i = 1; i < words.size(); ++i) {
            const std::string& arg = words[i];
            if (starts_with(arg, "-")) {
                continue;
            }
            // Mode or owner arguments such as "755" or "root:root".
            if (is_perm && arg.size() <= 5 && arg.find('/') == std::string::npos) {
                continue;
            }
            std::filesystem::path target(arg);
            if (target.is_relative()) {
                target = cwd / target;
            }
            const auto reason = protected_path_reason(target.lexically_normal());
            if (reason.has_value()) {
                return blocked(std::string(is_rm ? "cannot delete \"" : "cannot modify permissions on \"") +
                               arg + "\": " + reason.value());
            }
        }
    }

    for (const auto& substring : command_policy_.blocked_substrings) {
        if (contains(lowered, lowercase(substring))) {
            return blocked("command contains blocked operation: " + substring);
        }
    }

    return trimmed;
}

}  // namespace toolgate::policy
