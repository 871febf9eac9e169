#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include "core/errors/gate_errors.hpp"
#include "protocol/request_context.hpp"

namespace toolgate::session {

// One dispatch outcome as written to the audit log.
struct AuditRecord {
    std::string event;  // e.g. "executed", "origin_denied", "approval_denied"
    std::string tool;
    bool is_error = false;
    std::string detail;
};

// Appends dispatch outcomes to a JSONL file, one object per line.
class AuditWriter {
public:
    explicit AuditWriter(std::filesystem::path log_path);

    core::errors::Result<std::filesystem::path> write(
        const protocol::RequestContext& ctx, const AuditRecord& record) const;

    const std::filesystem::path& log_path() const { return log_path_; }

private:
    core::errors::Result<std::filesystem::path> append_line(const std::string& line) const;

    std::filesystem::path log_path_;
    mutable std::mutex mutex_;
};

}  // namespace toolgate::session
