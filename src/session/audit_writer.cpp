#include "session/audit_writer.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>

namespace toolgate::session {

using core::errors::ErrorCategory;
using core::errors::GateError;
using nlohmann::json;

namespace {

constexpr std::size_t kMaxDetailChars = 500;

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

std::string clip(const std::string& text) {
    if (text.size() <= kMaxDetailChars) {
        return text;
    }
    return text.substr(0, kMaxDetailChars) + "...";
}

}  // namespace

AuditWriter::AuditWriter(std::filesystem::path log_path)
    : log_path_(std::move(log_path)) {}

core::errors::Result<std::filesystem::path> AuditWriter::append_line(
    const std::string& line) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    const auto parent = log_path_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return GateError{ErrorCategory::Internal,
                             "Unable to create audit directory: " + parent.string(),
                             "audit_dir_create_failed"};
        }
    }

    std::ofstream out(log_path_, std::ios::app);
    if (!out.is_open()) {
        return GateError{ErrorCategory::Internal,
                         "Unable to open audit log: " + log_path_.string(),
                         "audit_open_failed"};
    }

    out << line << "\n";
    if (!out.good()) {
        return GateError{ErrorCategory::Internal,
                         "Unable to write audit record: " + log_path_.string(),
                         "audit_write_failed"};
    }
    return log_path_;
}

core::errors::Result<std::filesystem::path> AuditWriter::write(
    const protocol::RequestContext& ctx, const AuditRecord& record) const {
    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = record.event;
    event["tool"] = record.tool;
    event["origin"] = protocol::to_string(ctx.origin);
    event["session_id"] = ctx.session_id;
    event["is_error"] = record.is_error;
    event["detail"] = clip(record.detail);
    // Tool output may hold arbitrary bytes; never let a bad byte throw here.
    return append_line(event.dump(-1, ' ', false, json::error_handler_t::replace));
}

}  // namespace toolgate::session
