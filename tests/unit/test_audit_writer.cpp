#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/request_id.hpp"
#include "registry/tool_registry.hpp"
#include "session/audit_writer.hpp"

namespace {

using nlohmann::json;
using toolgate::core::errors::get_error;
using toolgate::core::errors::get_value;
using toolgate::core::errors::is_error;
using toolgate::protocol::make_context;
using toolgate::protocol::Origin;
using toolgate::session::AuditRecord;
using toolgate::session::AuditWriter;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::temp_directory_path() /
                (".tmp_audit_" + toolgate::core::config::generate_session_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

std::vector<json> read_records(const std::filesystem::path& path) {
    std::vector<json> records;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        records.push_back(json::parse(line));
    }
    return records;
}

TEST(AuditWriterTest, AppendsOneJsonObjectPerLine) {
    TempWorkspace workspace;
    AuditWriter writer(workspace.root() / "logs" / "audit.jsonl");
    const auto ctx = make_context(Origin::Plugin, "sess-42");

    auto first = writer.write(ctx, AuditRecord{"executed", "file", false, "ok"});
    ASSERT_FALSE(is_error(first));
    EXPECT_EQ(get_value(first).string(), (workspace.root() / "logs" / "audit.jsonl").string());
    ASSERT_FALSE(is_error(writer.write(ctx, AuditRecord{"origin_denied", "shell", true, "no"})));

    const auto records = read_records(writer.log_path());
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0]["event"], "executed");
    EXPECT_EQ(records[0]["tool"], "file");
    EXPECT_EQ(records[0]["origin"], "plugin");
    EXPECT_EQ(records[0]["session_id"], "sess-42");
    EXPECT_EQ(records[0]["is_error"], false);
    EXPECT_TRUE(records[0]["ts_unix_ms"].is_number_integer());
    EXPECT_EQ(records[1]["event"], "origin_denied");
    EXPECT_EQ(records[1]["is_error"], true);
}

TEST(AuditWriterTest, ClipsLongDetail) {
    TempWorkspace workspace;
    AuditWriter writer(workspace.root() / "audit.jsonl");
    ASSERT_FALSE(is_error(writer.write(make_context(Origin::User),
                                       AuditRecord{"executed", "dump", false,
                                                   std::string(2000, 'z')})));
    const auto records = read_records(writer.log_path());
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0]["detail"].get<std::string>(), std::string(500, 'z') + "...");
}

TEST(AuditWriterTest, ReportsUnwritableLocation) {
    TempWorkspace workspace;
    std::ofstream(workspace.root() / "blocker") << "file, not a directory";
    AuditWriter writer(workspace.root() / "blocker" / "audit.jsonl");

    auto result = writer.write(make_context(Origin::User), AuditRecord{"executed", "x", false, ""});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "audit_dir_create_failed");
}

TEST(AuditWriterTest, RegistryRecordsEveryOutcome) {
    TempWorkspace workspace;
    auto writer = std::make_shared<AuditWriter>(workspace.root() / "audit.jsonl");
    toolgate::registry::Registry registry(nullptr);
    registry.set_audit_writer(writer);

    registry.execute(make_context(Origin::User), {"call-1", "missing", json::object()});
    auto cancelled = make_context(Origin::User);
    cancelled.cancel_token->store(true);
    registry.execute(cancelled, {"call-2", "missing", json::object()});

    const auto records = read_records(writer->log_path());
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0]["event"], "unknown_tool");
    EXPECT_EQ(records[0]["tool"], "missing");
    EXPECT_EQ(records[1]["event"], "cancelled");
}

}  // namespace
