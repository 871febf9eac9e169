#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include "core/config/gate_config.hpp"
#include "core/config/request_id.hpp"
#include "policy/access_policy.hpp"

namespace {

using toolgate::core::config::GateConfig;
using toolgate::core::config::kDefaultMaxResultChars;
using toolgate::core::config::parse_config;
using toolgate::core::errors::get_error;
using toolgate::core::errors::get_value;
using toolgate::core::errors::is_error;
using toolgate::policy::AccessLevel;
using toolgate::policy::AccessPolicy;
using toolgate::policy::AskMode;
using toolgate::protocol::Origin;

TEST(GateConfigTest, EmptyObjectGivesDefaults) {
    auto parsed = parse_config("{}");
    ASSERT_FALSE(is_error(parsed));
    const GateConfig& config = get_value(parsed);
    EXPECT_EQ(config.policy.level, AccessLevel::Allowlist);
    EXPECT_EQ(config.policy.ask_mode, AskMode::OnMiss);
    EXPECT_FALSE(config.policy.autonomous);
    EXPECT_FALSE(config.policy.origin_deny.has_value());
    EXPECT_EQ(config.max_result_chars, kDefaultMaxResultChars);
    EXPECT_EQ(kDefaultMaxResultChars, 100000u);
    EXPECT_TRUE(config.desktop_lane);
    EXPECT_FALSE(config.permissions.has_value());
    EXPECT_EQ(config.workspace.string(), ".");
    EXPECT_FALSE(config.audit_log.has_value());
}

TEST(GateConfigTest, ParsesFullDocument) {
    const std::string text = R"({
        "policy": {
            "level": "full",
            "ask_mode": "always",
            "allowlist": ["make", "cargo build"],
            "autonomous": true,
            "origin_deny": {"inter-agent": ["shell", "file"], "plugin": []}
        },
        "registry": {"max_result_chars": 2048, "desktop_lane": false},
        "permissions": {"desktop": false, "system": true},
        "workspace": "/srv/project",
        "audit_log": "logs/audit.jsonl"
    })";
    auto parsed = parse_config(text);
    ASSERT_FALSE(is_error(parsed)) << get_error(parsed).message;
    const GateConfig& config = get_value(parsed);

    EXPECT_EQ(config.policy.level, AccessLevel::Full);
    EXPECT_EQ(config.policy.ask_mode, AskMode::Always);
    EXPECT_EQ(config.policy.allowlist, (std::vector<std::string>{"make", "cargo build"}));
    EXPECT_TRUE(config.policy.autonomous);
    ASSERT_TRUE(config.policy.origin_deny.has_value());
    EXPECT_EQ(config.policy.origin_deny->at(Origin::Comm).count("file"), 1u);
    EXPECT_TRUE(config.policy.origin_deny->at(Origin::Plugin).empty());

    EXPECT_EQ(config.max_result_chars, 2048u);
    EXPECT_FALSE(config.desktop_lane);
    ASSERT_TRUE(config.permissions.has_value());
    EXPECT_FALSE(config.permissions->at("desktop"));
    EXPECT_EQ(config.workspace.string(), "/srv/project");
    EXPECT_EQ(config.audit_log.value_or("").string(), "logs/audit.jsonl");
}

TEST(GateConfigTest, RejectsInvalidValues) {
    const char* cases[] = {
        R"({"policy": {"level": "root"}})",
        R"({"policy": {"ask_mode": 1}})",
        R"({"policy": {"allowlist": ["ok", 2]}})",
        R"({"policy": {"origin_deny": {"martian": ["shell"]}}})",
        R"({"registry": {"max_result_chars": 0}})",
        R"({"registry": {"desktop_lane": "yes"}})",
        R"({"permissions": {"desktop": "no"}})",
        R"({"workspace": 7})",
        R"([1, 2])",
    };
    for (const char* text : cases) {
        auto parsed = parse_config(text);
        ASSERT_TRUE(is_error(parsed)) << text;
        EXPECT_EQ(get_error(parsed).code, "invalid_config") << text;
        EXPECT_EQ(get_error(parsed).message.rfind("Invalid configuration: ", 0), 0u) << text;
    }
}

TEST(GateConfigTest, RejectsMalformedJson) {
    auto parsed = parse_config("{\"policy\": ");
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).code, "invalid_config");
    EXPECT_NE(get_error(parsed).message.find("malformed JSON"), std::string::npos);
}

TEST(GateConfigTest, LoadsFromFile) {
    const auto path = std::filesystem::temp_directory_path() /
                      ("toolgate_config_" + toolgate::core::config::generate_session_id() +
                       ".json");
    {
        std::ofstream out(path);
        out << R"({"policy": {"level": "deny"}})";
    }
    auto loaded = toolgate::core::config::load_config_file(path);
    std::error_code ec;
    std::filesystem::remove(path, ec);

    ASSERT_FALSE(is_error(loaded));
    EXPECT_EQ(get_value(loaded).policy.level, AccessLevel::Deny);

    auto missing = toolgate::core::config::load_config_file(path);
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "config_not_found");
}

TEST(GateConfigTest, AppliesPolicySection) {
    auto parsed = parse_config(R"({
        "policy": {
            "level": "allowlist",
            "ask_mode": "on-miss",
            "allowlist": ["make"],
            "origin_deny": {"skill": ["file"]}
        }
    })");
    ASSERT_FALSE(is_error(parsed));

    AccessPolicy access;
    toolgate::core::config::apply_policy_config(get_value(parsed).policy, access);
    EXPECT_TRUE(access.is_allowed("make install"));
    EXPECT_TRUE(access.is_denied_for_origin(Origin::Skill, "file"));
    // Skill's configured set replaces its default; comm keeps the default.
    EXPECT_FALSE(access.is_denied_for_origin(Origin::Skill, "shell"));
    EXPECT_TRUE(access.is_denied_for_origin(Origin::Comm, "shell"));
    EXPECT_TRUE(access.command_requires_approval("curl example.com"));

    toolgate::core::config::PolicyConfig autonomous;
    autonomous.autonomous = true;
    toolgate::core::config::apply_policy_config(autonomous, access);
    EXPECT_FALSE(access.command_requires_approval("curl example.com"));
}

TEST(GateConfigTest, OriginDenyOverridesOnlyNamedOrigins) {
    auto parsed = parse_config(R"({
        "policy": {"origin_deny": {"comm": ["shell", "file"], "plugin": []}}
    })");
    ASSERT_FALSE(is_error(parsed));

    AccessPolicy access;
    toolgate::core::config::apply_policy_config(get_value(parsed).policy, access);
    EXPECT_TRUE(access.is_denied_for_origin(Origin::Comm, "shell"));
    EXPECT_TRUE(access.is_denied_for_origin(Origin::Comm, "file"));
    EXPECT_FALSE(access.is_denied_for_origin(Origin::Plugin, "shell"));
    EXPECT_TRUE(access.is_denied_for_origin(Origin::Skill, "shell"));
    EXPECT_FALSE(access.is_denied_for_origin(Origin::User, "shell"));
}

}  // namespace
