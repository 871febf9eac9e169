#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "tools/strap_router.hpp"

namespace {

using nlohmann::json;
using toolgate::core::errors::get_error;
using toolgate::core::errors::get_value;
using toolgate::core::errors::is_error;
using toolgate::tools::DomainSpec;
using toolgate::tools::FieldSpec;
using toolgate::tools::ResourceSpec;
using toolgate::tools::StrapRouter;

DomainSpec messaging_domain() {
    DomainSpec spec;
    spec.domain = "messaging";
    spec.description = "Send and read messages.";
    spec.resources = {
        ResourceSpec{"message", {"send", "list"}, "single messages"},
        ResourceSpec{"thread", {"list", "archive"}, ""},
        ResourceSpec{"draft", {"compose"}, ""},
    };
    spec.aliases = {{"msg", "message"}, {"conversation", "thread"}};
    FieldSpec to;
    to.name = "to";
    to.type = "string";
    to.description = "Recipient.";
    to.required_for = {"send"};
    FieldSpec limit;
    limit.name = "limit";
    limit.type = "integer";
    limit.description = "Maximum rows.";
    limit.default_value = 20;
    FieldSpec labels;
    labels.name = "labels";
    labels.type = "array";
    labels.description = "Labels to apply.";
    FieldSpec body;
    body.name = "body";
    body.type = "string";
    body.description = "Message body.";
    body.required = true;
    spec.fields = {to, limit, labels, body};
    spec.examples = {R"({"action": "send", "to": "ops", "body": "hi"})"};
    return spec;
}

DomainSpec flat_domain() {
    DomainSpec spec;
    spec.domain = "camera";
    spec.description = "Capture frames.";
    spec.resources = {ResourceSpec{"", {"snap", "record"}, ""}};
    return spec;
}

TEST(StrapRouterTest, RoutesExplicitResourceAndAction) {
    StrapRouter router(messaging_domain());
    auto result = router.route({{"resource", "message"}, {"action", "send"}});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).resource, "message");
    EXPECT_EQ(get_value(result).action, "send");
}

TEST(StrapRouterTest, NormalizesAliasesAndCase) {
    StrapRouter router(messaging_domain());
    auto result = router.route({{"resource", "  MSG "}, {"action", "Send"}});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).resource, "message");
    EXPECT_EQ(get_value(result).action, "send");

    EXPECT_EQ(router.normalize_resource("Conversation"), "thread");
    EXPECT_EQ(router.normalize_resource("unknown"), "unknown");
}

TEST(StrapRouterTest, InfersResourceFromUniqueAction) {
    StrapRouter router(messaging_domain());
    auto result = router.route({{"action", "archive"}});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).resource, "thread");

    EXPECT_EQ(router.infer_resource("", "compose"), "draft");
    EXPECT_EQ(router.infer_resource("", "list"), "");
    EXPECT_EQ(router.infer_resource("message", "archive"), "message");
}

TEST(StrapRouterTest, AmbiguousActionNamesOwningResources) {
    StrapRouter router(messaging_domain());
    auto result = router.route({{"action", "list"}});
    ASSERT_TRUE(is_error(result));
    const auto& err = get_error(result);
    EXPECT_EQ(err.code, "ambiguous_action");
    EXPECT_NE(err.message.find("message, thread"), std::string::npos);
}

TEST(StrapRouterTest, UnknownResourceListsValidResources) {
    StrapRouter router(messaging_domain());
    auto result = router.route({{"resource", "folder"}, {"action", "list"}});
    ASSERT_TRUE(is_error(result));
    const auto& err = get_error(result);
    EXPECT_EQ(err.code, "unknown_resource");
    EXPECT_NE(err.message.find("message, thread, draft"), std::string::npos);
    EXPECT_NE(err.hint.find("Valid for messaging -> "), std::string::npos);
}

TEST(StrapRouterTest, UnknownActionListsValidActions) {
    StrapRouter router(messaging_domain());
    auto on_resource = router.route({{"resource", "thread"}, {"action", "send"}});
    ASSERT_TRUE(is_error(on_resource));
    EXPECT_EQ(get_error(on_resource).code, "unknown_action");
    EXPECT_NE(get_error(on_resource).message.find("list, archive"), std::string::npos);

    auto anywhere = router.route({{"action", "delete"}});
    ASSERT_TRUE(is_error(anywhere));
    EXPECT_EQ(get_error(anywhere).code, "unknown_action");
    EXPECT_NE(get_error(anywhere).message.find("message, thread, draft"),
              std::string::npos);
}

TEST(StrapRouterTest, RejectsMalformedInput) {
    StrapRouter router(messaging_domain());
    EXPECT_EQ(get_error(router.route(json::array())).code, "invalid_payload");
    EXPECT_EQ(get_error(router.route(json::object())).code, "missing_action");
    EXPECT_EQ(get_error(router.route({{"action", "   "}})).code, "missing_action");
    EXPECT_EQ(get_error(router.route({{"action", 3}})).code, "missing_action");
    EXPECT_EQ(get_error(router.route({{"resource", 1}, {"action", "send"}})).code,
              "invalid_payload");
}

TEST(StrapRouterTest, FlatDomainIgnoresResource) {
    StrapRouter router(flat_domain());
    EXPECT_TRUE(router.is_flat());
    EXPECT_TRUE(router.resources().empty());

    auto result = router.route({{"action", "record"}});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).resource, "");
    EXPECT_EQ(get_value(result).action, "record");

    auto bad = router.route({{"action", "zoom"}});
    ASSERT_TRUE(is_error(bad));
    EXPECT_EQ(get_error(bad).code, "unknown_action");
    EXPECT_NE(get_error(bad).message.find("snap, record"), std::string::npos);
}

TEST(StrapRouterTest, SchemaCarriesEnumsDefaultsAndRequired) {
    StrapRouter router(messaging_domain());
    const json schema = router.build_schema();

    EXPECT_EQ(schema["type"], "object");
    const auto& props = schema["properties"];
    EXPECT_EQ(props["resource"]["enum"], json({"message", "thread", "draft"}));
    EXPECT_EQ(props["action"]["enum"], json({"send", "list", "archive", "compose"}));
    EXPECT_EQ(props["limit"]["default"], 20);
    EXPECT_EQ(props["labels"]["items"]["type"], "string");
    EXPECT_NE(props["to"]["description"].get<std::string>().find("Required for: send."),
              std::string::npos);
    EXPECT_EQ(schema["required"], json({"action", "body"}));
}

TEST(StrapRouterTest, FlatSchemaHasNoResourceProperty) {
    StrapRouter router(flat_domain());
    const json schema = router.build_schema();
    EXPECT_FALSE(schema["properties"].contains("resource"));
    EXPECT_EQ(schema["properties"]["action"]["enum"], json({"snap", "record"}));
}

TEST(StrapRouterTest, DescriptionListsResourcesAndExamples) {
    StrapRouter router(messaging_domain());
    const std::string description = router.build_description();
    EXPECT_EQ(description.rfind("Send and read messages.", 0), 0u);
    EXPECT_NE(description.find("- message: send, list (single messages)"), std::string::npos);
    EXPECT_NE(description.find("- draft: compose"), std::string::npos);
    EXPECT_NE(description.find("Examples:\n  {\"action\": \"send\""), std::string::npos);

    StrapRouter flat(flat_domain());
    EXPECT_NE(flat.build_description().find("Actions: snap, record"), std::string::npos);
}

TEST(StrapRouterTest, SummaryAndActionsFor) {
    StrapRouter router(messaging_domain());
    EXPECT_EQ(router.summary(), "message: send, list; thread: list, archive; draft: compose");
    EXPECT_EQ(router.actions_for("thread"), (std::vector<std::string>{"list", "archive"}));
    EXPECT_TRUE(router.actions_for("folder").empty());
}

}  // namespace
