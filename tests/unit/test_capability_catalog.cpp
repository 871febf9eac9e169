#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/gate_config.hpp"
#include "tools/builtin_tools.hpp"
#include "tools/capability.hpp"
#include "tools/screenshot_tool.hpp"

namespace {

using toolgate::protocol::RequestContext;
using toolgate::protocol::ToolResult;
using toolgate::tools::Capability;
using toolgate::tools::CapabilityCatalog;
using toolgate::tools::PermissionMap;
using toolgate::tools::Platform;

class NamedTool : public toolgate::tools::Tool {
public:
    NamedTool(std::string name, std::string label)
        : name_(std::move(name)), label_(std::move(label)) {}

    std::string name() const override { return name_; }
    std::string description() const override { return label_; }
    const nlohmann::json& schema() const override { return schema_; }
    bool requires_approval() const override { return false; }
    ToolResult execute(const RequestContext&, const nlohmann::json&) override {
        return ToolResult::ok(label_);
    }

private:
    std::string name_;
    std::string label_;
    nlohmann::json schema_ = nlohmann::json::object();
};

Capability capability(const std::string& name, std::vector<Platform> platforms,
                      const std::string& category, const std::string& label = "") {
    return Capability{std::make_shared<NamedTool>(name, label), std::move(platforms), category};
}

CapabilityCatalog sample_catalog() {
    CapabilityCatalog catalog;
    catalog.add(capability("file", {Platform::All}, "files"));
    catalog.add(capability("shell", {}, "system"));
    catalog.add(capability("contacts", {Platform::Darwin}, "productivity"));
    catalog.add(capability("screenshot", {Platform::Darwin, Platform::Linux}, "desktop"));
    catalog.add(capability("camera", {Platform::Ios, Platform::Android}, "media"));
    return catalog;
}

std::vector<std::string> names_of(const CapabilityCatalog& catalog) {
    std::vector<std::string> names;
    for (const auto& entry : catalog.entries()) {
        names.push_back(entry.tool->name());
    }
    return names;
}

TEST(CapabilityCatalogTest, KeepsRegistrationOrder) {
    const auto catalog = sample_catalog();
    EXPECT_EQ(names_of(catalog), (std::vector<std::string>{"file", "shell", "contacts",
                                                           "screenshot", "camera"}));
}

TEST(CapabilityCatalogTest, DuplicateNameReplacesInPlace) {
    CapabilityCatalog catalog = sample_catalog();
    catalog.add(capability("shell", {Platform::Linux}, "system", "replacement"));
    EXPECT_EQ(catalog.size(), 5u);
    ASSERT_NE(catalog.find("shell"), nullptr);
    EXPECT_EQ(catalog.find("shell")->tool->description(), "replacement");
    EXPECT_EQ(names_of(catalog)[1], "shell");
}

TEST(CapabilityCatalogTest, IgnoresCapabilityWithoutTool) {
    CapabilityCatalog catalog;
    catalog.add(Capability{nullptr, {Platform::All}, "files"});
    EXPECT_EQ(catalog.size(), 0u);
}

TEST(CapabilityCatalogTest, FiltersByPlatform) {
    const auto catalog = sample_catalog();
    EXPECT_EQ(names_of(catalog.filter_for(Platform::Linux)),
              (std::vector<std::string>{"file", "shell", "screenshot"}));
    EXPECT_EQ(names_of(catalog.filter_for(Platform::Ios)),
              (std::vector<std::string>{"file", "shell", "camera"}));
    EXPECT_EQ(catalog.filter_for(Platform::Windows).size(), 2u);
}

TEST(CapabilityCatalogTest, FalsePermissionDropsCategory) {
    const auto catalog = sample_catalog();
    const PermissionMap permissions = {{"contacts", false}, {"desktop", true}, {"system", false}};
    EXPECT_EQ(names_of(catalog.filter_by_permissions(permissions)),
              (std::vector<std::string>{"file", "screenshot", "camera"}));
}

TEST(CapabilityCatalogTest, MissingPermissionMapKeepsEverything) {
    const auto catalog = sample_catalog();
    EXPECT_EQ(catalog.filter_by_permissions(std::nullopt).size(), 5u);
    EXPECT_EQ(catalog.filter_by_permissions(PermissionMap{}).size(), 5u);
}

TEST(CapabilityCatalogTest, ListsByCategory) {
    const auto catalog = sample_catalog();
    const auto desktop = catalog.list_by_category("desktop");
    ASSERT_EQ(desktop.size(), 1u);
    EXPECT_EQ(desktop.front().tool->name(), "screenshot");
    EXPECT_TRUE(catalog.list_by_category("finance").empty());
    EXPECT_EQ(catalog.find("missing"), nullptr);
}

TEST(CapabilityCatalogTest, CategoryPermissionMapping) {
    EXPECT_EQ(toolgate::tools::permission_for_category("productivity").value_or(""), "contacts");
    EXPECT_EQ(toolgate::tools::permission_for_category("desktop").value_or(""), "desktop");
    EXPECT_FALSE(toolgate::tools::permission_for_category("files").has_value());
}

TEST(CapabilityCatalogTest, ParsesPlatformNames) {
    EXPECT_EQ(toolgate::tools::parse_platform("macOS").value_or(Platform::All), Platform::Darwin);
    EXPECT_EQ(toolgate::tools::parse_platform("linux").value_or(Platform::All), Platform::Linux);
    EXPECT_FALSE(toolgate::tools::parse_platform("beos").has_value());
    EXPECT_EQ(toolgate::tools::to_string(Platform::Android), "android");
}

TEST(CapabilityCatalogTest, BuiltinCatalogShipsFileShellAndScreenshot) {
    toolgate::core::config::GateConfig config;
    const auto catalog = toolgate::tools::builtin_capabilities(config);
    EXPECT_EQ(names_of(catalog), (std::vector<std::string>{"file", "shell", "screenshot"}));

    const auto* screenshot = catalog.find("screenshot");
    ASSERT_NE(screenshot, nullptr);
    EXPECT_EQ(screenshot->category, "desktop");
    EXPECT_TRUE(screenshot->requires_setup);
    EXPECT_FALSE(screenshot->available_on(Platform::Windows));

    EXPECT_EQ(names_of(catalog.filter_for(Platform::Windows)),
              (std::vector<std::string>{"file", "shell"}));
}

TEST(CapabilityCatalogTest, ScreenshotIsFlatDomain) {
    toolgate::tools::ScreenshotTool tool("shots");
    const auto& schema = tool.schema();
    EXPECT_FALSE(schema["properties"].contains("resource"));
    EXPECT_EQ(schema["properties"]["action"]["enum"], nlohmann::json({"capture"}));
    EXPECT_TRUE(tool.resources().empty());
}

TEST(CapabilityCatalogTest, ScreenshotRejectsUnknownActionAndPathNames) {
    toolgate::tools::ScreenshotTool tool("shots");
    const auto ctx = toolgate::protocol::make_context(toolgate::protocol::Origin::User);

    const auto unknown = tool.execute(ctx, {{"action", "record"}});
    EXPECT_TRUE(unknown.is_error);
    EXPECT_NE(unknown.content.find("capture"), std::string::npos);

    const auto nested = tool.execute(ctx, {{"action", "Capture"}, {"name", "../evil.png"}});
    EXPECT_TRUE(nested.is_error);
    EXPECT_EQ(nested.content, "name must be a plain file name");
}

}  // namespace
