#pragma once
#include <string>
#include <utility>
#include <nlohmann/json.hpp>

namespace toolgate::protocol {

    // How the controller asks the registry to run a tool
    struct ToolCall {
        std::string id;
        std::string name;
        nlohmann::json input = nlohmann::json::object();
    };

    // What every tool, and the registry, hands back. Content is always text
    // the calling agent can reason about, including on failure.
    struct ToolResult {
        std::string content;
        bool is_error = false;

        static ToolResult ok(std::string text) {
            return ToolResult{std::move(text), false};
        }

        static ToolResult error(std::string text) {
            return ToolResult{std::move(text), true};
        }
    };

    // Entry in the list of tools handed to a language model
    struct ToolDefinition {
        std::string name;
        std::string description;
        nlohmann::json input_schema;
    };

} // namespace toolgate::protocol
