#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "protocol/request_context.hpp"
#include "protocol/tool_contract.hpp"

namespace toolgate::tools {

// Contract every capability implements. Implementations report failures
// through ToolResult::is_error; the registry also converts anything thrown
// out of execute() into an error result.
class Tool {
public:
    virtual ~Tool() = default;

    virtual std::string name() const = 0;
    virtual std::string description() const = 0;

    // Built once per tool and returned by reference so hosts can cache it.
    virtual const nlohmann::json& schema() const = 0;

    virtual bool requires_approval() const = 0;

    virtual protocol::ToolResult execute(const protocol::RequestContext& ctx,
                                         const nlohmann::json& input) = 0;

    // Command-style tools return the concrete command carried by the input so
    // the access policy can classify it. Everything else returns nullopt.
    virtual std::optional<std::string> approval_command(
        const nlohmann::json& /*input*/) const {
        return std::nullopt;
    }
};

}  // namespace toolgate::tools
