#include "tools/domain_tool.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace toolgate::tools {

using protocol::ToolResult;

DomainTool::DomainTool(DomainSpec spec)
    : router_(std::move(spec)),
      description_(router_.build_description()),
      schema_(router_.build_schema()) {}

std::string DomainTool::name() const { return router_.spec().domain; }

std::string DomainTool::description() const { return description_; }

const nlohmann::json& DomainTool::schema() const { return schema_; }

const std::string& DomainTool::domain() const { return router_.spec().domain; }

std::vector<std::string> DomainTool::resources() const { return router_.resources(); }

std::vector<std::string> DomainTool::actions_for(const std::string& resource) const {
    return router_.actions_for(resource);
}

ToolResult DomainTool::execute(const protocol::RequestContext& ctx,
                               const nlohmann::json& input) {
    const auto routed = router_.route(input);
    if (core::errors::is_error(routed)) {
        return ToolResult::error(core::errors::describe(core::errors::get_error(routed)));
    }
    return dispatch(ctx, core::errors::get_value(routed), input);
}

ToolResult DomainTool::unmapped(const Route& route) const {
    LOG_ERROR(domain() + ": no handler mapped for " + route.resource + "/" +
              route.action);
    return ToolResult::error("internal error: " + domain() + " has no handler for " +
                             (route.resource.empty() ? "" : route.resource + "/") +
                             route.action);
}

}  // namespace toolgate::tools
