#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "tools/strap_router.hpp"
#include "tools/tool.hpp"

namespace toolgate::tools {

// Base for tools that group related operations under resource/action pairs.
// Subclasses describe themselves with a DomainSpec and implement dispatch();
// routing and validation happen here so a handler only ever sees a resource
// and action taken from its own declared sets.
class DomainTool : public Tool {
public:
    explicit DomainTool(DomainSpec spec);

    std::string name() const override;
    std::string description() const override;
    const nlohmann::json& schema() const override;

    const std::string& domain() const;
    std::vector<std::string> resources() const;
    std::vector<std::string> actions_for(const std::string& resource) const;

    protocol::ToolResult execute(const protocol::RequestContext& ctx,
                                 const nlohmann::json& input) final;

protected:
    virtual protocol::ToolResult dispatch(const protocol::RequestContext& ctx,
                                          const Route& route,
                                          const nlohmann::json& input) = 0;

    const StrapRouter& router() const { return router_; }

    // Error result for a validated string that has no enum mapping.
    protocol::ToolResult unmapped(const Route& route) const;

private:
    StrapRouter router_;
    std::string description_;
    nlohmann::json schema_;
};

}  // namespace toolgate::tools
