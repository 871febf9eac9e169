#pragma once

#include <filesystem>
#include <optional>
#include "policy/safeguard.hpp"
#include "tools/domain_tool.hpp"

namespace toolgate::tools {

// Reads, writes, edits and searches files confined to the workspace root.
class FileTool : public DomainTool {
public:
    explicit FileTool(std::filesystem::path workspace_root,
                      policy::Safeguard safeguard = policy::Safeguard());

    bool requires_approval() const override { return false; }

    static DomainSpec domain_spec();

protected:
    protocol::ToolResult dispatch(const protocol::RequestContext& ctx,
                                  const Route& route,
                                  const nlohmann::json& input) override;

private:
    enum class Action { Read, Write, Edit, Grep };

    static std::optional<Action> to_action(const Route& route);

    protocol::ToolResult read(const nlohmann::json& input) const;
    protocol::ToolResult write(const nlohmann::json& input) const;
    protocol::ToolResult edit(const nlohmann::json& input) const;
    protocol::ToolResult grep(const protocol::RequestContext& ctx,
                              const nlohmann::json& input) const;

    // Resolves the path inside the workspace; writable paths also pass the
    // protected-path check.
    core::errors::Result<std::filesystem::path> resolve(const nlohmann::json& input,
                                                        bool for_write) const;

    std::filesystem::path workspace_root_;
    policy::Safeguard safeguard_;
};

}  // namespace toolgate::tools
