#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include "policy/safeguard.hpp"
#include "tools/domain_tool.hpp"

namespace toolgate::tools {

// Runs shell commands inside the workspace and lists processes. Command-style:
// the registry asks the access policy to classify every exec command.
class ShellTool : public DomainTool {
public:
    explicit ShellTool(std::filesystem::path workspace_root,
                       policy::Safeguard safeguard = policy::Safeguard());

    bool requires_approval() const override { return false; }
    std::optional<std::string> approval_command(
        const nlohmann::json& input) const override;

    static DomainSpec domain_spec();

protected:
    protocol::ToolResult dispatch(const protocol::RequestContext& ctx,
                                  const Route& route,
                                  const nlohmann::json& input) override;

private:
    enum class Action { Exec, ListProcesses };

    static std::optional<Action> to_action(const Route& route);

    protocol::ToolResult exec(const protocol::RequestContext& ctx,
                              const nlohmann::json& input) const;
    protocol::ToolResult list_processes(const protocol::RequestContext& ctx,
                                        const nlohmann::json& input) const;

    std::filesystem::path workspace_root_;
    policy::Safeguard safeguard_;
};

}  // namespace toolgate::tools
