#pragma once

#include <filesystem>
#include <optional>
#include "tools/domain_tool.hpp"

namespace toolgate::tools {

// Captures the screen to a PNG through the platform's capture command.
class ScreenshotTool : public DomainTool {
public:
    explicit ScreenshotTool(std::filesystem::path output_dir);

    bool requires_approval() const override { return false; }

    static DomainSpec domain_spec();

    // Shell command that writes a capture of the whole screen to path.
    static std::string capture_command(const std::filesystem::path& path);

protected:
    protocol::ToolResult dispatch(const protocol::RequestContext& ctx,
                                  const Route& route,
                                  const nlohmann::json& input) override;

private:
    enum class Action { Capture };

    static std::optional<Action> to_action(const Route& route);

    std::filesystem::path output_dir_;
};

}  // namespace toolgate::tools
