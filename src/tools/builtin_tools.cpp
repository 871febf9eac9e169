#include "tools/builtin_tools.hpp"

#include <memory>
#include "tools/file_tool.hpp"
#include "tools/screenshot_tool.hpp"
#include "tools/shell_tool.hpp"

namespace toolgate::tools {

CapabilityCatalog builtin_capabilities(const core::config::GateConfig& config) {
    const std::filesystem::path& workspace = config.workspace;

    CapabilityCatalog catalog;
    catalog.add(Capability{std::make_shared<FileTool>(workspace), {Platform::All}, "files"});
    catalog.add(Capability{std::make_shared<ShellTool>(workspace), {Platform::All}, "system"});
    catalog.add(Capability{std::make_shared<ScreenshotTool>(workspace / ".toolgate" / "screenshots"),
                           {Platform::Darwin, Platform::Linux},
                           "desktop",
                           true});
    return catalog;
}

}  // namespace toolgate::tools
