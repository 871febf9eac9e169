#include "tools/screenshot_tool.hpp"

#include <array>
#include <chrono>
#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"
#include "tools/process_runner.hpp"

namespace toolgate::tools {

using nlohmann::json;
using protocol::ToolResult;

namespace {

constexpr std::uint32_t kCaptureTimeoutMs = 15000;

std::string shell_quote(const std::string& value) {
    std::string quoted = "'";
    for (const char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    return quoted + "'";
}

std::string default_file_name() {
    const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::system_clock::now().time_since_epoch())
                         .count();
    return "screenshot-" + std::to_string(now) + ".png";
}

}  // namespace

ScreenshotTool::ScreenshotTool(std::filesystem::path output_dir)
    : DomainTool(domain_spec()), output_dir_(std::move(output_dir)) {}

DomainSpec ScreenshotTool::domain_spec() {
    DomainSpec spec;
    spec.domain = "screenshot";
    spec.description = "Capture the whole screen to a PNG file.";
    spec.resources = {{"", {"capture"}, ""}};
    FieldSpec name{"name", "string", "File name for the capture, without directories."};
    spec.fields = {name};
    spec.examples = {R"({"action": "capture"})"};
    return spec;
}

std::string ScreenshotTool::capture_command(const std::filesystem::path& path) {
    const std::string target = shell_quote(path.string());
#if defined(__APPLE__)
    return "screencapture -x " + target;
#else
    return "if command -v grim >/dev/null 2>&1; then grim " + target +
           "; elif command -v scrot >/dev/null 2>&1; then scrot -o " + target +
           "; elif command -v import >/dev/null 2>&1; then import -window root " + target +
           "; else echo 'no screenshot utility found (grim, scrot, import)' >&2; exit 1; fi";
#endif
}

std::optional<ScreenshotTool::Action> ScreenshotTool::to_action(const Route& route) {
    static constexpr std::array<NamedValue<Action>, 1> kActions = {{
        {"capture", Action::Capture},
    }};
    return lookup_named(kActions, route.action);
}

ToolResult ScreenshotTool::dispatch(const protocol::RequestContext& ctx,
                                    const Route& route, const json& input) {
    if (to_action(route) != Action::Capture) {
        return unmapped(route);
    }

    std::string file_name = default_file_name();
    const auto name_it = input.find("name");
    if (name_it != input.end() && name_it->is_string() &&
        !name_it->get<std::string>().empty()) {
        const std::filesystem::path requested(name_it->get<std::string>());
        if (requested.has_parent_path() || requested.filename() == "..") {
            return ToolResult::error("name must be a plain file name");
        }
        file_name = requested.string();
    }

    std::error_code ec;
    std::filesystem::create_directories(output_dir_, ec);
    if (ec) {
        return ToolResult::error("Failed to create screenshot directory: " +
                                 output_dir_.string());
    }
    const std::filesystem::path target = output_dir_ / file_name;

    ProcessRequest request;
    request.command = capture_command(target);
    request.working_directory = output_dir_;
    request.timeout_ms = kCaptureTimeoutMs;
    request.cancel_token = ctx.cancel_token;

    const auto captured = run_process(request);
    if (core::errors::is_error(captured)) {
        return ToolResult::error(core::errors::describe(core::errors::get_error(captured)));
    }
    const ProcessCapture& capture = core::errors::get_value(captured);
    if (capture.cancelled || capture.timed_out || capture.exit_code != 0) {
        LOG_WARN("ScreenshotTool: capture failed: " + capture.stderr_text);
        return ToolResult::error("Screenshot failed: " +
                                 (capture.stderr_text.empty()
                                      ? "exit code " + std::to_string(capture.exit_code)
                                      : capture.stderr_text));
    }
    return ToolResult::ok("Screenshot saved to " + target.string());
}

}  // namespace toolgate::tools
