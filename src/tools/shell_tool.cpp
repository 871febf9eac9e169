#include "tools/shell_tool.hpp"

#include <algorithm>
#include <array>
#include <sstream>
#include <utility>
#include "core/logging/logger.hpp"
#include "tools/process_runner.hpp"

namespace toolgate::tools {

using nlohmann::json;
using protocol::ToolResult;

namespace {

constexpr std::int64_t kDefaultTimeoutSeconds = 120;
constexpr std::int64_t kMaxTimeoutSeconds = 600;

std::string format_capture(const ProcessCapture& capture) {
    std::string text = capture.stdout_text;
    if (!capture.stderr_text.empty()) {
        if (!text.empty() && text.back() != '\n') {
            text += "\n";
        }
        text += "STDERR:\n" + capture.stderr_text;
    }
    return text.empty() ? "(no output)" : text;
}

// Deadline of the request wins over a longer per-command timeout.
std::uint32_t effective_timeout_ms(const protocol::RequestContext& ctx,
                                   const json& input) {
    std::int64_t seconds = kDefaultTimeoutSeconds;
    const auto it = input.find("timeout");
    if (it != input.end() && it->is_number_integer() && it->get<std::int64_t>() > 0) {
        seconds = std::min(it->get<std::int64_t>(), kMaxTimeoutSeconds);
    }
    std::int64_t timeout_ms = seconds * 1000;
    const auto remaining = ctx.remaining_ms();
    if (remaining.has_value()) {
        timeout_ms = std::max<std::int64_t>(1, std::min(timeout_ms, remaining.value()));
    }
    return static_cast<std::uint32_t>(timeout_ms);
}

}  // namespace

ShellTool::ShellTool(std::filesystem::path workspace_root, policy::Safeguard safeguard)
    : DomainTool(domain_spec()),
      workspace_root_(std::move(workspace_root)),
      safeguard_(std::move(safeguard)) {}

DomainSpec ShellTool::domain_spec() {
    DomainSpec spec;
    spec.domain = "shell";
    spec.description =
        "Run shell commands in the workspace and inspect running processes.";
    spec.resources = {
        {"bash", {"exec"}, "run a command with /bin/sh"},
        {"process", {"list"}, "running processes"},
    };
    spec.aliases = {
        {"sh", "bash"},      {"terminal", "bash"}, {"command", "bash"},
        {"processes", "process"}, {"ps", "process"},
    };

    FieldSpec command{"command", "string", "Shell command to run."};
    command.required_for = {"exec"};
    FieldSpec cwd{"cwd", "string", "Working directory relative to the workspace."};
    cwd.default_value = ".";
    FieldSpec timeout{"timeout", "integer", "Timeout in seconds (max 600)."};
    timeout.default_value = kDefaultTimeoutSeconds;
    FieldSpec filter{"filter", "string", "Only list processes whose line contains this text."};
    spec.fields = {command, cwd, timeout, filter};

    spec.examples = {
        R"({"resource": "bash", "action": "exec", "command": "ls -la"})",
        R"({"action": "list", "filter": "node"})",
    };
    return spec;
}

std::optional<ShellTool::Action> ShellTool::to_action(const Route& route) {
    static constexpr std::array<NamedValue<Action>, 2> kActions = {{
        {"bash/exec", Action::Exec},
        {"process/list", Action::ListProcesses},
    }};
    return lookup_named(kActions, route.resource + "/" + route.action);
}

std::optional<std::string> ShellTool::approval_command(const json& input) const {
    const auto routed = router().route(input);
    if (core::errors::is_error(routed)) {
        return std::nullopt;
    }
    if (to_action(core::errors::get_value(routed)) != Action::Exec) {
        return std::nullopt;
    }
    const auto it = input.find("command");
    if (it == input.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

ToolResult ShellTool::dispatch(const protocol::RequestContext& ctx, const Route& route,
                               const json& input) {
    const auto action = to_action(route);
    if (!action.has_value()) {
        return unmapped(route);
    }
    switch (action.value()) {
        case Action::Exec:
            return exec(ctx, input);
        case Action::ListProcesses:
            return list_processes(ctx, input);
    }
    return unmapped(route);
}

ToolResult ShellTool::exec(const protocol::RequestContext& ctx, const json& input) const {
    const auto command_it = input.find("command");
    if (command_it == input.end() || !command_it->is_string()) {
        return ToolResult::error("command is required for exec");
    }

    std::string cwd_arg = ".";
    const auto cwd_it = input.find("cwd");
    if (cwd_it != input.end() && cwd_it->is_string() &&
        !cwd_it->get<std::string>().empty()) {
        cwd_arg = cwd_it->get<std::string>();
    }
    const auto cwd = safeguard_.validate_path_in_workspace(workspace_root_, cwd_arg);
    if (core::errors::is_error(cwd)) {
        return ToolResult::error(core::errors::describe(core::errors::get_error(cwd)));
    }

    const auto command =
        safeguard_.validate_command(command_it->get<std::string>(),
                                    core::errors::get_value(cwd));
    if (core::errors::is_error(command)) {
        const auto& error = core::errors::get_error(command);
        LOG_WARN("ShellTool: " + error.message);
        return ToolResult::error(core::errors::describe(error));
    }

    ProcessRequest request;
    request.command = core::errors::get_value(command);
    request.working_directory = core::errors::get_value(cwd);
    request.timeout_ms = effective_timeout_ms(ctx, input);
    request.cancel_token = ctx.cancel_token;

    LOG_DEBUG("ShellTool: exec " + request.command);
    const auto captured = run_process(request);
    if (core::errors::is_error(captured)) {
        return ToolResult::error(core::errors::describe(core::errors::get_error(captured)));
    }
    const ProcessCapture& capture = core::errors::get_value(captured);

    if (capture.cancelled) {
        return ToolResult::error(format_capture(capture) + "\nCommand cancelled.");
    }
    if (capture.timed_out) {
        return ToolResult::error(format_capture(capture) + "\nCommand timed out after " +
                                 std::to_string(request.timeout_ms) + " ms.");
    }
    if (capture.truncated) {
        return ToolResult::error(format_capture(capture) + "\nCommand stopped: output exceeded " +
                                 std::to_string(request.max_output_bytes) + " bytes.");
    }
    if (capture.exit_code != 0) {
        return ToolResult::error(format_capture(capture) + "\nCommand failed with exit code " +
                                 std::to_string(capture.exit_code));
    }
    return ToolResult::ok(format_capture(capture));
}

ToolResult ShellTool::list_processes(const protocol::RequestContext& ctx,
                                     const json& input) const {
    ProcessRequest request;
    request.command = "ps -eo pid,ppid,pcpu,pmem,comm";
    request.working_directory = workspace_root_;
    request.timeout_ms = effective_timeout_ms(ctx, json::object());
    request.cancel_token = ctx.cancel_token;

    const auto captured = run_process(request);
    if (core::errors::is_error(captured)) {
        return ToolResult::error(core::errors::describe(core::errors::get_error(captured)));
    }
    const ProcessCapture& capture = core::errors::get_value(captured);
    if (capture.cancelled || capture.timed_out || capture.exit_code != 0) {
        return ToolResult::error("Failed to list processes: " + format_capture(capture));
    }

    std::string filter;
    const auto filter_it = input.find("filter");
    if (filter_it != input.end() && filter_it->is_string()) {
        filter = filter_it->get<std::string>();
    }
    if (filter.empty()) {
        return ToolResult::ok(capture.stdout_text);
    }

    std::istringstream lines(capture.stdout_text);
    std::ostringstream out;
    std::string line;
    bool header = true;
    std::size_t matches = 0;
    while (std::getline(lines, line)) {
        if (header || line.find(filter) != std::string::npos) {
            out << line << "\n";
            matches += header ? 0 : 1;
        }
        header = false;
    }
    if (matches == 0) {
        return ToolResult::ok("No processes match \"" + filter + "\".");
    }
    return ToolResult::ok(out.str());
}

}  // namespace toolgate::tools
