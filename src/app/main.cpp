#include <cctype>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include "app/cli_parser.hpp"
#include "core/config/gate_config.hpp"
#include "core/config/request_id.hpp"
#include "core/errors/gate_errors.hpp"
#include "core/logging/logger.hpp"
#include "policy/access_policy.hpp"
#include "policy/approval_broker.hpp"
#include "registry/tool_registry.hpp"
#include "runtime/desktop_lane.hpp"
#include "session/audit_writer.hpp"
#include "tools/builtin_tools.hpp"

namespace {

using toolgate::policy::PendingApproval;

// Prompts on stderr/stdin so stdout carries only the tool result.
void prompt_for_approval(toolgate::policy::ApprovalBroker& broker,
                         toolgate::registry::Registry& registry,
                         const PendingApproval& request, const bool auto_approve) {
    if (auto_approve) {
        LOG_INFO("Auto-approving " + request.tool_name + " (--yes)");
        broker.resolve(request.request_id, true);
        return;
    }

    std::cerr << "\nApproval required [" << request.request_id << "]\n"
              << "  tool:   " << request.tool_name << "\n"
              << "  origin: " << toolgate::protocol::to_string(request.origin) << "\n"
              << "  input:  " << request.input.dump() << "\n"
              << "Allow? [y]es / [n]o / [a]lways: " << std::flush;

    std::string answer;
    if (!std::getline(std::cin, answer)) {
        answer = "n";
    }
    const char choice = answer.empty() ? 'n' : static_cast<char>(std::tolower(
                                                    static_cast<unsigned char>(answer[0])));
    if (choice == 'a') {
        const auto tool = registry.get(request.tool_name);
        const auto command = tool ? tool->approval_command(request.input) : std::nullopt;
        if (command.has_value()) {
            registry.policy().add_to_allowlist(command.value());
            LOG_INFO("Added to allowlist: " + command.value());
        }
    }
    broker.resolve(request.request_id, choice == 'y' || choice == 'a');
}

}  // namespace

int main(int argc, char* argv[]) {
    namespace errors = toolgate::core::errors;
    namespace config = toolgate::core::config;

    // 1. Parse CLI input and return normalized input errors
    auto parsed = toolgate::app::cli::parse_and_validate(argc, argv);
    if (errors::is_error(parsed)) {
        const auto& err = errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            std::cerr << err.hint << std::endl;
        }
        return 2;
    }
    const auto& req = errors::get_value(parsed);

    const std::string session_id = req.session_id.value_or(config::generate_session_id());
    auto& logger = toolgate::core::logging::Logger::get();
    logger.set_tag(session_id);
    if (req.verbose) {
        logger.set_level(toolgate::core::logging::LogLevel::DEBUG);
    }

    // 2. Load configuration
    config::GateConfig gate_config;
    if (req.config_path.has_value()) {
        auto loaded = config::load_config_file(req.config_path.value());
        if (errors::is_error(loaded)) {
            const auto& err = errors::get_error(loaded);
            LOG_ERROR("Config error [" + err.code + "]: " + err.message);
            return 3;
        }
        gate_config = errors::get_value(loaded);
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(gate_config.workspace, ec) || ec) {
        LOG_ERROR("Config error: workspace is not a directory: " +
                  gate_config.workspace.string());
        return 3;
    }

    // 3. Assemble policy and registry
    auto access_policy = std::make_shared<toolgate::policy::AccessPolicy>();
    config::apply_policy_config(gate_config.policy, *access_policy);

    toolgate::registry::Registry registry(access_policy,
                                          toolgate::registry::RegistryOptions{
                                              gate_config.max_result_chars});
    const auto catalog = toolgate::tools::builtin_capabilities(gate_config)
                             .filter_for(toolgate::tools::current_platform())
                             .filter_by_permissions(gate_config.permissions);
    registry.install(catalog);

    if (gate_config.audit_log.has_value()) {
        std::filesystem::path audit_path = gate_config.audit_log.value();
        if (audit_path.is_relative()) {
            audit_path = gate_config.workspace / audit_path;
        }
        registry.set_audit_writer(std::make_shared<toolgate::session::AuditWriter>(audit_path));
    }

    if (req.command == toolgate::app::cli::Command::List) {
        std::cout << registry.definitions_json().dump(2) << std::endl;
        return 0;
    }

    // 4. Dispatch one call
    toolgate::policy::ApprovalBroker broker;
    broker.set_listener([&](const PendingApproval& request) {
        prompt_for_approval(broker, registry, request, req.auto_approve);
    });
    access_policy->set_approval_hook(broker.hook());

    std::shared_ptr<toolgate::runtime::DesktopLane> lane;
    if (gate_config.desktop_lane) {
        lane = std::make_shared<toolgate::runtime::DesktopLane>();
        registry.attach_desktop_lane(lane);
    }

    auto ctx = toolgate::protocol::make_context(req.origin, session_id);
    if (req.timeout_ms.has_value()) {
        ctx = ctx.with_timeout(std::chrono::milliseconds(req.timeout_ms.value()));
    }

    toolgate::protocol::ToolCall call{config::generate_id("call"), req.tool, req.input};
    LOG_INFO("Dispatching " + call.name + " as " + call.id);
    const auto result = registry.execute(ctx, call);

    if (lane) {
        registry.detach_desktop_lane();
        lane->shutdown();
    }
    broker.deny_all();

    std::cout << result.content << std::endl;
    return result.is_error ? 1 : 0;
}
