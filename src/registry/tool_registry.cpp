#include "registry/tool_registry.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <mutex>
#include <utility>
#include "core/logging/logger.hpp"
#include "tools/strap_router.hpp"

namespace toolgate::registry {

using nlohmann::json;
using protocol::ToolResult;

const std::set<std::string>& desktop_tool_names() {
    static const std::set<std::string> kDesktopTools = {
        "desktop", "accessibility", "screenshot", "app", "browser",
        "window",  "menubar",       "dialog",     "shortcuts"};
    return kDesktopTools;
}

std::string truncation_marker(const std::size_t cap) {
    return "\n\n[Output truncated: exceeded " + std::to_string(cap) + " characters]";
}

std::string truncate_content(std::string content, const std::size_t cap) {
    if (content.size() <= cap) {
        return content;
    }
    content.resize(cap);
    content += truncation_marker(cap);
    return content;
}

std::string tool_correction(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });

    static const std::map<std::string, std::string> kCorrections = {
        {"read", R"(file(action: "read", path: "/path/to/file"))"},
        {"cat", R"(file(action: "read", path: "/path/to/file"))"},
        {"write", R"(file(action: "write", path: "/path", content: "..."))"},
        {"edit", R"(file(action: "edit", path: "/path", old_string: "...", new_string: "..."))"},
        {"grep", R"(file(action: "grep", pattern: "...", path: "/dir"))"},
        {"search", R"(file(action: "grep", pattern: "...", path: "/dir"))"},
        {"bash", R"(shell(resource: "bash", action: "exec", command: "..."))"},
        {"exec", R"(shell(resource: "bash", action: "exec", command: "..."))"},
        {"run_command", R"(shell(resource: "bash", action: "exec", command: "..."))"},
        {"ps", R"(shell(resource: "process", action: "list"))"},
    };
    const auto it = kCorrections.find(lowered);
    if (it != kCorrections.end()) {
        return "INSTEAD USE: " + it->second;
    }
    if (lowered == "web_search" || lowered == "websearch" || lowered == "web_fetch" ||
        lowered == "webfetch") {
        return "Web access is not available through this gate.";
    }
    return "Check your available tools and use the correct name.";
}

Registry::Registry(std::shared_ptr<policy::AccessPolicy> policy, RegistryOptions options)
    : policy_(policy ? std::move(policy) : std::make_shared<policy::AccessPolicy>()),
      options_(options) {}

void Registry::register_tool(std::shared_ptr<tools::Tool> tool, std::string category) {
    if (!tool) {
        LOG_WARN("Registry: ignoring null tool registration");
        return;
    }
    const std::string name = tool->name();
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (tools_.count(name) != 0) {
            LOG_WARN("Registry: tool \"" + name + "\" registered twice, last one wins");
        }
        tools_[name] = Entry{std::move(tool), std::move(category)};
    }
    LOG_DEBUG("Registry: registered " + name);
    notify({name}, {});
}

bool Registry::unregister_tool(const std::string& name) {
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (tools_.erase(name) == 0) {
            return false;
        }
    }
    LOG_DEBUG("Registry: unregistered " + name);
    notify({}, {name});
    return true;
}

void Registry::install(const tools::CapabilityCatalog& catalog) {
    for (const auto& capability : catalog.entries()) {
        register_tool(capability.tool, capability.category);
    }
    LOG_INFO("Registry: installed " + std::to_string(catalog.size()) + " capabilities");
}

std::shared_ptr<tools::Tool> Registry::get(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto it = tools_.find(name);
    return it != tools_.end() ? it->second.tool : nullptr;
}

std::vector<std::string> Registry::names() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& entry : tools_) {
        names.push_back(entry.first);
    }
    return names;
}

std::vector<protocol::ToolDefinition> Registry::definitions() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<protocol::ToolDefinition> defs;
    defs.reserve(tools_.size());
    for (const auto& entry : tools_) {
        const auto& tool = entry.second.tool;
        defs.push_back({tool->name(), tool->description(), tool->schema()});
    }
    return defs;
}

json Registry::definitions_json() const {
    json defs = json::array();
    for (const auto& def : definitions()) {
        defs.push_back({{"name", def.name},
                        {"description", def.description},
                        {"input_schema", def.input_schema}});
    }
    return defs;
}

void Registry::add_change_listener(ChangeListener listener) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    listeners_.push_back(std::move(listener));
}

void Registry::notify(const std::vector<std::string>& added,
                      const std::vector<std::string>& removed) const {
    std::vector<ChangeListener> listeners;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        listeners = listeners_;
    }
    for (const auto& listener : listeners) {
        listener(added, removed);
    }
}

void Registry::attach_desktop_lane(std::shared_ptr<runtime::DesktopLane> lane) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    lane_ = std::move(lane);
    LOG_INFO(std::string("Registry: desktop lane ") + (lane_ ? "attached" : "cleared"));
}

std::shared_ptr<runtime::DesktopLane> Registry::detach_desktop_lane() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    LOG_INFO("Registry: desktop lane detached");
    return std::move(lane_);
}

bool Registry::has_desktop_lane() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return static_cast<bool>(lane_);
}

void Registry::set_audit_writer(std::shared_ptr<session::AuditWriter> writer) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    audit_ = std::move(writer);
}

bool Registry::is_desktop_tool(const std::string& name) const {
    if (desktop_tool_names().count(name) != 0) {
        return true;
    }
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto it = tools_.find(name);
    return it != tools_.end() && it->second.category == "desktop";
}

ToolResult Registry::finish(const protocol::RequestContext& ctx, const std::string& event,
                            const std::string& tool, ToolResult result) const {
    std::shared_ptr<session::AuditWriter> audit;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        audit = audit_;
    }
    if (audit) {
        const auto written =
            audit->write(ctx, session::AuditRecord{event, tool, result.is_error, result.content});
        if (core::errors::is_error(written)) {
            LOG_WARN("Registry: " + core::errors::get_error(written).message);
        }
    }
    return result;
}

ToolResult Registry::unknown_tool(const std::string& name) const {
    LOG_WARN("Registry: unknown tool " + name);
    return ToolResult::error("TOOL ERROR: \"" + name +
                             "\" does not exist. You do NOT have that tool. Do NOT call it "
                             "again.\n\n" +
                             tool_correction(name) +
                             "\nYour available tools are: " + tools::join(names(), ", "));
}

std::optional<ToolResult> Registry::check_approval(const protocol::RequestContext& ctx,
                                                   const Entry& entry,
                                                   const json& input) const {
    const std::string name = entry.tool->name();
    try {
        const auto command = entry.tool->approval_command(input);
        const bool needs_approval =
            entry.tool->requires_approval() ||
            (command.has_value() && policy_->command_requires_approval(command.value()));
        if (!needs_approval) {
            LOG_DEBUG("Registry: no approval needed for " + name);
            return std::nullopt;
        }
        if (command.has_value() && policy::is_dangerous(command.value())) {
            LOG_WARN("Registry: dangerous command awaiting approval: " + command.value());
        }

        const auto decision = policy_->request_approval(ctx, name, input);
        if (core::errors::is_error(decision)) {
            const auto& error = core::errors::get_error(decision);
            LOG_INFO("Registry: approval for " + name + " failed: " + error.message);
            return finish(ctx, "approval_error", name,
                          ToolResult::error("Approval error: " + core::errors::describe(error)));
        }
        if (!core::errors::get_value(decision)) {
            LOG_INFO("Registry: " + name + " denied");
            return finish(ctx, "approval_denied", name,
                          ToolResult::error("Tool execution denied: \"" + name +
                                            "\" was not approved."));
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Registry: approval for " + name + " threw: " + e.what());
        return finish(ctx, "approval_error", name,
                      ToolResult::error("Approval error: " + name + " could not be approved: " +
                                        e.what()));
    } catch (...) {
        LOG_ERROR("Registry: approval for " + name + " threw a non-standard exception");
        return finish(ctx, "approval_error", name,
                      ToolResult::error("Approval error: " + name +
                                        " could not be approved (unknown exception)."));
    }
    return std::nullopt;
}

ToolResult Registry::run(const protocol::RequestContext& ctx, const Entry& entry,
                         const json& input) const {
    try {
        return entry.tool->execute(ctx, input);
    } catch (const std::exception& e) {
        LOG_ERROR("Registry: " + entry.tool->name() + " threw: " + e.what());
        return ToolResult::error("Tool error: " + entry.tool->name() + " failed: " + e.what());
    } catch (...) {
        LOG_ERROR("Registry: " + entry.tool->name() + " threw a non-standard exception");
        return ToolResult::error("Tool error: " + entry.tool->name() +
                                 " failed with an unknown exception.");
    }
}

ToolResult Registry::execute(const protocol::RequestContext& ctx,
                             const protocol::ToolCall& call) const {
    const std::string& name = call.name;
    if (ctx.done()) {
        return finish(ctx, "cancelled", name,
                      ToolResult::error("Call to \"" + name + "\" was cancelled before it started."));
    }

    Entry entry;
    std::shared_ptr<runtime::DesktopLane> lane;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        const auto it = tools_.find(name);
        if (it != tools_.end()) {
            entry = it->second;
        }
        lane = lane_;
    }
    if (!entry.tool) {
        return finish(ctx, "unknown_tool", name, unknown_tool(name));
    }

    if (policy_->is_denied_for_origin(ctx.origin, name)) {
        const std::string origin = protocol::to_string(ctx.origin);
        LOG_WARN("Registry: " + name + " denied for " + origin + " origin");
        return finish(ctx, "origin_denied", name,
                      ToolResult::error("Tool \"" + name + "\" is not permitted for " + origin +
                                        "-origin requests"));
    }

    if (auto refused = check_approval(ctx, entry, call.input)) {
        return refused.value();
    }

    const bool desktop = desktop_tool_names().count(name) != 0 || entry.category == "desktop";
    ToolResult result;
    if (desktop && lane) {
        LOG_DEBUG("Registry: queueing " + name + " on the desktop lane");
        result = lane->enqueue(ctx, [this, ctx, entry, input = call.input]() {
            return run(ctx, entry, input);
        });
    } else {
        result = run(ctx, entry, call.input);
    }

    if (result.content.size() > options_.max_result_chars) {
        LOG_DEBUG("Registry: truncating " + name + " output of " +
                  std::to_string(result.content.size()) + " bytes");
        result.content = truncate_content(std::move(result.content), options_.max_result_chars);
    }
    return finish(ctx, "executed", name, std::move(result));
}

}  // namespace toolgate::registry
