#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/gate_config.hpp"
#include "policy/access_policy.hpp"
#include "protocol/request_context.hpp"
#include "protocol/tool_contract.hpp"
#include "runtime/desktop_lane.hpp"
#include "session/audit_writer.hpp"
#include "tools/capability.hpp"
#include "tools/tool.hpp"

namespace toolgate::registry {

struct RegistryOptions {
    std::size_t max_result_chars = core::config::kDefaultMaxResultChars;
};

// Called after register_tool/unregister_tool with the names that changed.
using ChangeListener = std::function<void(const std::vector<std::string>& added,
                                          const std::vector<std::string>& removed)>;

// Tools that drive the shared screen, input devices or browser window.
const std::set<std::string>& desktop_tool_names();

// Cuts content to exactly cap bytes and appends the truncation marker.
std::string truncate_content(std::string content, std::size_t cap);
std::string truncation_marker(std::size_t cap);

// Suggested replacement for tool names models commonly invent.
std::string tool_correction(const std::string& name);

class Registry {
public:
    explicit Registry(std::shared_ptr<policy::AccessPolicy> policy,
                      RegistryOptions options = {});

    void register_tool(std::shared_ptr<tools::Tool> tool, std::string category = "");
    bool unregister_tool(const std::string& name);

    // Registers every capability of the catalog in order.
    void install(const tools::CapabilityCatalog& catalog);

    std::shared_ptr<tools::Tool> get(const std::string& name) const;
    std::vector<std::string> names() const;
    std::vector<protocol::ToolDefinition> definitions() const;
    nlohmann::json definitions_json() const;

    void add_change_listener(ChangeListener listener);

    void attach_desktop_lane(std::shared_ptr<runtime::DesktopLane> lane);
    std::shared_ptr<runtime::DesktopLane> detach_desktop_lane();
    bool has_desktop_lane() const;

    void set_audit_writer(std::shared_ptr<session::AuditWriter> writer);

    bool is_desktop_tool(const std::string& name) const;

    policy::AccessPolicy& policy() { return *policy_; }
    const RegistryOptions& options() const { return options_; }

    // Single entry point for running a tool. Never throws: every failure,
    // including one raised by the tool itself, comes back as an error result.
    protocol::ToolResult execute(const protocol::RequestContext& ctx,
                                 const protocol::ToolCall& call) const;

private:
    struct Entry {
        std::shared_ptr<tools::Tool> tool;
        std::string category;
    };

    protocol::ToolResult unknown_tool(const std::string& name) const;
    std::optional<protocol::ToolResult> check_approval(const protocol::RequestContext& ctx,
                                                       const Entry& entry,
                                                       const nlohmann::json& input) const;
    protocol::ToolResult run(const protocol::RequestContext& ctx, const Entry& entry,
                             const nlohmann::json& input) const;
    protocol::ToolResult finish(const protocol::RequestContext& ctx,
                                const std::string& event, const std::string& tool,
                                protocol::ToolResult result) const;
    void notify(const std::vector<std::string>& added,
                const std::vector<std::string>& removed) const;

    std::shared_ptr<policy::AccessPolicy> policy_;
    RegistryOptions options_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, Entry> tools_;
    std::vector<ChangeListener> listeners_;
    std::shared_ptr<runtime::DesktopLane> lane_;
    std::shared_ptr<session::AuditWriter> audit_;
};

}  // namespace toolgate::registry
