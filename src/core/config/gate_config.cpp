#include "core/config/gate_config.hpp"

#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "protocol/origin.hpp"

namespace toolgate::core::config {

using errors::ErrorCategory;
using errors::GateError;
using nlohmann::json;

namespace {

GateError config_error(const std::string& message) {
    return GateError{ErrorCategory::Input, "Invalid configuration: " + message,
                     "invalid_config"};
}

errors::Result<std::vector<std::string>> read_string_list(const json& value,
                                                          const std::string& key) {
    if (!value.is_array()) {
        return config_error(key + " must be an array of strings");
    }
    std::vector<std::string> items;
    for (const auto& item : value) {
        if (!item.is_string()) {
            return config_error(key + " must be an array of strings");
        }
        items.push_back(item.get<std::string>());
    }
    return items;
}

std::optional<GateError> read_policy(const json& section, PolicyConfig& out) {
    if (!section.is_object()) {
        return config_error("policy must be an object");
    }

    if (section.contains("level")) {
        const json& value = section["level"];
        const auto level = value.is_string()
                               ? policy::parse_access_level(value.get<std::string>())
                               : std::nullopt;
        if (!level.has_value()) {
            return config_error("policy.level must be one of deny, allowlist, full");
        }
        out.level = level.value();
    }

    if (section.contains("ask_mode")) {
        const json& value = section["ask_mode"];
        const auto mode = value.is_string()
                              ? policy::parse_ask_mode(value.get<std::string>())
                              : std::nullopt;
        if (!mode.has_value()) {
            return config_error("policy.ask_mode must be one of off, on-miss, always");
        }
        out.ask_mode = mode.value();
    }

    if (section.contains("allowlist")) {
        auto list = read_string_list(section["allowlist"], "policy.allowlist");
        if (errors::is_error(list)) {
            return errors::get_error(list);
        }
        out.allowlist = errors::get_value(list);
    }

    if (section.contains("autonomous")) {
        if (!section["autonomous"].is_boolean()) {
            return config_error("policy.autonomous must be a boolean");
        }
        out.autonomous = section["autonomous"].get<bool>();
    }

    if (section.contains("origin_deny")) {
        const json& deny = section["origin_deny"];
        if (!deny.is_object()) {
            return config_error("policy.origin_deny must be an object");
        }
        policy::OriginDenyList deny_list;
        for (auto it = deny.begin(); it != deny.end(); ++it) {
            const auto origin = protocol::parse_origin(it.key());
            if (!origin.has_value()) {
                return config_error("unknown origin in policy.origin_deny: " + it.key());
            }
            auto tools = read_string_list(it.value(), "policy.origin_deny." + it.key());
            if (errors::is_error(tools)) {
                return errors::get_error(tools);
            }
            const auto& names = errors::get_value(tools);
            deny_list[origin.value()].insert(names.begin(), names.end());
        }
        out.origin_deny = deny_list;
    }

    return std::nullopt;
}

std::optional<GateError> read_registry(const json& section, GateConfig& out) {
    if (!section.is_object()) {
        return config_error("registry must be an object");
    }
    if (section.contains("max_result_chars")) {
        const json& value = section["max_result_chars"];
        if (!value.is_number_integer() || value.get<long long>() <= 0) {
            return config_error("registry.max_result_chars must be a positive integer");
        }
        out.max_result_chars = value.get<std::size_t>();
    }
    if (section.contains("desktop_lane")) {
        if (!section["desktop_lane"].is_boolean()) {
            return config_error("registry.desktop_lane must be a boolean");
        }
        out.desktop_lane = section["desktop_lane"].get<bool>();
    }
    return std::nullopt;
}

}  // namespace

errors::Result<GateConfig> parse_config(const std::string& json_text) {
    json data;
    try {
        data = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return config_error(std::string("malformed JSON: ") + e.what());
    }
    if (!data.is_object()) {
        return config_error("top level must be an object");
    }

    GateConfig config;
    if (data.contains("policy")) {
        if (auto err = read_policy(data["policy"], config.policy)) {
            return err.value();
        }
    }
    if (data.contains("registry")) {
        if (auto err = read_registry(data["registry"], config)) {
            return err.value();
        }
    }

    if (data.contains("permissions")) {
        const json& perms = data["permissions"];
        if (!perms.is_object()) {
            return config_error("permissions must be an object");
        }
        std::map<std::string, bool> permissions;
        for (auto it = perms.begin(); it != perms.end(); ++it) {
            if (!it.value().is_boolean()) {
                return config_error("permissions." + it.key() + " must be a boolean");
            }
            permissions[it.key()] = it.value().get<bool>();
        }
        config.permissions = permissions;
    }

    if (data.contains("workspace")) {
        if (!data["workspace"].is_string()) {
            return config_error("workspace must be a string");
        }
        config.workspace = data["workspace"].get<std::string>();
    }

    if (data.contains("audit_log")) {
        if (!data["audit_log"].is_string()) {
            return config_error("audit_log must be a string");
        }
        config.audit_log = std::filesystem::path(data["audit_log"].get<std::string>());
    }

    return config;
}

errors::Result<GateConfig> load_config_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return GateError{ErrorCategory::Input,
                         "Unable to open config file: " + path.string(),
                         "config_not_found"};
    }
    const std::string content((std::istreambuf_iterator<char>(in)),
                              std::istreambuf_iterator<char>());
    LOG_DEBUG("Config: loaded " + path.string());
    return parse_config(content);
}

void apply_policy_config(const PolicyConfig& config, policy::AccessPolicy& access) {
    access.set_level(config.level);
    access.set_ask_mode(config.ask_mode);
    for (const auto& pattern : config.allowlist) {
        access.add_to_allowlist(pattern);
    }
    if (config.origin_deny.has_value()) {
        policy::OriginDenyList merged = policy::default_origin_deny_list();
        for (const auto& entry : config.origin_deny.value()) {
            merged[entry.first] = entry.second;
        }
        access.set_origin_deny_list(merged);
    }
    const bool autonomous = config.autonomous;
    access.set_autonomous_check([autonomous]() { return autonomous; });
    LOG_INFO("Config: policy level=" + policy::to_string(config.level) +
             " ask_mode=" + policy::to_string(config.ask_mode) +
             (autonomous ? " autonomous" : ""));
}

}  // namespace toolgate::core::config
