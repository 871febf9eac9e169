#include "tools/strap_router.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

namespace toolgate::tools {

using core::errors::ErrorCategory;
using core::errors::GateError;
using nlohmann::json;

namespace {

std::string normalize_token(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    std::string token = value.substr(first, last - first + 1);
    std::transform(token.begin(), token.end(), token.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return token;
}

bool has_action(const ResourceSpec& resource, const std::string& action) {
    return std::find(resource.actions.begin(), resource.actions.end(), action) !=
           resource.actions.end();
}

}  // namespace

std::string join(const std::vector<std::string>& values, const std::string& sep) {
    std::string out;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            out += sep;
        }
        out += values[i];
    }
    return out;
}

StrapRouter::StrapRouter(DomainSpec spec) : spec_(std::move(spec)) {}

bool StrapRouter::is_flat() const {
    return spec_.resources.size() == 1 && spec_.resources.front().name.empty();
}

std::vector<std::string> StrapRouter::resources() const {
    std::vector<std::string> names;
    for (const auto& resource : spec_.resources) {
        if (!resource.name.empty()) {
            names.push_back(resource.name);
        }
    }
    return names;
}

std::vector<std::string> StrapRouter::actions_for(const std::string& resource) const {
    const ResourceSpec* found = find(resource);
    if (found == nullptr && is_flat()) {
        found = &spec_.resources.front();
    }
    return found != nullptr ? found->actions : std::vector<std::string>{};
}

const ResourceSpec* StrapRouter::find(const std::string& name) const {
    for (const auto& resource : spec_.resources) {
        if (resource.name == name) {
            return &resource;
        }
    }
    return nullptr;
}

std::vector<std::string> StrapRouter::all_actions() const {
    std::vector<std::string> actions;
    for (const auto& resource : spec_.resources) {
        for (const auto& action : resource.actions) {
            if (std::find(actions.begin(), actions.end(), action) == actions.end()) {
                actions.push_back(action);
            }
        }
    }
    return actions;
}

std::string StrapRouter::normalize_resource(const std::string& resource) const {
    const std::string token = normalize_token(resource);
    const auto it = spec_.aliases.find(token);
    return it != spec_.aliases.end() ? it->second : token;
}

std::string StrapRouter::infer_resource(const std::string& resource,
                                        const std::string& action) const {
    if (!resource.empty() || is_flat()) {
        return resource;
    }
    const ResourceSpec* match = nullptr;
    for (const auto& candidate : spec_.resources) {
        if (!has_action(candidate, action)) {
            continue;
        }
        if (match != nullptr) {
            return resource;  // ambiguous
        }
        match = &candidate;
    }
    return match != nullptr ? match->name : resource;
}

std::string StrapRouter::summary() const {
    if (is_flat()) {
        return "actions: " + join(spec_.resources.front().actions, ", ");
    }
    std::vector<std::string> parts;
    for (const auto& resource : spec_.resources) {
        parts.push_back(resource.name + ": " + join(resource.actions, ", "));
    }
    return join(parts, "; ");
}

core::errors::Result<Route> StrapRouter::route(const json& input) const {
    const std::string valid = "Valid for " + spec_.domain + " -> " + summary();

    if (!input.is_object()) {
        return GateError{ErrorCategory::Input,
                         spec_.domain + ": input must be a JSON object",
                         "invalid_payload", valid};
    }

    const auto action_it = input.find("action");
    if (action_it == input.end() || !action_it->is_string() ||
        normalize_token(action_it->get<std::string>()).empty()) {
        return GateError{ErrorCategory::Input,
                         spec_.domain + ": action is required", "missing_action",
                         valid};
    }
    const std::string action = normalize_token(action_it->get<std::string>());

    std::string resource;
    const auto resource_it = input.find("resource");
    if (resource_it != input.end() && !resource_it->is_null()) {
        if (!resource_it->is_string()) {
            return GateError{ErrorCategory::Input,
                             spec_.domain + ": resource must be a string",
                             "invalid_payload", valid};
        }
        resource = normalize_resource(resource_it->get<std::string>());
    }

    if (is_flat()) {
        const ResourceSpec& only = spec_.resources.front();
        if (!has_action(only, action)) {
            return GateError{ErrorCategory::Input,
                             "unknown action '" + action + "' for " + spec_.domain +
                                 " (valid: " + join(only.actions, ", ") + ")",
                             "unknown_action", valid};
        }
        return Route{"", action};
    }

    resource = infer_resource(resource, action);
    if (resource.empty()) {
        std::vector<std::string> owners;
        for (const auto& candidate : spec_.resources) {
            if (has_action(candidate, action)) {
                owners.push_back(candidate.name);
            }
        }
        if (owners.empty()) {
            return GateError{ErrorCategory::Input,
                             "unknown action '" + action + "' for " + spec_.domain +
                                 " (valid resources: " + join(resources(), ", ") + ")",
                             "unknown_action", valid};
        }
        return GateError{ErrorCategory::Input,
                         "action '" + action + "' exists on several " + spec_.domain +
                             " resources (" + join(owners, ", ") +
                             "); specify resource",
                         "ambiguous_action", valid};
    }

    const ResourceSpec* target = find(resource);
    if (target == nullptr) {
        return GateError{ErrorCategory::Input,
                         "unknown resource '" + resource + "' for " + spec_.domain +
                             " (valid: " + join(resources(), ", ") + ")",
                         "unknown_resource", valid};
    }
    if (!has_action(*target, action)) {
        return GateError{ErrorCategory::Input,
                         "unknown action '" + action + "' for resource '" + resource +
                             "' (valid: " + join(target->actions, ", ") + ")",
                         "unknown_action", valid};
    }

    return Route{resource, action};
}

json StrapRouter::build_schema() const {
    json properties = json::object();
    json required = json::array({"action"});

    if (!is_flat()) {
        const auto names = resources();
        properties["resource"] = {
            {"type", "string"},
            {"description", "Resource type: " + join(names, ", ") +
                                ". May be omitted when the action is unique."},
            {"enum", names}};
    }

    const auto actions = all_actions();
    properties["action"] = {{"type", "string"},
                            {"description", "Action to perform: " + join(actions, ", ")},
                            {"enum", actions}};

    for (const auto& field : spec_.fields) {
        std::string description = field.description;
        if (!field.required_for.empty()) {
            description += " Required for: " + join(field.required_for, ", ") + ".";
        }
        json prop = {{"type", field.type}, {"description", description}};
        if (!field.enum_values.empty()) {
            prop["enum"] = field.enum_values;
        }
        if (!field.default_value.is_null()) {
            prop["default"] = field.default_value;
        }
        if (field.type == "array") {
            prop["items"] = {{"type", field.items}};
        }
        properties[field.name] = prop;
        if (field.required) {
            required.push_back(field.name);
        }
    }

    return json{{"type", "object"},
                {"description", build_description()},
                {"properties", properties},
                {"required", required}};
}

std::string StrapRouter::build_description() const {
    std::ostringstream desc;
    desc << spec_.description;

    if (is_flat()) {
        desc << "\n\nActions: " << join(spec_.resources.front().actions, ", ");
    } else if (!spec_.resources.empty()) {
        desc << "\n\nResources and Actions:";
        for (const auto& resource : spec_.resources) {
            desc << "\n- " << resource.name << ": " << join(resource.actions, ", ");
            if (!resource.description.empty()) {
                desc << " (" << resource.description << ")";
            }
        }
    }

    if (!spec_.examples.empty()) {
        desc << "\n\nExamples:";
        for (const auto& example : spec_.examples) {
            desc << "\n  " << example;
        }
    }
    return desc.str();
}

}  // namespace toolgate::tools
