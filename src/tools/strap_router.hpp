#pragma once

#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/gate_errors.hpp"

namespace toolgate::tools {

// One resource of a domain tool and the actions it accepts. A domain with a
// single resource named "" is flat: callers only pass an action.
struct ResourceSpec {
    std::string name;
    std::vector<std::string> actions;
    std::string description;
};

struct FieldSpec {
    std::string name;
    std::string type;  // "string", "integer", "boolean", "array", "object"
    std::string description;
    bool required = false;
    std::vector<std::string> required_for;  // actions that need this field
    std::vector<std::string> enum_values;
    nlohmann::json default_value;  // null means no default
    std::string items = "string";  // item type for arrays
};

struct DomainSpec {
    std::string domain;
    std::string description;
    std::vector<ResourceSpec> resources;
    std::map<std::string, std::string> aliases;  // lowercase synonym -> canonical
    std::vector<FieldSpec> fields;
    std::vector<std::string> examples;
};

struct Route {
    std::string resource;
    std::string action;
};

// Shared resource/action routing for every domain tool: alias
// normalization, inference of an omitted resource, and validation against
// the declared sets before any handler runs.
class StrapRouter {
public:
    explicit StrapRouter(DomainSpec spec);

    const DomainSpec& spec() const { return spec_; }
    bool is_flat() const;

    // Declared resource names in order; empty for flat domains.
    std::vector<std::string> resources() const;
    std::vector<std::string> actions_for(const std::string& resource) const;

    std::string normalize_resource(const std::string& resource) const;

    // Fills an empty resource when the action belongs to exactly one resource.
    std::string infer_resource(const std::string& resource,
                               const std::string& action) const;

    core::errors::Result<Route> route(const nlohmann::json& input) const;

    nlohmann::json build_schema() const;
    std::string build_description() const;

    // "bash: exec; process: list" style summary used in error hints.
    std::string summary() const;

private:
    const ResourceSpec* find(const std::string& name) const;
    std::vector<std::string> all_actions() const;

    DomainSpec spec_;
};

// Maps boundary strings onto a domain tool's closed enumeration.
template <typename E>
struct NamedValue {
    const char* name;
    E value;
};

template <typename E, std::size_t N>
std::optional<E> lookup_named(const std::array<NamedValue<E>, N>& table,
                              const std::string& name) {
    for (const auto& entry : table) {
        if (name == entry.name) {
            return entry.value;
        }
    }
    return std::nullopt;
}

std::string join(const std::vector<std::string>& values, const std::string& sep);

}  // namespace toolgate::tools
