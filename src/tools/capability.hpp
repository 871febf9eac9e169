#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "tools/tool.hpp"

namespace toolgate::tools {

enum class Platform { Darwin, Linux, Windows, Ios, Android, All };

std::string to_string(Platform platform);
std::optional<Platform> parse_platform(const std::string& value);

// Platform this binary was compiled for.
Platform current_platform();

// A tool plus where and under which category it may be offered.
struct Capability {
    std::shared_ptr<Tool> tool;
    std::vector<Platform> platforms;  // empty or containing All means everywhere
    std::string category;
    bool requires_setup = false;

    bool available_on(Platform platform) const;
};

using PermissionMap = std::map<std::string, bool>;

// Ordered collection of capabilities assembled at startup.
class CapabilityCatalog {
public:
    // A second capability with the same tool name replaces the first in place.
    void add(Capability capability);

    CapabilityCatalog filter_for(Platform platform) const;

    // Drops capabilities whose category maps to a permission that is present
    // and false. Unknown categories always pass; no map keeps everything.
    CapabilityCatalog filter_by_permissions(
        const std::optional<PermissionMap>& permissions) const;

    std::vector<Capability> list_by_category(const std::string& category) const;
    const Capability* find(const std::string& name) const;

    const std::vector<Capability>& entries() const { return entries_; }
    std::size_t size() const { return entries_.size(); }

private:
    std::vector<Capability> entries_;
};

// Permission key gating a category, or nullopt when the category is ungated.
std::optional<std::string> permission_for_category(const std::string& category);

}  // namespace toolgate::tools
