#include "tools/capability.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <iterator>
#include <utility>
#include "core/logging/logger.hpp"
#include "tools/strap_router.hpp"

#if defined(__APPLE__)
#include <TargetConditionals.h>
#endif

namespace toolgate::tools {

namespace {

constexpr std::array<NamedValue<Platform>, 6> kPlatformNames = {{
    {"darwin", Platform::Darwin},
    {"linux", Platform::Linux},
    {"windows", Platform::Windows},
    {"ios", Platform::Ios},
    {"android", Platform::Android},
    {"all", Platform::All},
}};

struct CategoryPermission {
    const char* category;
    const char* permission;
};

constexpr CategoryPermission kCategoryPermissions[] = {
    {"productivity", "contacts"},
    {"system", "system"},
    {"media", "media"},
    {"desktop", "desktop"},
};

}  // namespace

std::string to_string(const Platform platform) {
    for (const auto& entry : kPlatformNames) {
        if (entry.value == platform) {
            return entry.name;
        }
    }
    return "unknown";
}

std::optional<Platform> parse_platform(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    if (lowered == "macos") {
        return Platform::Darwin;
    }
    return lookup_named(kPlatformNames, lowered);
}

Platform current_platform() {
#if defined(__APPLE__)
#if TARGET_OS_IPHONE
    return Platform::Ios;
#else
    return Platform::Darwin;
#endif
#elif defined(__ANDROID__)
    return Platform::Android;
#elif defined(_WIN32)
    return Platform::Windows;
#else
    return Platform::Linux;
#endif
}

bool Capability::available_on(const Platform platform) const {
    if (platforms.empty()) {
        return true;
    }
    return std::any_of(platforms.begin(), platforms.end(), [platform](const Platform p) {
        return p == Platform::All || p == platform;
    });
}

std::optional<std::string> permission_for_category(const std::string& category) {
    for (const auto& entry : kCategoryPermissions) {
        if (category == entry.category) {
            return std::string(entry.permission);
        }
    }
    return std::nullopt;
}

void CapabilityCatalog::add(Capability capability) {
    if (!capability.tool) {
        LOG_WARN("CapabilityCatalog: ignoring capability without a tool");
        return;
    }
    const std::string name = capability.tool->name();
    for (auto& existing : entries_) {
        if (existing.tool->name() == name) {
            LOG_WARN("CapabilityCatalog: duplicate capability \"" + name +
                     "\", replacing earlier registration");
            existing = std::move(capability);
            return;
        }
    }
    entries_.push_back(std::move(capability));
}

CapabilityCatalog CapabilityCatalog::filter_for(const Platform platform) const {
    CapabilityCatalog filtered;
    for (const auto& capability : entries_) {
        if (capability.available_on(platform)) {
            filtered.entries_.push_back(capability);
        } else {
            LOG_DEBUG("CapabilityCatalog: " + capability.tool->name() +
                      " not available on " + to_string(platform));
        }
    }
    return filtered;
}

CapabilityCatalog CapabilityCatalog::filter_by_permissions(
    const std::optional<PermissionMap>& permissions) const {
    if (!permissions.has_value()) {
        return *this;
    }
    CapabilityCatalog filtered;
    for (const auto& capability : entries_) {
        const auto permission = permission_for_category(capability.category);
        if (permission.has_value()) {
            const auto it = permissions->find(permission.value());
            if (it != permissions->end() && !it->second) {
                LOG_INFO("CapabilityCatalog: " + capability.tool->name() +
                         " disabled by permission " + permission.value());
                continue;
            }
        }
        filtered.entries_.push_back(capability);
    }
    return filtered;
}

std::vector<Capability> CapabilityCatalog::list_by_category(
    const std::string& category) const {
    std::vector<Capability> matches;
    std::copy_if(entries_.begin(), entries_.end(), std::back_inserter(matches),
                 [&category](const Capability& c) { return c.category == category; });
    return matches;
}

const Capability* CapabilityCatalog::find(const std::string& name) const {
    for (const auto& capability : entries_) {
        if (capability.tool->name() == name) {
            return &capability;
        }
    }
    return nullptr;
}

}  // namespace toolgate::tools
