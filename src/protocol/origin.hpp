#pragma once
#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <string>

namespace toolgate::protocol {

    // Who originated a tool call. Security decisions are keyed on this value.
    enum class Origin {
        User,     // The human operator, directly
        Comm,     // Inter-agent communication channel
        Plugin,   // An external plugin binary
        Skill,    // A matched skill template
        System    // Internally scheduled work (reminders, heartbeat, recovery)
    };

    inline constexpr std::array<Origin, 5> kAllOrigins = {
        Origin::User, Origin::Comm, Origin::Plugin, Origin::Skill, Origin::System};

    inline std::string to_string(const Origin origin) {
        switch (origin) {
            case Origin::User:
                return "user";
            case Origin::Comm:
                return "comm";
            case Origin::Plugin:
                return "plugin";
            case Origin::Skill:
                return "skill";
            case Origin::System:
                return "system";
            default:
                return "unknown";
        }
    }

    // Accepts the canonical names plus a few spellings hosts use in config files.
    inline std::optional<Origin> parse_origin(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](const unsigned char c) {
                           return static_cast<char>(std::tolower(c));
                       });
        if (value == "user") return Origin::User;
        if (value == "comm" || value == "inter-agent" || value == "inter-agent-comm") {
            return Origin::Comm;
        }
        if (value == "plugin" || value == "app") return Origin::Plugin;
        if (value == "skill") return Origin::Skill;
        if (value == "system") return Origin::System;
        return std::nullopt;
    }

} // namespace toolgate::protocol
