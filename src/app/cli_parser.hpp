#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/gate_errors.hpp"
#include "protocol/origin.hpp"

namespace toolgate::app::cli {

    enum class Command { List, Call };

    // Normalized command line of one toolgate invocation
    struct CliRequest {
        Command command = Command::List;
        std::string tool;
        nlohmann::json input = nlohmann::json::object();
        protocol::Origin origin = protocol::Origin::User;
        std::optional<std::string> session_id;
        std::optional<std::uint32_t> timeout_ms;
        std::optional<std::filesystem::path> config_path;
        bool auto_approve = false;
        bool verbose = false;
    };

    std::string usage();

    toolgate::core::errors::Result<CliRequest> parse_and_validate(int argc, char* argv[]);
}
