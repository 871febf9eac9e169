#include "cli_parser.hpp"
#include <charconv>
#include <system_error>
#include <utility>
#include <vector>

namespace toolgate::app::cli {

    using namespace toolgate::core::errors;

    namespace {
        constexpr std::uint32_t kMaxTimeoutMs = 3600000;

        // Raw strings as typed, before any validation
        struct RawCliOptions {
            std::optional<std::string> tool;
            std::optional<std::string> input;
            std::optional<std::string> origin;
            std::optional<std::string> session;
            std::optional<std::string> timeout_ms;
            std::optional<std::string> config;
            bool yes = false;
            bool verbose = false;
        };

        GateError missing_value(const std::string& flag) {
            return GateError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
        }
    }

    std::string usage() {
        return "Usage:\n"
               "  toolgate list [--config PATH] [--verbose]\n"
               "  toolgate call --tool NAME [--input JSON] [--origin ORIGIN] [--session ID]\n"
               "                [--timeout-ms N] [--config PATH] [--yes] [--verbose]";
    }

    Result<CliRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return GateError{ErrorCategory::Input, "No command provided.", "missing_command", usage()};
        }

        CliRequest req;
        const std::string command = argv[1];
        if (command == "list") {
            req.command = Command::List;
        } else if (command == "call") {
            req.command = Command::Call;
        } else {
            return GateError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", usage()};
        }

        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        RawCliOptions raw;
        const std::vector<std::pair<std::string, std::optional<std::string>*>> valued = {
            {"--tool", &raw.tool},
            {"--input", &raw.input},
            {"--origin", &raw.origin},
            {"--session", &raw.session},
            {"--timeout-ms", &raw.timeout_ms},
            {"--config", &raw.config},
        };

        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--yes") {
                raw.yes = true;
                continue;
            }
            if (args[i] == "--verbose") {
                raw.verbose = true;
                continue;
            }
            bool matched = false;
            for (const auto& flag : valued) {
                if (args[i] != flag.first) {
                    continue;
                }
                if (i + 1 >= args.size()) {
                    return missing_value(flag.first);
                }
                *flag.second = args[++i];
                matched = true;
                break;
            }
            if (!matched) {
                return GateError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument", usage()};
            }
        }

        req.auto_approve = raw.yes;
        req.verbose = raw.verbose;
        if (raw.config) req.config_path = std::filesystem::path(raw.config.value());

        if (req.command == Command::List) {
            if (raw.tool || raw.input || raw.origin || raw.session || raw.timeout_ms || raw.yes) {
                return GateError{ErrorCategory::Input, "list only accepts --config and --verbose", "unexpected_flag"};
            }
            return req;
        }

        if (!raw.tool.has_value() || raw.tool->empty()) {
            return GateError{ErrorCategory::Input, "call requires --tool", "missing_required_flag", usage()};
        }
        req.tool = raw.tool.value();

        if (raw.input) {
            auto parsed = nlohmann::json::parse(raw.input.value(), nullptr, false);
            if (parsed.is_discarded()) {
                return GateError{ErrorCategory::Input, "--input is not valid JSON", "invalid_json",
                                 "Example: --input '{\"action\": \"read\", \"path\": \"README.md\"}'"};
            }
            if (!parsed.is_object()) {
                return GateError{ErrorCategory::Input, "--input must be a JSON object", "invalid_json"};
            }
            req.input = std::move(parsed);
        }

        if (raw.origin) {
            const auto origin = protocol::parse_origin(raw.origin.value());
            if (!origin.has_value()) {
                return GateError{ErrorCategory::Input, "Unknown origin: " + raw.origin.value(), "invalid_origin",
                                 "One of: user, comm, plugin, skill, system."};
            }
            req.origin = origin.value();
        }

        if (raw.session) req.session_id = raw.session.value();

        // Exception-free integer parsing
        if (raw.timeout_ms) {
            std::uint32_t timeout = 0;
            const char* begin = raw.timeout_ms->data();
            const char* end = raw.timeout_ms->data() + raw.timeout_ms->size();
            auto [ptr, ec] = std::from_chars(begin, end, timeout);
            if (ec != std::errc() || ptr != end) {
                return GateError{ErrorCategory::Input, "Invalid number for --timeout-ms", "invalid_integer", "Provide a positive integer."};
            }
            if (timeout == 0 || timeout > kMaxTimeoutMs) {
                return GateError{ErrorCategory::Input, "--timeout-ms out of bounds", "bounds_error", "Must be between 1 and 3600000."};
            }
            req.timeout_ms = timeout;
        }

        return req;
    }

} // namespace toolgate::app::cli
