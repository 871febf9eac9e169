#pragma once
#include <string>
#include <variant>

namespace toolgate::core::errors {

    // Typed error categories shared by every gate in the dispatch pipeline
    enum class ErrorCategory {
        Input,      // Malformed payload, unknown resource/action, bad config value
        Execution,  // The tool's own operation failed
        Policy,     // Origin deny, approval denied, safeguard block
        Cancelled,  // Caller's cancel token or deadline fired while waiting
        Internal    // Broken invariant inside the gate itself
    };

    struct GateError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";  // Shown to the calling agent to guide a retry
    };

    // Holds either a value of type T or a GateError.
    template <typename T>
    using Result = std::variant<T, GateError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<GateError>(result);
    }

    template <typename T>
    const GateError& get_error(const Result<T>& result) {
        return std::get<GateError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:
                return "input";
            case ErrorCategory::Execution:
                return "execution";
            case ErrorCategory::Policy:
                return "policy";
            case ErrorCategory::Cancelled:
                return "cancelled";
            case ErrorCategory::Internal:
                return "internal";
            default:
                return "unknown";
        }
    }

    // Renders an error the way it is shown to the calling agent.
    inline std::string describe(const GateError& error) {
        std::string text = error.message;
        if (!error.hint.empty()) {
            text += "\nHint: " + error.hint;
        }
        return text;
    }

} // namespace toolgate::core::errors
