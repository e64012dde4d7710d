#pragma once
#include <stdexcept>
#include <string>
#include <variant>

namespace agentcli::core::errors {

    // 1. Define typed error categories
    enum class ErrorCategory {
        Input,      // E.g., caller passed an unknown tool or malformed flag
        Setup,      // E.g., provider binary could not be located
        Launch,     // E.g., fork/exec of the provider binary failed
        Timeout,    // E.g., provider ran past its deadline and was killed
        Cancelled,  // E.g., caller flipped the cancellation token
        Execution,  // E.g., provider exited non-zero
        Internal    // E.g., pipe creation or other OS plumbing failure
    };

    // The standardized error payload
    struct EngineError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";
        };

    // 2. Define the Propagation Strategy (Result Object)
    // A Result will hold either a successful value of type T, OR an EngineError.
    template <typename T>
    using Result = std::variant<T, EngineError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<EngineError>(result);
    }

    template <typename T>
    const EngineError& get_error(const Result<T>& result) {
        return std::get<EngineError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:
                return "input";
            case ErrorCategory::Setup:
                return "setup";
            case ErrorCategory::Launch:
                return "launch";
            case ErrorCategory::Timeout:
                return "timeout";
            case ErrorCategory::Cancelled:
                return "cancelled";
            case ErrorCategory::Execution:
                return "execution";
            case ErrorCategory::Internal:
                return "internal";
        }
        return "unknown";
    }

    // 3. The one failure that is thrown instead of returned: a provider
    // binary that cannot be found at all.
    class SetupError : public std::runtime_error {
    public:
        explicit SetupError(const std::string& message)
            : std::runtime_error(message) {}
    };

} // namespace agentcli::core::errors
