#pragma once
#include <string>
#include <variant>

namespace venvbox::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,         // E.g., malformed request JSON or an unsafe environment name
        Construction,  // E.g., `uv venv` failed or timed out
        Installation,  // E.g., `uv pip install` failed or timed out
        Execution,     // E.g., the interpreter could not be spawned
        Store,         // E.g., the cache root could not be created
        Internal       // E.g., I/O or encoding failure nobody anticipated
    };

    // The standardized error payload
    struct ServiceError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    // 2. Propagation strategy: a Result holds either a value of type T, OR a ServiceError.
    template <typename T>
    using Result = std::variant<T, ServiceError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<ServiceError>(result);
    }

    template <typename T>
    const ServiceError& get_error(const Result<T>& result) {
        return std::get<ServiceError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:        return "input";
            case ErrorCategory::Construction: return "construction";
            case ErrorCategory::Installation: return "installation";
            case ErrorCategory::Execution:    return "execution";
            case ErrorCategory::Store:        return "store";
            case ErrorCategory::Internal:     return "internal";
            default: return "unknown";
        }
    }

} // namespace venvbox::core::errors
