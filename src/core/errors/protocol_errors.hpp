#pragma once
#include <string>
#include <variant>

namespace agui::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,      // E.g., bad CLI flag or malformed replay file
        Decode,     // A wire map could not be turned into an Event
        Verify,     // An event broke the protocol's sequencing rules
        Internal    // C++ logic bug or I/O failure
    };

    // The standardized error payload
    struct ProtocolError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    // 2. Propagation strategy: a Result holds either a T or a ProtocolError.
    template <typename T>
    using Result = std::variant<T, ProtocolError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<ProtocolError>(result);
    }

    template <typename T>
    const ProtocolError& get_error(const Result<T>& result) {
        return std::get<ProtocolError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T& get_value(Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:    return "input";
            case ErrorCategory::Decode:   return "decode";
            case ErrorCategory::Verify:   return "verify";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

} // namespace agui::core::errors
