#pragma once
#include <string>
#include <variant>

namespace docgate::core::errors {

    // 1. Typed error categories, one per failure a caller can act on
    enum class ErrorKind {
        Validation,          // Malformed or missing request parameters
        UnsupportedFormat,   // Format not in the registry for the requested direction
        EngineUnreachable,   // Long-running engine instance cannot be contacted
        StaleHandle,         // Document handle no longer resolves inside the engine
        ConversionFailed,    // Headless conversion exited non-zero or produced nothing
        ConversionTimedOut,  // Headless conversion exceeded its deadline
        NoActiveDocument,    // Operation needs a document and none is open
        NoSelection,         // Operation needs a selected text range
        Timeout,             // Bridge call exceeded its deadline
        Internal             // Gateway logic bug or OS-level failure
    };

    // The standardized error payload
    struct GatewayError {
        ErrorKind kind;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    // 2. Propagation strategy: a Result holds either a value of type T or a GatewayError.
    template <typename T>
    using Result = std::variant<T, GatewayError>;

    // Operations that succeed without producing a value.
    using Status = Result<std::monostate>;

    inline Status ok() {
        return std::monostate{};
    }

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<GatewayError>(result);
    }

    template <typename T>
    const GatewayError& get_error(const Result<T>& result) {
        return std::get<GatewayError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    // Name used for the error "type" field on the wire.
    inline std::string to_wire_type(const ErrorKind kind) {
        switch (kind) {
            case ErrorKind::Validation: return "ValidationError";
            case ErrorKind::UnsupportedFormat: return "UnsupportedFormatError";
            case ErrorKind::EngineUnreachable: return "EngineUnreachableError";
            case ErrorKind::StaleHandle: return "StaleHandleError";
            case ErrorKind::ConversionFailed: return "ConversionFailed";
            case ErrorKind::ConversionTimedOut: return "ConversionTimedOut";
            case ErrorKind::NoActiveDocument: return "NoActiveDocumentError";
            case ErrorKind::NoSelection: return "NoSelectionError";
            case ErrorKind::Timeout: return "TimeoutError";
            case ErrorKind::Internal: return "InternalError";
            default: return "InternalError";
        }
    }

} // namespace docgate::core::errors
