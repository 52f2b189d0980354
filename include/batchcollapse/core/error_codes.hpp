// BatchCollapse - Coalescing retention timer
// Common error codes and Error structure

#ifndef BATCHCOLLAPSE_CORE_ERROR_CODES_HPP
#define BATCHCOLLAPSE_CORE_ERROR_CODES_HPP

#include <cstdint>
#include <string>

namespace batchcollapse {
namespace core {

/**
 * @brief Error codes shared by the engine and its collaborators.
 */
enum class ErrorCode : uint32_t {
    // General errors (0-99)
    Success = 0,
    Unknown = 1,
    InvalidArgument = 2,
    InvalidState = 3,
    NotInitialized = 4,
    AlreadyInitialized = 5,

    // Lifecycle (100-199)
    Cancelled = 100,
    AlreadyCancelled = 101,

    // Execution (200-299)
    CallbackFailed = 200,

    // Capacity (300-399)
    CapacityReached = 300,

    // Platform (400-499)
    TimerFailed = 400,
    SignalHandlerFailed = 401,

    // Configuration (600-699)
    ConfigError = 600,
    ConfigInvalid = 601,
    ConfigNotFound = 602,
    ConfigParseError = 603,
};

inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::NotInitialized: return "Not initialized";
        case ErrorCode::AlreadyInitialized: return "Already initialized";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::AlreadyCancelled: return "Already cancelled";
        case ErrorCode::CallbackFailed: return "Callback failed";
        case ErrorCode::CapacityReached: return "Capacity reached";
        case ErrorCode::TimerFailed: return "Timer failed";
        case ErrorCode::SignalHandlerFailed: return "Signal handler failed";
        case ErrorCode::ConfigError: return "Configuration error";
        case ErrorCode::ConfigInvalid: return "Configuration invalid";
        case ErrorCode::ConfigNotFound: return "Configuration not found";
        case ErrorCode::ConfigParseError: return "Configuration parse error";
        default: return "Unknown error code";
    }
}

/**
 * @brief Error with code, message and optional context.
 *
 * The context carries where the error surfaced (e.g. "flush",
 * "driver-start") so that a single error hook can tell reports apart.
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;

    Error(ErrorCode c = ErrorCode::Unknown,
          std::string msg = "",
          std::string ctx = "")
        : code(c)
        , message(std::move(msg))
        , context(std::move(ctx)) {}

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == ErrorCode::Success;
    }

    /**
     * @brief Render as "<code text>: <message> [<context>]".
     */
    [[nodiscard]] std::string toString() const {
        std::string result = errorCodeToString(code);
        if (!message.empty()) {
            result += ": " + message;
        }
        if (!context.empty()) {
            result += " [" + context + "]";
        }
        return result;
    }
};

} // namespace core
} // namespace batchcollapse

#endif // BATCHCOLLAPSE_CORE_ERROR_CODES_HPP
