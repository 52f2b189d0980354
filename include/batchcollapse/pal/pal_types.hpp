// BatchCollapse - Coalescing retention timer
// Platform Abstraction Layer - Common Types
//
// Handles, error codes and callback signatures shared by the timer,
// logging and signal PAL interfaces.

#ifndef BATCHCOLLAPSE_PAL_PAL_TYPES_HPP
#define BATCHCOLLAPSE_PAL_PAL_TYPES_HPP

#include <cstdint>
#include <functional>
#include <string>

namespace batchcollapse {
namespace pal {

// =============================================================================
// Handle Types
// =============================================================================

/**
 * @brief Platform-independent timer handle.
 */
struct TimerHandle {
    uint64_t value;

    bool operator==(const TimerHandle& other) const { return value == other.value; }
    bool operator!=(const TimerHandle& other) const { return value != other.value; }
};

constexpr TimerHandle INVALID_TIMER_HANDLE{0};

// =============================================================================
// Error Codes
// =============================================================================

/**
 * @brief Timer operation error codes.
 */
enum class TimerErrorCode : uint32_t {
    Success = 0,
    Unknown = 1,
    CreationFailed = 100,
    InvalidHandle = 101,
    InvalidInterval = 102,
    AlreadyCancelled = 103,
};

/**
 * @brief Log levels, ordered from most to least verbose.
 */
enum class LogLevel : uint32_t {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warning = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

inline const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "trace";
        case LogLevel::Debug:    return "debug";
        case LogLevel::Info:     return "info";
        case LogLevel::Warning:  return "warning";
        case LogLevel::Error:    return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off:      return "off";
        default:                 return "info";
    }
}

// =============================================================================
// Error Structures
// =============================================================================

/**
 * @brief Detailed timer error information.
 */
struct TimerError {
    TimerErrorCode code;
    std::string message;

    TimerError(TimerErrorCode c = TimerErrorCode::Unknown,
               std::string msg = "")
        : code(c)
        , message(std::move(msg)) {}
};

// =============================================================================
// Logging Context
// =============================================================================

/**
 * @brief Source location attached to a log record.
 */
struct LogContext {
    const char* file = nullptr;
    int line = 0;
    const char* function = nullptr;
};

// =============================================================================
// Callback Types
// =============================================================================

/**
 * @brief Callback for timer expiration.
 */
using TimerCallback = std::function<void()>;

class ILogSink;

} // namespace pal
} // namespace batchcollapse

#endif // BATCHCOLLAPSE_PAL_PAL_TYPES_HPP
