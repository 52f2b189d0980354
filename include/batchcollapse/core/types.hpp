// BatchCollapse - Coalescing retention timer
// Common type definitions

#ifndef BATCHCOLLAPSE_CORE_TYPES_HPP
#define BATCHCOLLAPSE_CORE_TYPES_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace batchcollapse {
namespace core {

// Monotonic clock used for every watermark
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

// =============================================================================
// Constants
// =============================================================================

namespace collapse {
    /// Driver loop wake-up period
    constexpr uint32_t DEFAULT_POLL_INTERVAL_MS = 10;

    /// Quiet time after the last collapse before a time-based flush
    constexpr uint32_t DEFAULT_RETENTION_MS = 5000;

    /// Ceiling on the time since the last flush
    constexpr uint32_t DEFAULT_MAX_DURATION_MS = 60000;

    /// maxPendingKeys value meaning "no limit"
    constexpr std::size_t UNLIMITED_PENDING_KEYS = 0;
}

// =============================================================================
// Enumerations
// =============================================================================

/**
 * @brief What a collapse call did to the pending store.
 */
enum class CollapseOutcome {
    Inserted,   ///< Key was absent; value stored
    Collapsed,  ///< Key already pending; stored value kept (first write wins)
    Rejected    ///< Key was absent but the pending-key limit is reached
};

inline const char* collapseOutcomeToString(CollapseOutcome outcome) {
    switch (outcome) {
        case CollapseOutcome::Inserted:  return "Inserted";
        case CollapseOutcome::Collapsed: return "Collapsed";
        case CollapseOutcome::Rejected:  return "Rejected";
        default:                         return "Unknown";
    }
}

/**
 * @brief Driver loop lifecycle.
 *
 * Idle -> Running -> Stopped. Stopped is terminal.
 */
enum class DriverState {
    Idle,
    Running,
    Stopped
};

inline const char* driverStateToString(DriverState state) {
    switch (state) {
        case DriverState::Idle:    return "Idle";
        case DriverState::Running: return "Running";
        case DriverState::Stopped: return "Stopped";
        default:                   return "Unknown";
    }
}

// =============================================================================
// Statistics
// =============================================================================

/**
 * @brief Counters describing an engine's lifetime.
 */
struct CollapseStatistics {
    uint64_t collapseCalls = 0;     ///< Every collapse() call
    uint64_t inserted = 0;          ///< Calls that created a pending entry
    uint64_t collapsed = 0;         ///< Calls merged into an existing entry
    uint64_t rejected = 0;          ///< Calls refused by the pending-key limit
    uint64_t flushed = 0;           ///< Entries flushed by the driver loop
    uint64_t drained = 0;           ///< Entries flushed by cancel()
    uint64_t callbackFailures = 0;  ///< executeFunc invocations that threw
};

} // namespace core
} // namespace batchcollapse

#endif // BATCHCOLLAPSE_CORE_TYPES_HPP
