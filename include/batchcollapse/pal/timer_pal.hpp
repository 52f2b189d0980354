// BatchCollapse - Coalescing retention timer
// Platform Abstraction Layer - Timer Interface
//
// Supplies the two things the driver loop needs from the platform: a
// periodic wake-up and a monotonic clock. Implementations:
// - timerfd + epoll on Linux
// - a manual, test-controlled timer in the test suite

#ifndef BATCHCOLLAPSE_PAL_TIMER_PAL_HPP
#define BATCHCOLLAPSE_PAL_TIMER_PAL_HPP

#include "batchcollapse/core/result.hpp"
#include "batchcollapse/pal/pal_types.hpp"

#include <chrono>
#include <memory>

namespace batchcollapse {
namespace pal {

/**
 * @brief Abstract interface for periodic timers and monotonic time.
 *
 * ## Thread Safety
 * - Scheduling and cancellation are thread-safe
 * - Callbacks run on a timer thread owned by the implementation, one at a
 *   time
 *
 * @invariant now() never goes backwards
 * @invariant Once cancelTimer() returns, the callback is not running and
 *            will not run again (unless cancelTimer() was called from the
 *            callback itself)
 */
class ITimerPAL {
public:
    virtual ~ITimerPAL() = default;

    /**
     * @brief Schedule a repeating timer.
     *
     * The first invocation happens one interval after scheduling.
     *
     * @param interval Time between invocations, must be > 0
     * @param callback Function to invoke on every expiration
     *
     * @return TimerHandle for cancellation, or TimerError on failure
     *
     * @code
     * auto result = timerPal->scheduleRepeating(std::chrono::milliseconds{10}, [this]() {
     *     evaluate(false);
     * });
     * if (result.isError()) {
     *     log("Failed to start driver: " + result.error().message);
     * }
     * @endcode
     */
    virtual core::Result<TimerHandle, TimerError> scheduleRepeating(
        std::chrono::milliseconds interval,
        TimerCallback callback
    ) = 0;

    /**
     * @brief Cancel a timer.
     *
     * If the callback is executing on another thread, this call waits for
     * it to return. Called from inside the callback, it does not wait.
     *
     * Error conditions:
     * - InvalidHandle: handle is INVALID_TIMER_HANDLE
     * - AlreadyCancelled: timer unknown or already cancelled
     */
    virtual core::Result<void, TimerError> cancelTimer(TimerHandle handle) = 0;

    /**
     * @brief Current time from a monotonic clock.
     */
    virtual std::chrono::steady_clock::time_point now() const = 0;
};

/**
 * @brief Create the timer implementation for the current platform.
 *
 * @return The platform timer, or nullptr where none is available
 */
std::shared_ptr<ITimerPAL> createPlatformTimer();

} // namespace pal
} // namespace batchcollapse

#endif // BATCHCOLLAPSE_PAL_TIMER_PAL_HPP
