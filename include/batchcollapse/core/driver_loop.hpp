// BatchCollapse - Coalescing retention timer
// Driver Loop
//
// Periodically wakes on the timer PAL and runs a tick function (the
// engine's non-forced flush evaluation) until stopped.

#ifndef BATCHCOLLAPSE_CORE_DRIVER_LOOP_HPP
#define BATCHCOLLAPSE_CORE_DRIVER_LOOP_HPP

#include "batchcollapse/core/error_codes.hpp"
#include "batchcollapse/core/result.hpp"
#include "batchcollapse/core/types.hpp"
#include "batchcollapse/pal/log_pal.hpp"
#include "batchcollapse/pal/pal_types.hpp"
#include "batchcollapse/pal/timer_pal.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>

namespace batchcollapse {
namespace core {

/**
 * @brief Repeating wake-up that drives flush evaluation.
 *
 * State machine: Idle -> Running -> Stopped. Stopped is terminal; a
 * stopped loop cannot be started again.
 *
 * Thread Safety:
 * - start()/stop() may be called from any thread
 * - Ticks run on the timer PAL's thread, one at a time
 * - stop() returns only after an in-flight tick has finished, unless it
 *   is called from inside the tick
 */
class DriverLoop {
public:
    using TickFunction = std::function<void()>;

    /**
     * @param timer Timer PAL supplying the wake-ups (may be null; start() then fails)
     * @param interval Time between ticks
     * @param tick Work to run on every wake-up
     * @param logger Optional logger
     */
    DriverLoop(
        std::shared_ptr<pal::ITimerPAL> timer,
        std::chrono::milliseconds interval,
        TickFunction tick,
        std::shared_ptr<pal::ILogPAL> logger = nullptr
    );

    /**
     * @brief Stops the loop if still running.
     */
    ~DriverLoop();

    DriverLoop(const DriverLoop&) = delete;
    DriverLoop& operator=(const DriverLoop&) = delete;

    /**
     * @brief Schedule the repeating wake-up.
     *
     * Error conditions:
     * - NotInitialized: no timer PAL
     * - InvalidState: already running or stopped
     * - TimerFailed: the timer PAL refused the schedule
     */
    Result<void, Error> start();

    /**
     * @brief Stop the loop permanently. Idempotent.
     */
    void stop();

    DriverState state() const;

    /**
     * @brief Number of ticks run so far.
     */
    uint64_t tickCount() const;

    std::chrono::milliseconds interval() const { return interval_; }

private:
    void onTimer();

    std::shared_ptr<pal::ITimerPAL> timer_;
    std::chrono::milliseconds interval_;
    TickFunction tick_;
    std::shared_ptr<pal::ILogPAL> logger_;

    mutable std::mutex mutex_;
    pal::TimerHandle handle_{pal::INVALID_TIMER_HANDLE};
    std::atomic<DriverState> state_{DriverState::Idle};
    std::atomic<uint64_t> tickCount_{0};
};

} // namespace core
} // namespace batchcollapse

#endif // BATCHCOLLAPSE_CORE_DRIVER_LOOP_HPP
