// BatchCollapse - Coalescing retention timer
// Linux Timer PAL Implementation
//
// Uses timerfd for periodic wake-ups of the driver loop

#ifndef BATCHCOLLAPSE_PAL_LINUX_LINUX_TIMER_PAL_HPP
#define BATCHCOLLAPSE_PAL_LINUX_LINUX_TIMER_PAL_HPP

#include "batchcollapse/core/result.hpp"
#include "batchcollapse/pal/pal_types.hpp"
#include "batchcollapse/pal/timer_pal.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

#if defined(__linux__)

namespace batchcollapse {
namespace pal {
namespace linux {

/**
 * @brief Linux implementation of ITimerPAL using timerfd.
 *
 * - timerfd_create(CLOCK_MONOTONIC) per scheduled timer
 * - one epoll instance watched by a dedicated timer thread
 * - an eventfd to wake the thread on shutdown
 *
 * Thread Safety:
 * - All methods are thread-safe
 * - Callbacks are dispatched sequentially on the timer thread
 * - cancelTimer() waits for an in-flight callback of the same timer
 */
class LinuxTimerPAL : public ITimerPAL {
public:
    /**
     * @brief Creates the epoll instance and starts the timer thread.
     *
     * If the kernel objects cannot be created, the instance stays usable
     * but every scheduleRepeating() call fails with CreationFailed.
     */
    LinuxTimerPAL();

    /**
     * @brief Stops the timer thread and closes every timer.
     */
    ~LinuxTimerPAL() override;

    LinuxTimerPAL(const LinuxTimerPAL&) = delete;
    LinuxTimerPAL& operator=(const LinuxTimerPAL&) = delete;
    LinuxTimerPAL(LinuxTimerPAL&&) = delete;
    LinuxTimerPAL& operator=(LinuxTimerPAL&&) = delete;

    core::Result<TimerHandle, TimerError> scheduleRepeating(
        std::chrono::milliseconds interval,
        TimerCallback callback
    ) override;

    core::Result<void, TimerError> cancelTimer(TimerHandle handle) override;

    std::chrono::steady_clock::time_point now() const override;

    /**
     * @brief Number of timers currently scheduled.
     */
    size_t activeTimerCount() const;

private:
    struct TimerInfo {
        int timerFd;
        TimerCallback callback;
    };

    TimerHandle generateHandle();

    void timerThreadFunc();

    void dispatch(int fd);

    void wakeTimerThread();

    bool onTimerThread() const;

    std::atomic<uint64_t> nextHandle_{1};
    mutable std::mutex timersMutex_;
    std::unordered_map<uint64_t, std::unique_ptr<TimerInfo>> timers_;
    std::unordered_map<int, uint64_t> fdToHandle_;

    // Handle whose callback is running on the timer thread (0 = none)
    std::mutex inFlightMutex_;
    std::condition_variable inFlightCv_;
    uint64_t inFlightHandle_{0};

    int epollFd_{-1};
    int wakeEventFd_{-1};

    std::thread timerThread_;
    std::atomic<bool> shutdown_{false};
};

} // namespace linux
} // namespace pal
} // namespace batchcollapse

#endif // defined(__linux__)
#endif // BATCHCOLLAPSE_PAL_LINUX_LINUX_TIMER_PAL_HPP
