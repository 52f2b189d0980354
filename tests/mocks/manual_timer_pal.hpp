// BatchCollapse - Coalescing retention timer
// Manually driven timer PAL for deterministic tests

#ifndef BATCHCOLLAPSE_TESTS_MOCKS_MANUAL_TIMER_PAL_HPP
#define BATCHCOLLAPSE_TESTS_MOCKS_MANUAL_TIMER_PAL_HPP

#include "batchcollapse/pal/timer_pal.hpp"

#include <chrono>
#include <map>
#include <mutex>
#include <vector>

namespace batchcollapse {
namespace mocks {

/**
 * Time only moves through advanceTime(); timer callbacks only run from
 * fireAll() / tick(), on the calling thread.
 */
class ManualTimerPAL : public pal::ITimerPAL {
public:
    struct ScheduledTimer {
        std::chrono::milliseconds interval;
        pal::TimerCallback callback;
        bool cancelled = false;
    };

    core::Result<pal::TimerHandle, pal::TimerError> scheduleRepeating(
        std::chrono::milliseconds interval,
        pal::TimerCallback callback
    ) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failSchedule_) {
            return core::Result<pal::TimerHandle, pal::TimerError>::error(
                pal::TimerError{pal::TimerErrorCode::CreationFailed, "Scheduling disabled by test"});
        }
        pal::TimerHandle handle{nextHandleId_++};
        timers_[handle.value] = ScheduledTimer{interval, std::move(callback), false};
        return core::Result<pal::TimerHandle, pal::TimerError>::success(handle);
    }

    core::Result<void, pal::TimerError> cancelTimer(pal::TimerHandle handle) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = timers_.find(handle.value);
        if (it == timers_.end()) {
            return core::Result<void, pal::TimerError>::error(
                pal::TimerError{pal::TimerErrorCode::InvalidHandle, "Invalid timer handle"});
        }
        if (it->second.cancelled) {
            return core::Result<void, pal::TimerError>::error(
                pal::TimerError{pal::TimerErrorCode::AlreadyCancelled, "Timer already cancelled"});
        }
        it->second.cancelled = true;
        ++cancelCount_;
        return core::Result<void, pal::TimerError>::success();
    }

    std::chrono::steady_clock::time_point now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return currentTime_;
    }

    // Test helpers

    void advanceTime(std::chrono::milliseconds delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        currentTime_ += delta;
    }

    /**
     * Runs every live callback once.
     */
    void fireAll() {
        std::vector<pal::TimerCallback> callbacks;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& entry : timers_) {
                if (!entry.second.cancelled) {
                    callbacks.push_back(entry.second.callback);
                }
            }
        }
        for (const auto& callback : callbacks) {
            callback();
        }
    }

    /**
     * Advances by delta, then fires.
     */
    void tick(std::chrono::milliseconds delta) {
        advanceTime(delta);
        fireAll();
    }

    void setFailSchedule(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        failSchedule_ = fail;
    }

    size_t activeTimerCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = 0;
        for (const auto& entry : timers_) {
            if (!entry.second.cancelled) {
                ++count;
            }
        }
        return count;
    }

    size_t cancelCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelCount_;
    }

    std::chrono::milliseconds lastInterval() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return timers_.empty() ? std::chrono::milliseconds{0} : timers_.rbegin()->second.interval;
    }

private:
    mutable std::mutex mutex_;
    std::map<uint64_t, ScheduledTimer> timers_;
    uint64_t nextHandleId_ = 1;
    size_t cancelCount_ = 0;
    bool failSchedule_ = false;
    std::chrono::steady_clock::time_point currentTime_{std::chrono::hours{1}};
};

} // namespace mocks
} // namespace batchcollapse

#endif // BATCHCOLLAPSE_TESTS_MOCKS_MANUAL_TIMER_PAL_HPP
