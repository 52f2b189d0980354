// BatchCollapse - Coalescing retention timer
// Driver Loop implementation

#include "batchcollapse/core/driver_loop.hpp"

#include <exception>

namespace batchcollapse {
namespace core {

namespace {
constexpr const char* LOG_CATEGORY = "Driver";
}

// =============================================================================
// Constructor and Destructor
// =============================================================================

DriverLoop::DriverLoop(
    std::shared_ptr<pal::ITimerPAL> timer,
    std::chrono::milliseconds interval,
    TickFunction tick,
    std::shared_ptr<pal::ILogPAL> logger
)
    : timer_(std::move(timer))
    , interval_(interval)
    , tick_(std::move(tick))
    , logger_(std::move(logger))
{
}

DriverLoop::~DriverLoop() {
    stop();
}

// =============================================================================
// Lifecycle
// =============================================================================

Result<void, Error> DriverLoop::start() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!timer_) {
        return Result<void, Error>::error(
            Error{ErrorCode::NotInitialized, "No timer available", "driver-start"}
        );
    }

    DriverState current = state_.load();
    if (current != DriverState::Idle) {
        return Result<void, Error>::error(
            Error{ErrorCode::InvalidState,
                  std::string("Cannot start driver loop in state ") + driverStateToString(current),
                  "driver-start"}
        );
    }

    // Running before the first tick can possibly fire
    state_.store(DriverState::Running);

    auto scheduled = timer_->scheduleRepeating(interval_, [this]() { onTimer(); });
    if (scheduled.isError()) {
        state_.store(DriverState::Stopped);
        BATCHCOLLAPSE_LOG_ERROR(logger_, LOG_CATEGORY,
            "Driver loop failed to start: " << scheduled.error().message);
        return Result<void, Error>::error(
            Error{ErrorCode::TimerFailed, scheduled.error().message, "driver-start"}
        );
    }

    handle_ = scheduled.value();
    BATCHCOLLAPSE_LOG_INFO(logger_, LOG_CATEGORY,
        "Driver loop started (interval " << interval_.count() << "ms)");
    return Result<void, Error>::success();
}

void DriverLoop::stop() {
    pal::TimerHandle handle = pal::INVALID_TIMER_HANDLE;
    DriverState previous;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = state_.exchange(DriverState::Stopped);
        if (previous == DriverState::Stopped) {
            return;
        }
        handle = handle_;
        handle_ = pal::INVALID_TIMER_HANDLE;
    }

    if (handle != pal::INVALID_TIMER_HANDLE && timer_) {
        // Blocks until an in-flight tick has returned
        auto cancelled = timer_->cancelTimer(handle);
        if (cancelled.isError()) {
            BATCHCOLLAPSE_LOG_WARNING(logger_, LOG_CATEGORY,
                "Failed to cancel driver timer: " << cancelled.error().message);
        }
    }

    if (previous == DriverState::Running) {
        BATCHCOLLAPSE_LOG_INFO(logger_, LOG_CATEGORY,
            "Driver loop stopped - exiting loop after " << tickCount_.load() << " ticks");
    }
}

DriverState DriverLoop::state() const {
    return state_.load();
}

uint64_t DriverLoop::tickCount() const {
    return tickCount_.load();
}

// =============================================================================
// Tick
// =============================================================================

void DriverLoop::onTimer() {
    if (state_.load() != DriverState::Running) {
        return;
    }

    tickCount_.fetch_add(1);

    if (!tick_) {
        return;
    }

    try {
        tick_();
    } catch (const std::exception& e) {
        BATCHCOLLAPSE_LOG_ERROR(logger_, LOG_CATEGORY, "Exception in driver tick: " << e.what());
    } catch (...) {
        BATCHCOLLAPSE_LOG_ERROR(logger_, LOG_CATEGORY, "Unknown exception in driver tick");
    }
}

} // namespace core
} // namespace batchcollapse
