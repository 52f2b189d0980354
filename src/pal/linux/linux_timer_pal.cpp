// BatchCollapse - Coalescing retention timer
// Linux Timer PAL Implementation

#include "batchcollapse/pal/linux/linux_timer_pal.hpp"

#if defined(__linux__)

#include <sys/timerfd.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>
#include <cstring>
#include <errno.h>

namespace batchcollapse {
namespace pal {
namespace linux {

namespace {

struct itimerspec makeTimerSpec(std::chrono::milliseconds interval) {
    struct itimerspec its;
    memset(&its, 0, sizeof(its));

    its.it_value.tv_sec = interval.count() / 1000;
    its.it_value.tv_nsec = (interval.count() % 1000) * 1000000;
    its.it_interval = its.it_value;
    return its;
}

} // anonymous namespace

// =============================================================================
// Constructor / Destructor
// =============================================================================

LinuxTimerPAL::LinuxTimerPAL() {
    epollFd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epollFd_ < 0) {
        // Timers will fail to schedule
        return;
    }

    wakeEventFd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wakeEventFd_ < 0) {
        close(epollFd_);
        epollFd_ = -1;
        return;
    }

    struct epoll_event ev;
    memset(&ev, 0, sizeof(ev));
    ev.events = EPOLLIN;
    ev.data.fd = wakeEventFd_;
    if (epoll_ctl(epollFd_, EPOLL_CTL_ADD, wakeEventFd_, &ev) < 0) {
        close(wakeEventFd_);
        close(epollFd_);
        wakeEventFd_ = -1;
        epollFd_ = -1;
        return;
    }

    timerThread_ = std::thread(&LinuxTimerPAL::timerThreadFunc, this);
}

LinuxTimerPAL::~LinuxTimerPAL() {
    shutdown_ = true;
    wakeTimerThread();

    if (timerThread_.joinable()) {
        timerThread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(timersMutex_);
        for (auto& pair : timers_) {
            if (pair.second->timerFd >= 0) {
                close(pair.second->timerFd);
            }
        }
        timers_.clear();
        fdToHandle_.clear();
    }

    if (wakeEventFd_ >= 0) {
        close(wakeEventFd_);
        wakeEventFd_ = -1;
    }

    if (epollFd_ >= 0) {
        close(epollFd_);
        epollFd_ = -1;
    }
}

// =============================================================================
// Timer Thread
// =============================================================================

void LinuxTimerPAL::timerThreadFunc() {
    const int maxEvents = 32;
    struct epoll_event events[maxEvents];

    while (!shutdown_) {
        int nfds = epoll_wait(epollFd_, events, maxEvents, -1);
        if (nfds < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }

        for (int i = 0; i < nfds && !shutdown_; ++i) {
            int fd = events[i].data.fd;

            if (fd == wakeEventFd_) {
                uint64_t val;
                while (read(wakeEventFd_, &val, sizeof(val)) > 0) {
                }
                continue;
            }

            dispatch(fd);
        }
    }
}

void LinuxTimerPAL::dispatch(int fd) {
    TimerCallback callback;
    uint64_t handleValue = 0;

    {
        std::lock_guard<std::mutex> lock(timersMutex_);
        auto handleIt = fdToHandle_.find(fd);
        if (handleIt == fdToHandle_.end()) {
            // Cancelled after epoll_wait returned
            return;
        }
        handleValue = handleIt->second;

        auto timerIt = timers_.find(handleValue);
        if (timerIt == timers_.end()) {
            return;
        }

        // Expiration count only matters for draining the fd; the loop
        // coalesces missed ticks into one invocation.
        uint64_t expirations = 0;
        ssize_t bytesRead = read(fd, &expirations, sizeof(expirations));
        if (bytesRead != sizeof(expirations)) {
            return;
        }

        callback = timerIt->second->callback;

        // Marked while timersMutex_ is held so cancelTimer() either
        // removes the timer first or sees it in flight.
        std::lock_guard<std::mutex> flightLock(inFlightMutex_);
        inFlightHandle_ = handleValue;
    }

    if (callback) {
        callback();
    }

    {
        std::lock_guard<std::mutex> flightLock(inFlightMutex_);
        inFlightHandle_ = 0;
    }
    inFlightCv_.notify_all();
}

void LinuxTimerPAL::wakeTimerThread() {
    if (wakeEventFd_ >= 0) {
        uint64_t val = 1;
        ssize_t result = write(wakeEventFd_, &val, sizeof(val));
        (void)result;  // Counter overflow only; thread is already awake
    }
}

bool LinuxTimerPAL::onTimerThread() const {
    return std::this_thread::get_id() == timerThread_.get_id();
}

// =============================================================================
// Timer Handle Generation
// =============================================================================

TimerHandle LinuxTimerPAL::generateHandle() {
    return TimerHandle{nextHandle_.fetch_add(1, std::memory_order_relaxed)};
}

// =============================================================================
// Timer Scheduling
// =============================================================================

core::Result<TimerHandle, TimerError> LinuxTimerPAL::scheduleRepeating(
    std::chrono::milliseconds interval,
    TimerCallback callback
) {
    if (interval.count() <= 0) {
        return core::Result<TimerHandle, TimerError>::error(
            TimerError{TimerErrorCode::InvalidInterval,
                       "Interval must be positive, got " + std::to_string(interval.count()) + "ms"}
        );
    }

    if (epollFd_ < 0) {
        return core::Result<TimerHandle, TimerError>::error(
            TimerError{TimerErrorCode::CreationFailed, "Timer subsystem not initialized"}
        );
    }

    int timerFd = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (timerFd < 0) {
        return core::Result<TimerHandle, TimerError>::error(
            TimerError{TimerErrorCode::CreationFailed, "timerfd_create failed: " + std::string(strerror(errno))}
        );
    }

    struct itimerspec its = makeTimerSpec(interval);
    if (timerfd_settime(timerFd, 0, &its, nullptr) < 0) {
        int savedErrno = errno;
        close(timerFd);
        return core::Result<TimerHandle, TimerError>::error(
            TimerError{TimerErrorCode::CreationFailed, "timerfd_settime failed: " + std::string(strerror(savedErrno))}
        );
    }

    TimerHandle handle = generateHandle();

    auto timerInfo = std::make_unique<TimerInfo>();
    timerInfo->timerFd = timerFd;
    timerInfo->callback = std::move(callback);

    {
        // Registered before the fd enters epoll so dispatch() always finds it
        std::lock_guard<std::mutex> lock(timersMutex_);
        fdToHandle_[timerFd] = handle.value;
        timers_[handle.value] = std::move(timerInfo);

        struct epoll_event ev;
        memset(&ev, 0, sizeof(ev));
        ev.events = EPOLLIN;
        ev.data.fd = timerFd;
        if (epoll_ctl(epollFd_, EPOLL_CTL_ADD, timerFd, &ev) < 0) {
            int savedErrno = errno;
            fdToHandle_.erase(timerFd);
            timers_.erase(handle.value);
            close(timerFd);
            return core::Result<TimerHandle, TimerError>::error(
                TimerError{TimerErrorCode::CreationFailed, "epoll_ctl failed: " + std::string(strerror(savedErrno))}
            );
        }
    }

    return core::Result<TimerHandle, TimerError>::success(handle);
}

core::Result<void, TimerError> LinuxTimerPAL::cancelTimer(TimerHandle handle) {
    if (handle == INVALID_TIMER_HANDLE) {
        return core::Result<void, TimerError>::error(
            TimerError{TimerErrorCode::InvalidHandle, "Invalid timer handle"}
        );
    }

    {
        std::lock_guard<std::mutex> lock(timersMutex_);

        auto it = timers_.find(handle.value);
        if (it == timers_.end()) {
            return core::Result<void, TimerError>::error(
                TimerError{TimerErrorCode::AlreadyCancelled, "Timer not found or already cancelled"}
            );
        }

        int fd = it->second->timerFd;
        epoll_ctl(epollFd_, EPOLL_CTL_DEL, fd, nullptr);
        close(fd);

        fdToHandle_.erase(fd);
        timers_.erase(it);
    }

    // A callback cancelling its own timer must not wait for itself
    if (!onTimerThread()) {
        std::unique_lock<std::mutex> flightLock(inFlightMutex_);
        inFlightCv_.wait(flightLock, [this, &handle]() {
            return inFlightHandle_ != handle.value;
        });
    }

    return core::Result<void, TimerError>::success();
}

size_t LinuxTimerPAL::activeTimerCount() const {
    std::lock_guard<std::mutex> lock(timersMutex_);
    return timers_.size();
}

// =============================================================================
// Time Measurement
// =============================================================================

std::chrono::steady_clock::time_point LinuxTimerPAL::now() const {
    return std::chrono::steady_clock::now();
}

} // namespace linux
} // namespace pal
} // namespace batchcollapse

#endif // defined(__linux__)
