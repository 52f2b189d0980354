// BatchCollapse - Coalescing retention timer
// Linux Signal Hook Implementation

#include "batchcollapse/pal/linux/linux_signal_hook.hpp"

#if defined(__linux__)

#include <sys/eventfd.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <exception>

namespace batchcollapse {
namespace pal {
namespace linux {

namespace {
constexpr const char* LOG_CATEGORY = "Signal";
}

// =============================================================================
// Static Members
// =============================================================================

std::atomic<LinuxSignalHook*> LinuxSignalHook::active_{nullptr};

// =============================================================================
// Constructor / Destructor
// =============================================================================

LinuxSignalHook::LinuxSignalHook(std::shared_ptr<ILogPAL> logger)
    : logger_(std::move(logger))
{
}

LinuxSignalHook::~LinuxSignalHook() {
    if (isInstalled()) {
        auto result = uninstall();
        if (result.isError()) {
            BATCHCOLLAPSE_LOG_WARNING(logger_, LOG_CATEGORY,
                "Failed to uninstall signal hook: " << result.error().message);
        }
    }
}

// =============================================================================
// Signal Handler
// =============================================================================

void LinuxSignalHook::handleSignal(int signalNumber) {
    // Async-signal-safe: atomics and write(2) only
    int savedErrno = errno;

    LinuxSignalHook* hook = active_.load();
    if (hook != nullptr && hook->eventFd_ >= 0) {
        hook->pendingSignal_.store(signalNumber);
        uint64_t one = 1;
        ssize_t result = write(hook->eventFd_, &one, sizeof(one));
        (void)result;
    }

    errno = savedErrno;
}

// =============================================================================
// Installation
// =============================================================================

core::Result<void, SignalHookError> LinuxSignalHook::install(std::vector<int> signals) {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);

    if (installed_) {
        return core::Result<void, SignalHookError>::error(
            SignalHookError{SignalHookError::Code::AlreadyInstalled, "Signal hook already installed"}
        );
    }

    LinuxSignalHook* expected = nullptr;
    if (!active_.compare_exchange_strong(expected, this)) {
        return core::Result<void, SignalHookError>::error(
            SignalHookError{SignalHookError::Code::AlreadyInstalled,
                            "Another signal hook is installed in this process"}
        );
    }

    eventFd_ = eventfd(0, EFD_CLOEXEC);
    if (eventFd_ < 0) {
        int savedErrno = errno;
        active_.store(nullptr);
        return core::Result<void, SignalHookError>::error(
            SignalHookError{SignalHookError::Code::InstallFailed,
                            "eventfd failed: " + std::string(strerror(savedErrno)),
                            savedErrno}
        );
    }

    stopping_ = false;
    watcherThread_ = std::thread(&LinuxSignalHook::watcherThreadFunc, this);

    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = &LinuxSignalHook::handleSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;

    for (int signalNumber : signals) {
        struct sigaction previous;
        std::memset(&previous, 0, sizeof(previous));

        if (sigaction(signalNumber, &sa, &previous) < 0) {
            int savedErrno = errno;
            restoreHandlers();
            active_.store(nullptr);

            stopping_ = true;
            wakeWatcher();
            watcherThread_.join();
            close(eventFd_);
            eventFd_ = -1;

            return core::Result<void, SignalHookError>::error(
                SignalHookError{SignalHookError::Code::InstallFailed,
                                "Failed to install handler for signal " + std::to_string(signalNumber) +
                                ": " + std::string(strerror(savedErrno)),
                                savedErrno}
            );
        }

        previousActions_.emplace_back(signalNumber, previous);
    }

    installed_ = true;
    BATCHCOLLAPSE_LOG_INFO(logger_, LOG_CATEGORY,
        "Signal hook installed for " << signals.size() << " signal(s)");
    return core::Result<void, SignalHookError>::success();
}

core::Result<void, SignalHookError> LinuxSignalHook::uninstall() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);

    if (!installed_) {
        return core::Result<void, SignalHookError>::error(
            SignalHookError{SignalHookError::Code::NotInstalled, "Signal hook not installed"}
        );
    }

    restoreHandlers();
    active_.store(nullptr);

    stopping_ = true;
    wakeWatcher();
    if (watcherThread_.joinable()) {
        watcherThread_.join();
    }

    close(eventFd_);
    eventFd_ = -1;
    installed_ = false;

    BATCHCOLLAPSE_LOG_DEBUG(logger_, LOG_CATEGORY, "Signal hook uninstalled");
    return core::Result<void, SignalHookError>::success();
}

bool LinuxSignalHook::isInstalled() const {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    return installed_;
}

void LinuxSignalHook::restoreHandlers() {
    for (auto& entry : previousActions_) {
        if (sigaction(entry.first, &entry.second, nullptr) < 0) {
            BATCHCOLLAPSE_LOG_WARNING(logger_, LOG_CATEGORY,
                "Failed to restore handler for signal " << entry.first << ": " << strerror(errno));
        }
    }
    previousActions_.clear();
}

// =============================================================================
// Callbacks
// =============================================================================

void LinuxSignalHook::addShutdownCallback(ShutdownCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    callbacks_.push_back(std::move(callback));
}

void LinuxSignalHook::trigger(int signalNumber) {
    {
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        if (installed_) {
            pendingSignal_.store(signalNumber);
            wakeWatcher();
            return;
        }
    }

    fire(signalNumber);
}

bool LinuxSignalHook::hasFired() const {
    return fired_.load();
}

int LinuxSignalHook::lastSignal() const {
    return lastSignal_.load();
}

bool LinuxSignalHook::waitForShutdown(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(completionMutex_);
    return completionCv_.wait_for(lock, timeout, [this]() { return completed_; });
}

void LinuxSignalHook::fire(int signalNumber) {
    bool expected = false;
    if (!fired_.compare_exchange_strong(expected, true)) {
        BATCHCOLLAPSE_LOG_DEBUG(logger_, LOG_CATEGORY,
            "Signal " << signalNumber << " ignored, shutdown already requested");
        return;
    }

    lastSignal_.store(signalNumber);
    BATCHCOLLAPSE_LOG_INFO(logger_, LOG_CATEGORY,
        "Received signal " << signalNumber << " (" << strsignal(signalNumber) << "), shutting down");

    std::vector<ShutdownCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callbacks = callbacks_;
    }

    for (const auto& callback : callbacks) {
        if (!callback) {
            continue;
        }
        try {
            callback(signalNumber);
        } catch (const std::exception& e) {
            BATCHCOLLAPSE_LOG_ERROR(logger_, LOG_CATEGORY, "Exception in shutdown callback: " << e.what());
        } catch (...) {
            BATCHCOLLAPSE_LOG_ERROR(logger_, LOG_CATEGORY, "Unknown exception in shutdown callback");
        }
    }

    {
        std::lock_guard<std::mutex> lock(completionMutex_);
        completed_ = true;
    }
    completionCv_.notify_all();
}

// =============================================================================
// Watcher Thread
// =============================================================================

void LinuxSignalHook::wakeWatcher() {
    if (eventFd_ >= 0) {
        uint64_t one = 1;
        ssize_t result = write(eventFd_, &one, sizeof(one));
        (void)result;  // Counter overflow only; watcher is already awake
    }
}

void LinuxSignalHook::watcherThreadFunc() {
    while (true) {
        uint64_t value = 0;
        ssize_t bytesRead = read(eventFd_, &value, sizeof(value));
        if (bytesRead < 0) {
            if (errno == EINTR) {
                continue;
            }
            BATCHCOLLAPSE_LOG_ERROR(logger_, LOG_CATEGORY,
                "Signal watcher read failed: " << strerror(errno));
            return;
        }

        int signalNumber = pendingSignal_.exchange(0);
        if (signalNumber != 0) {
            fire(signalNumber);
        }

        if (stopping_.load()) {
            return;
        }
    }
}

} // namespace linux
} // namespace pal
} // namespace batchcollapse

#endif // defined(__linux__)
