// BatchCollapse - Coalescing retention timer
// Linux Signal Hook
//
// Turns process termination signals into shutdown callbacks (typically
// an engine's cancel(), which drains pending values before exit).

#ifndef BATCHCOLLAPSE_PAL_LINUX_LINUX_SIGNAL_HOOK_HPP
#define BATCHCOLLAPSE_PAL_LINUX_LINUX_SIGNAL_HOOK_HPP

#include "batchcollapse/core/result.hpp"
#include "batchcollapse/pal/log_pal.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <signal.h>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#if defined(__linux__)

namespace batchcollapse {
namespace pal {
namespace linux {

/**
 * @brief Signal hook error information.
 */
struct SignalHookError {
    enum class Code {
        AlreadyInstalled,   ///< This hook or another one is installed
        InstallFailed,      ///< eventfd or sigaction failed
        NotInstalled        ///< uninstall() without install()
    };

    Code code;
    std::string message;
    int systemErrno;  ///< errno value if applicable

    SignalHookError(Code c = Code::InstallFailed, std::string msg = "", int err = 0)
        : code(c)
        , message(std::move(msg))
        , systemErrno(err) {}
};

/**
 * @brief Callback invoked once with the signal that requested shutdown.
 */
using ShutdownCallback = std::function<void(int signalNumber)>;

/**
 * @brief Installs sigaction handlers that fire shutdown callbacks.
 *
 * The signal handler itself only records the signal number and writes to
 * an eventfd. A watcher thread wakes on the eventfd and runs the
 * registered callbacks, so callbacks may take locks and do I/O.
 *
 * Callbacks fire at most once per hook, on the first signal. Only one
 * hook can be installed per process at a time. Previous dispositions are
 * restored on uninstall() and on destruction.
 *
 * @code
 * LinuxSignalHook hook(logger);
 * hook.addShutdownCallback([&engine](int) { engine.cancel(); });
 * auto installed = hook.install({SIGTERM});
 * if (installed.isError()) { ... }
 * @endcode
 *
 * Thread Safety:
 * - All methods are thread-safe
 * - uninstall() must not be called from a shutdown callback
 */
class LinuxSignalHook {
public:
    explicit LinuxSignalHook(std::shared_ptr<ILogPAL> logger = nullptr);
    ~LinuxSignalHook();

    LinuxSignalHook(const LinuxSignalHook&) = delete;
    LinuxSignalHook& operator=(const LinuxSignalHook&) = delete;

    /**
     * @brief Install handlers for the given signals.
     *
     * Error conditions:
     * - AlreadyInstalled: this hook or another is already installed
     * - InstallFailed: eventfd or sigaction failed (nothing stays installed)
     */
    core::Result<void, SignalHookError> install(std::vector<int> signals = {SIGTERM});

    /**
     * @brief Restore the previous signal dispositions and stop the watcher.
     */
    core::Result<void, SignalHookError> uninstall();

    bool isInstalled() const;

    /**
     * @brief Register a callback. Callbacks run in registration order.
     */
    void addShutdownCallback(ShutdownCallback callback);

    /**
     * @brief Simulate delivery of a signal.
     *
     * While installed, this goes through the same eventfd path as a real
     * signal and callbacks run on the watcher thread. Otherwise they run
     * on the calling thread before trigger() returns.
     */
    void trigger(int signalNumber);

    /**
     * @brief True once a signal has been received or triggered.
     */
    bool hasFired() const;

    /**
     * @brief Signal that fired the callbacks, 0 if none yet.
     */
    int lastSignal() const;

    /**
     * @brief Wait until the shutdown callbacks have run.
     *
     * @return false on timeout
     */
    bool waitForShutdown(std::chrono::milliseconds timeout);

private:
    static void handleSignal(int signalNumber);

    void watcherThreadFunc();

    void wakeWatcher();

    void fire(int signalNumber);

    void restoreHandlers();

    static std::atomic<LinuxSignalHook*> active_;

    std::shared_ptr<ILogPAL> logger_;

    mutable std::mutex lifecycleMutex_;
    bool installed_{false};
    std::vector<std::pair<int, struct sigaction>> previousActions_;

    int eventFd_{-1};
    std::thread watcherThread_;
    std::atomic<bool> stopping_{false};
    std::atomic<int> pendingSignal_{0};

    std::mutex callbackMutex_;
    std::vector<ShutdownCallback> callbacks_;

    std::atomic<bool> fired_{false};
    std::atomic<int> lastSignal_{0};

    std::mutex completionMutex_;
    std::condition_variable completionCv_;
    bool completed_{false};
};

} // namespace linux
} // namespace pal
} // namespace batchcollapse

#endif // defined(__linux__)
#endif // BATCHCOLLAPSE_PAL_LINUX_LINUX_SIGNAL_HOOK_HPP
