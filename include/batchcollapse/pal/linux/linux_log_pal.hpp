// BatchCollapse - Coalescing retention timer
// Linux Log PAL Implementation
//
// Routes records to syslog and/or stderr, then to registered sinks.

#ifndef BATCHCOLLAPSE_PAL_LINUX_LINUX_LOG_PAL_HPP
#define BATCHCOLLAPSE_PAL_LINUX_LINUX_LOG_PAL_HPP

#include "batchcollapse/pal/log_pal.hpp"
#include "batchcollapse/pal/pal_types.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#if defined(__linux__)

namespace batchcollapse {
namespace pal {
namespace linux {

/**
 * @brief Output selection for LinuxLogPAL.
 */
struct LinuxLogOptions {
    std::string ident = "batchcollapse";  ///< syslog identifier
    bool useSyslog = true;                ///< Write records to syslog(3)
    bool useStderr = true;                ///< Mirror records to stderr
};

/**
 * @brief Linux implementation of ILogPAL.
 *
 * Thread Safety:
 * - All methods are thread-safe
 * - syslog(3) is thread-safe; stderr writes are serialized by outputMutex_
 */
class LinuxLogPAL : public ILogPAL {
public:
    LinuxLogPAL();
    explicit LinuxLogPAL(LinuxLogOptions options);

    /**
     * @brief Flushes all sinks and closes syslog if it was opened.
     */
    ~LinuxLogPAL() override;

    LinuxLogPAL(const LinuxLogPAL&) = delete;
    LinuxLogPAL& operator=(const LinuxLogPAL&) = delete;
    LinuxLogPAL(LinuxLogPAL&&) = delete;
    LinuxLogPAL& operator=(LinuxLogPAL&&) = delete;

    void log(
        LogLevel level,
        const std::string& message,
        const std::string& category,
        const LogContext& context
    ) override;

    void setMinLevel(LogLevel level) override;
    LogLevel getMinLevel() const override;
    void flush() override;
    void addSink(std::shared_ptr<ILogSink> sink) override;
    void removeSink(std::shared_ptr<ILogSink> sink) override;

    const LinuxLogOptions& options() const { return options_; }

private:
    void logToPlatform(
        LogLevel level,
        const std::string& message,
        const std::string& category
    );

    static int toSyslogPriority(LogLevel level);

    LinuxLogOptions options_;
    std::atomic<LogLevel> minLevel_{LogLevel::Info};
    mutable std::mutex sinksMutex_;
    std::vector<std::shared_ptr<ILogSink>> sinks_;
    std::mutex outputMutex_;

    bool syslogOpened_{false};
};

} // namespace linux
} // namespace pal
} // namespace batchcollapse

#endif // defined(__linux__)
#endif // BATCHCOLLAPSE_PAL_LINUX_LINUX_LOG_PAL_HPP
