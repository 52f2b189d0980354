// BatchCollapse - Coalescing retention timer
// Linux Log PAL Implementation

#include "batchcollapse/pal/linux/linux_log_pal.hpp"

#if defined(__linux__)

#include <syslog.h>

#include <algorithm>
#include <cstdio>

namespace batchcollapse {
namespace pal {
namespace linux {

// =============================================================================
// Constructor / Destructor
// =============================================================================

LinuxLogPAL::LinuxLogPAL()
    : LinuxLogPAL(LinuxLogOptions{}) {
}

LinuxLogPAL::LinuxLogPAL(LinuxLogOptions options)
    : options_(std::move(options)) {
    if (options_.useSyslog) {
        // options_.ident must outlive the syslog session; it does, as a member
        openlog(options_.ident.c_str(), LOG_PID | LOG_NDELAY, LOG_USER);
        syslogOpened_ = true;
    }
}

LinuxLogPAL::~LinuxLogPAL() {
    flush();

    if (syslogOpened_) {
        closelog();
        syslogOpened_ = false;
    }
}

// =============================================================================
// Logging Operations
// =============================================================================

void LinuxLogPAL::log(
    LogLevel level,
    const std::string& message,
    const std::string& category,
    const LogContext& context
) {
    const LogLevel minLevel = minLevel_.load();
    if (level == LogLevel::Off || minLevel == LogLevel::Off ||
        static_cast<uint32_t>(level) < static_cast<uint32_t>(minLevel)) {
        return;
    }

    logToPlatform(level, message, category);

    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (auto& sink : sinks_) {
        sink->write(level, message, category, context);
    }
}

void LinuxLogPAL::logToPlatform(
    LogLevel level,
    const std::string& message,
    const std::string& category
) {
    if (options_.useSyslog) {
        syslog(toSyslogPriority(level), "[%s] %s", category.c_str(), message.c_str());
    }

    if (options_.useStderr) {
        std::lock_guard<std::mutex> lock(outputMutex_);
        std::fprintf(stderr, "[%s] [%s] %s\n",
                     logLevelToString(level), category.c_str(), message.c_str());
    }
}

int LinuxLogPAL::toSyslogPriority(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:
        case LogLevel::Debug:
            return LOG_DEBUG;
        case LogLevel::Info:
            return LOG_INFO;
        case LogLevel::Warning:
            return LOG_WARNING;
        case LogLevel::Error:
            return LOG_ERR;
        case LogLevel::Critical:
            return LOG_CRIT;
        case LogLevel::Off:
        default:
            return LOG_DEBUG;
    }
}

// =============================================================================
// Level Management
// =============================================================================

void LinuxLogPAL::setMinLevel(LogLevel level) {
    minLevel_ = level;
}

LogLevel LinuxLogPAL::getMinLevel() const {
    return minLevel_.load();
}

// =============================================================================
// Sink Management
// =============================================================================

void LinuxLogPAL::flush() {
    {
        std::lock_guard<std::mutex> lock(sinksMutex_);
        for (auto& sink : sinks_) {
            sink->flush();
        }
    }

    if (options_.useStderr) {
        std::lock_guard<std::mutex> lock(outputMutex_);
        std::fflush(stderr);
    }
}

void LinuxLogPAL::addSink(std::shared_ptr<ILogSink> sink) {
    if (!sink) {
        return;
    }

    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void LinuxLogPAL::removeSink(std::shared_ptr<ILogSink> sink) {
    if (!sink) {
        return;
    }

    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.erase(
        std::remove(sinks_.begin(), sinks_.end(), sink),
        sinks_.end()
    );
}

} // namespace linux
} // namespace pal
} // namespace batchcollapse

#endif // defined(__linux__)
