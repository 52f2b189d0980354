// BatchCollapse - Coalescing retention timer
// Platform Abstraction Layer - Logging Interface
//
// Engine lifecycle events (creation, driver start/stop, flushes, callback
// failures, cancellation) are reported through this interface. A null
// logger pointer disables logging entirely.

#ifndef BATCHCOLLAPSE_PAL_LOG_PAL_HPP
#define BATCHCOLLAPSE_PAL_LOG_PAL_HPP

#include "batchcollapse/pal/pal_types.hpp"

#include <memory>
#include <sstream>
#include <string>

namespace batchcollapse {
namespace pal {

/**
 * @brief Destination for formatted log records.
 *
 * Sinks must tolerate concurrent write() calls.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    /**
     * @brief Write one log record.
     *
     * @param level Severity of the record
     * @param message Log message
     * @param category Component that emitted the record (e.g. "Collapse")
     * @param context Source location
     */
    virtual void write(
        LogLevel level,
        const std::string& message,
        const std::string& category,
        const LogContext& context
    ) = 0;

    virtual void flush() = 0;

    virtual std::string getName() const = 0;
};

/**
 * @brief Abstract interface for platform-specific logging.
 *
 * ## Thread Safety
 * All methods are thread-safe. Records from different threads may
 * interleave.
 *
 * @invariant Records below the minimum level are dropped before formatting
 * @invariant Every registered sink receives every qualifying record
 */
class ILogPAL {
public:
    virtual ~ILogPAL() = default;

    /**
     * @brief Log a message.
     *
     * @code
     * LogContext ctx{__FILE__, __LINE__, __FUNCTION__};
     * logPal->log(LogLevel::Info, "Driver loop started", "Driver", ctx);
     * @endcode
     */
    virtual void log(
        LogLevel level,
        const std::string& message,
        const std::string& category,
        const LogContext& context
    ) = 0;

    virtual void setMinLevel(LogLevel level) = 0;

    virtual LogLevel getMinLevel() const = 0;

    /**
     * @brief Flush every registered sink.
     */
    virtual void flush() = 0;

    virtual void addSink(std::shared_ptr<ILogSink> sink) = 0;

    /**
     * @brief Unregister a sink. Unknown sinks are ignored.
     */
    virtual void removeSink(std::shared_ptr<ILogSink> sink) = 0;
};

// =============================================================================
// Convenience Macros for Logging
// =============================================================================

/**
 * The message argument is a stream expression, evaluated only when the
 * logger is non-null:
 *
 *   BATCHCOLLAPSE_LOG_INFO(logger_, "Collapse", "drained " << count << " entries");
 */

#define BATCHCOLLAPSE_LOG_CONTEXT() \
    ::batchcollapse::pal::LogContext{__FILE__, __LINE__, __FUNCTION__}

#define BATCHCOLLAPSE_LOG(logger, level, category, message) \
    do { \
        if ((logger) != nullptr) { \
            std::ostringstream batchcollapseLogStream_; \
            batchcollapseLogStream_ << message; \
            (logger)->log((level), batchcollapseLogStream_.str(), (category), \
                          BATCHCOLLAPSE_LOG_CONTEXT()); \
        } \
    } while (0)

#define BATCHCOLLAPSE_LOG_TRACE(logger, category, message) \
    BATCHCOLLAPSE_LOG(logger, ::batchcollapse::pal::LogLevel::Trace, category, message)

#define BATCHCOLLAPSE_LOG_DEBUG(logger, category, message) \
    BATCHCOLLAPSE_LOG(logger, ::batchcollapse::pal::LogLevel::Debug, category, message)

#define BATCHCOLLAPSE_LOG_INFO(logger, category, message) \
    BATCHCOLLAPSE_LOG(logger, ::batchcollapse::pal::LogLevel::Info, category, message)

#define BATCHCOLLAPSE_LOG_WARNING(logger, category, message) \
    BATCHCOLLAPSE_LOG(logger, ::batchcollapse::pal::LogLevel::Warning, category, message)

#define BATCHCOLLAPSE_LOG_ERROR(logger, category, message) \
    BATCHCOLLAPSE_LOG(logger, ::batchcollapse::pal::LogLevel::Error, category, message)

#define BATCHCOLLAPSE_LOG_CRITICAL(logger, category, message) \
    BATCHCOLLAPSE_LOG(logger, ::batchcollapse::pal::LogLevel::Critical, category, message)

} // namespace pal
} // namespace batchcollapse

#endif // BATCHCOLLAPSE_PAL_LOG_PAL_HPP
