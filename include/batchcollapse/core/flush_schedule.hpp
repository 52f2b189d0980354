// BatchCollapse - Coalescing retention timer
// Flush timing policy and the shared watermark pair
//
// Every pending key of an engine shares one lastExec/nextExec pair.
// Collapsing any key postpones the time-based flush of every key.

#ifndef BATCHCOLLAPSE_CORE_FLUSH_SCHEDULE_HPP
#define BATCHCOLLAPSE_CORE_FLUSH_SCHEDULE_HPP

#include "batchcollapse/core/types.hpp"

namespace batchcollapse {
namespace core {

/**
 * @brief Decide whether a pending entry should flush now.
 *
 * True when any of:
 * - force is set (cancel drain)
 * - now is past nextExec (retention window elapsed with no new arrival)
 * - more than maxDuration has passed since lastExec (absolute ceiling)
 *
 * Both comparisons are strict.
 */
bool shouldFlush(
    TimePoint now,
    TimePoint lastExec,
    TimePoint nextExec,
    Duration maxDuration,
    bool force
);

/**
 * @brief Watermarks that drive time-based flushing.
 *
 * Not thread-safe. The owning engine guards it with its store lock.
 *
 * @invariant nextExec() is always the time of the latest rearm() or
 *            recordFlush() (or construction) plus the retention duration
 */
class FlushSchedule {
public:
    /**
     * @param createdAt Engine construction time; becomes lastExec
     * @param retention Quiet window re-armed by every collapse and flush
     * @param maxDuration Ceiling on the time since the last flush
     */
    FlushSchedule(TimePoint createdAt, Duration retention, Duration maxDuration);

    /**
     * @brief Push nextExec to now + retention. Called on every collapse.
     */
    void rearm(TimePoint now);

    /**
     * @brief Record a flush: lastExec = now, nextExec = now + retention.
     */
    void recordFlush(TimePoint now);

    bool shouldFlush(TimePoint now, bool force) const;

    TimePoint lastExec() const { return lastExec_; }
    TimePoint nextExec() const { return nextExec_; }
    Duration retention() const { return retention_; }
    Duration maxDuration() const { return maxDuration_; }

private:
    TimePoint deadlineFrom(TimePoint now) const;

    Duration retention_;
    Duration maxDuration_;
    TimePoint lastExec_;
    TimePoint nextExec_;
};

} // namespace core
} // namespace batchcollapse

#endif // BATCHCOLLAPSE_CORE_FLUSH_SCHEDULE_HPP
