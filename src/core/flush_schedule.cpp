// BatchCollapse - Coalescing retention timer
// Flush timing policy implementation

#include "batchcollapse/core/flush_schedule.hpp"

namespace batchcollapse {
namespace core {

namespace {

// now + delta, clamped to TimePoint::max() instead of wrapping
TimePoint saturatingAdd(TimePoint now, Duration delta) {
    auto headroom = TimePoint::max() - now;
    if (delta > std::chrono::duration_cast<Duration>(headroom)) {
        return TimePoint::max();
    }
    return now + delta;
}

} // anonymous namespace

bool shouldFlush(
    TimePoint now,
    TimePoint lastExec,
    TimePoint nextExec,
    Duration maxDuration,
    bool force
) {
    if (force) {
        return true;
    }
    if (now > nextExec) {
        return true;
    }
    return (now - lastExec) > maxDuration;
}

// =============================================================================
// FlushSchedule
// =============================================================================

FlushSchedule::FlushSchedule(TimePoint createdAt, Duration retention, Duration maxDuration)
    : retention_(retention)
    , maxDuration_(maxDuration)
    , lastExec_(createdAt)
    , nextExec_(saturatingAdd(createdAt, retention)) {
}

void FlushSchedule::rearm(TimePoint now) {
    nextExec_ = deadlineFrom(now);
}

void FlushSchedule::recordFlush(TimePoint now) {
    lastExec_ = now;
    nextExec_ = deadlineFrom(now);
}

bool FlushSchedule::shouldFlush(TimePoint now, bool force) const {
    return core::shouldFlush(now, lastExec_, nextExec_, maxDuration_, force);
}

TimePoint FlushSchedule::deadlineFrom(TimePoint now) const {
    return saturatingAdd(now, retention_);
}

} // namespace core
} // namespace batchcollapse
