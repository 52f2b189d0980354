// BatchCollapse - Coalescing retention timer
// Collapse Engine
//
// Coalesces bursts of values into one delayed callback per key:
// - the first value collapsed for a key is kept until it flushes
// - every collapse re-arms a retention window shared by all keys
// - maxDuration bounds the time since the last flush under continuous arrivals
// - cancel() stops the driver loop and drains every pending value once

#ifndef BATCHCOLLAPSE_CORE_BATCH_COLLAPSE_HPP
#define BATCHCOLLAPSE_CORE_BATCH_COLLAPSE_HPP

#include "batchcollapse/core/driver_loop.hpp"
#include "batchcollapse/core/error_codes.hpp"
#include "batchcollapse/core/flush_schedule.hpp"
#include "batchcollapse/core/types.hpp"
#include "batchcollapse/pal/log_pal.hpp"
#include "batchcollapse/pal/timer_pal.hpp"

#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace batchcollapse {
namespace core {

// =============================================================================
// Configuration
// =============================================================================

/**
 * @brief Sink receiving each flushed value.
 */
template<typename Value>
using ExecuteFunction = std::function<void(const Value&)>;

/**
 * @brief Receives a CallbackFailed error whenever the sink throws.
 */
using ExecuteErrorHandler = std::function<void(const Error&)>;

/**
 * @brief Construction parameters of a collapse engine.
 *
 * Not validated by the engine. maxDuration is expected to be at least
 * retentionDuration; when it is smaller it caps the retention window.
 */
template<typename Value>
struct CollapseConfig {
    /// Quiet window re-armed by every collapse
    Duration retentionDuration{collapse::DEFAULT_RETENTION_MS};

    /// Ceiling on the time since the last flush
    Duration maxDuration{collapse::DEFAULT_MAX_DURATION_MS};

    /// Flush sink. Empty means entries are never removed.
    ExecuteFunction<Value> executeFunc;

    /// Driver loop wake-up period
    Duration pollInterval{collapse::DEFAULT_POLL_INTERVAL_MS};

    /// Maximum number of distinct pending keys (UNLIMITED_PENDING_KEYS = no limit)
    std::size_t maxPendingKeys = collapse::UNLIMITED_PENDING_KEYS;

    /// Wake-up source and clock. Null selects the platform timer.
    std::shared_ptr<pal::ITimerPAL> timer;

    /// Lifecycle logger. Null disables logging.
    std::shared_ptr<pal::ILogPAL> logger;

    /// Optional hook for sink failures
    ExecuteErrorHandler onExecuteError;
};

// =============================================================================
// Keyed Variant
// =============================================================================

/**
 * @brief Collapse engine holding one pending value per key.
 *
 * All keys share a single lastExec/nextExec pair (see FlushSchedule), so
 * a collapse of key A also postpones the time-based flush of key B, and a
 * non-forced evaluation normally flushes at most one key.
 *
 * Flush evaluation removes qualifying entries while holding the store
 * lock, then invokes executeFunc with the lock released. A value is
 * therefore delivered at most once and collapse() may run while the sink
 * is busy.
 *
 * Sink exceptions are caught, logged, counted and reported to
 * onExecuteError; the driver loop keeps running and the value is not
 * retried.
 *
 * ## Thread Safety
 * - collapse(), cancel() and every accessor are thread-safe
 * - executeFunc is never invoked concurrently with itself by the driver;
 *   cancel() waits for an in-flight tick before draining
 *
 * @code
 * CollapseConfig<std::string> config;
 * config.retentionDuration = std::chrono::milliseconds{500};
 * config.maxDuration = std::chrono::seconds{10};
 * config.executeFunc = [](const std::string& path) { reindex(path); };
 *
 * KeyedBatchCollapse<std::string, std::string> engine(config);
 * engine.collapse("docs", "/srv/docs/a.md");
 * engine.collapse("docs", "/srv/docs/b.md");   // collapsed, a.md is kept
 * ...
 * engine.cancel();                             // drains whatever is pending
 * @endcode
 *
 * @tparam Key Key type, hashable with Hash and equality-comparable
 * @tparam Value Payload type, move-constructible
 */
template<typename Key, typename Value, typename Hash = std::hash<Key>>
class KeyedBatchCollapse {
public:
    using KeyType = Key;
    using ValueType = Value;
    using Config = CollapseConfig<Value>;

    /**
     * @brief Create the engine and start its driver loop.
     *
     * If the driver cannot start (no platform timer, timer failure) the
     * failure is logged and the engine still accepts values; they are then
     * only flushed by cancel().
     */
    explicit KeyedBatchCollapse(Config config)
        : config_(std::move(config))
        , timer_(config_.timer ? config_.timer : pal::createPlatformTimer())
        , logger_(config_.logger)
        , schedule_(now(), config_.retentionDuration, config_.maxDuration)
        , driver_(timer_, config_.pollInterval, [this]() { evaluate(false); }, logger_)
    {
        auto started = driver_.start();
        if (started.isError()) {
            BATCHCOLLAPSE_LOG_ERROR(logger_, LOG_CATEGORY,
                "Engine running without driver loop: " << started.error().toString());
        }

        BATCHCOLLAPSE_LOG_DEBUG(logger_, LOG_CATEGORY,
            "Engine created (retention " << config_.retentionDuration.count()
            << "ms, max " << config_.maxDuration.count()
            << "ms, poll " << config_.pollInterval.count() << "ms)");
    }

    /**
     * @brief Stop the driver loop. Pending values are discarded, not drained.
     */
    ~KeyedBatchCollapse() {
        driver_.stop();

        std::size_t remaining = pendingCount();
        if (remaining > 0) {
            BATCHCOLLAPSE_LOG_WARNING(logger_, LOG_CATEGORY,
                "Engine destroyed with " << remaining << " pending value(s) not flushed");
        }
    }

    KeyedBatchCollapse(const KeyedBatchCollapse&) = delete;
    KeyedBatchCollapse& operator=(const KeyedBatchCollapse&) = delete;
    KeyedBatchCollapse(KeyedBatchCollapse&&) = delete;
    KeyedBatchCollapse& operator=(KeyedBatchCollapse&&) = delete;

    // -------------------------------------------------------------------------
    // Operations
    // -------------------------------------------------------------------------

    /**
     * @brief Merge a value into the pending state for key.
     *
     * An absent key stores value. A pending key keeps its stored value
     * (first write wins). Either way the shared retention window is
     * re-armed. Accepted after cancel(), but never flushed then.
     *
     * @return Inserted, Collapsed, or Rejected when maxPendingKeys is
     *         reached for a new key (watermarks untouched)
     */
    CollapseOutcome collapse(const Key& key, Value value) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.collapseCalls;

        CollapseOutcome outcome = CollapseOutcome::Collapsed;
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            if (config_.maxPendingKeys != collapse::UNLIMITED_PENDING_KEYS &&
                entries_.size() >= config_.maxPendingKeys) {
                ++stats_.rejected;
                BATCHCOLLAPSE_LOG_WARNING(logger_, LOG_CATEGORY,
                    "Pending key limit reached (" << config_.maxPendingKeys
                    << "), value rejected");
                return CollapseOutcome::Rejected;
            }
            entries_.emplace(key, std::move(value));
            ++stats_.inserted;
            outcome = CollapseOutcome::Inserted;
        } else {
            ++stats_.collapsed;
        }

        schedule_.rearm(now());
        return outcome;
    }

    /**
     * @brief Stop the driver loop and drain every pending value.
     *
     * The first call stops the loop (waiting for an in-flight tick), runs
     * one forced flush pass and sets the canceled flag. Later calls only
     * log. Safe with nothing pending and after the loop has exited.
     */
    void cancel() {
        bool expected = false;
        if (!cancelRequested_.compare_exchange_strong(expected, true)) {
            BATCHCOLLAPSE_LOG_DEBUG(logger_, LOG_CATEGORY, "Cancel already requested, ignoring");
            return;
        }

        driver_.stop();
        std::size_t drained = evaluate(true);
        canceled_.store(true);

        BATCHCOLLAPSE_LOG_INFO(logger_, LOG_CATEGORY,
            "Engine canceled, drained " << drained << " pending value(s)");
    }

    // -------------------------------------------------------------------------
    // Introspection
    // -------------------------------------------------------------------------

    bool isCanceled() const {
        return canceled_.load();
    }

    /**
     * @brief Value waiting to be flushed for key, if any.
     */
    std::optional<Value> pending(const Key& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::size_t pendingCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    /**
     * @brief Pending keys in unspecified order.
     */
    std::vector<Key> pendingKeys() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Key> keys;
        keys.reserve(entries_.size());
        for (const auto& entry : entries_) {
            keys.push_back(entry.first);
        }
        return keys;
    }

    CollapseStatistics statistics() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

    TimePoint lastExec() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return schedule_.lastExec();
    }

    TimePoint nextExec() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return schedule_.nextExec();
    }

    DriverState driverState() const {
        return driver_.state();
    }

private:
    static constexpr const char* LOG_CATEGORY = "Collapse";

    TimePoint now() const {
        return timer_ ? timer_->now() : Clock::now();
    }

    /**
     * @brief One flush pass; returns the number of values handed to the sink.
     *
     * Non-forced passes stop once cancel() has been requested.
     */
    std::size_t evaluate(bool force) {
        std::vector<Value> ready;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!force && cancelRequested_.load()) {
                return 0;
            }
            if (!config_.executeFunc || entries_.empty()) {
                return 0;
            }

            TimePoint current = now();
            for (auto it = entries_.begin(); it != entries_.end();) {
                if (schedule_.shouldFlush(current, force)) {
                    ready.push_back(std::move(it->second));
                    it = entries_.erase(it);
                    schedule_.recordFlush(current);
                } else {
                    ++it;
                }
            }

            if (force) {
                stats_.drained += ready.size();
            } else {
                stats_.flushed += ready.size();
            }
        }

        if (!ready.empty()) {
            BATCHCOLLAPSE_LOG_DEBUG(logger_, LOG_CATEGORY,
                (force ? "Draining " : "Flushing ") << ready.size() << " value(s)");
        }

        for (const auto& value : ready) {
            try {
                config_.executeFunc(value);
            } catch (const std::exception& e) {
                reportExecuteFailure(e.what());
            } catch (...) {
                reportExecuteFailure("unknown exception");
            }
        }

        return ready.size();
    }

    void reportExecuteFailure(const std::string& what) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++stats_.callbackFailures;
        }

        BATCHCOLLAPSE_LOG_ERROR(logger_, LOG_CATEGORY, "Exception in execute function: " << what);

        if (config_.onExecuteError) {
            try {
                config_.onExecuteError(Error{ErrorCode::CallbackFailed, what, "flush"});
            } catch (const std::exception& e) {
                BATCHCOLLAPSE_LOG_ERROR(logger_, LOG_CATEGORY,
                    "Exception in execute error handler: " << e.what());
            } catch (...) {
                BATCHCOLLAPSE_LOG_ERROR(logger_, LOG_CATEGORY,
                    "Unknown exception in execute error handler");
            }
        }
    }

    Config config_;
    std::shared_ptr<pal::ITimerPAL> timer_;
    std::shared_ptr<pal::ILogPAL> logger_;

    mutable std::mutex mutex_;
    std::unordered_map<Key, Value, Hash> entries_;
    FlushSchedule schedule_;
    CollapseStatistics stats_;

    std::atomic<bool> cancelRequested_{false};
    std::atomic<bool> canceled_{false};

    // Last member: destroyed first, so no tick outlives the store
    DriverLoop driver_;
};

// =============================================================================
// Single-slot Variant
// =============================================================================

namespace detail {

/// The one implicit key of the single-slot variant
enum class SlotKey : uint8_t {
    Sole
};

} // namespace detail

/**
 * @brief Collapse engine holding at most one pending value.
 *
 * A second collapse() before the slot drains keeps the stored value and
 * only re-arms the retention window.
 *
 * @code
 * CollapseConfig<int> config;
 * config.retentionDuration = std::chrono::milliseconds{5};
 * config.maxDuration = std::chrono::seconds{60};
 * config.executeFunc = [](const int& v) { publish(v); };
 *
 * BatchCollapse<int> slot(config);
 * slot.collapse(10);
 * slot.collapse(11);     // ignored, 10 stays pending
 * @endcode
 */
template<typename Value>
class BatchCollapse {
public:
    using ValueType = Value;
    using Config = CollapseConfig<Value>;

    explicit BatchCollapse(Config config)
        : engine_(std::move(config)) {
    }

    CollapseOutcome collapse(Value value) {
        return engine_.collapse(detail::SlotKey::Sole, std::move(value));
    }

    void cancel() {
        engine_.cancel();
    }

    bool isCanceled() const {
        return engine_.isCanceled();
    }

    /**
     * @brief The pending value, if the slot is occupied.
     */
    std::optional<Value> value() const {
        return engine_.pending(detail::SlotKey::Sole);
    }

    bool hasPending() const {
        return engine_.pendingCount() > 0;
    }

    CollapseStatistics statistics() const {
        return engine_.statistics();
    }

    DriverState driverState() const {
        return engine_.driverState();
    }

private:
    KeyedBatchCollapse<detail::SlotKey, Value> engine_;
};

} // namespace core
} // namespace batchcollapse

#endif // BATCHCOLLAPSE_CORE_BATCH_COLLAPSE_HPP
