// BatchCollapse - Coalescing retention timer
// Tests for the single-slot collapse engine

#include <gtest/gtest.h>
#include "batchcollapse/core/batch_collapse.hpp"
#include "../mocks/capturing_log_pal.hpp"
#include "../mocks/manual_timer_pal.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace batchcollapse {
namespace core {
namespace test {

using mocks::CapturingLogPAL;
using mocks::ManualTimerPAL;
using std::chrono::milliseconds;

namespace {

/**
 * Thread-safe record of every value handed to executeFunc.
 */
class Recorder {
public:
    ExecuteFunction<int> sink() {
        return [this](const int& value) {
            std::lock_guard<std::mutex> lock(mutex_);
            values_.push_back(value);
        };
    }

    std::vector<int> values() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_;
    }

    size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<int> values_;
};

template<typename Predicate>
bool waitUntil(Predicate predicate, milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(milliseconds{1});
    }
    return predicate();
}

} // anonymous namespace

// =============================================================================
// Deterministic tests (manual timer)
// =============================================================================

class BatchCollapseTest : public ::testing::Test {
protected:
    void SetUp() override {
        timer_ = std::make_shared<ManualTimerPAL>();
        logger_ = std::make_shared<CapturingLogPAL>();
    }

    CollapseConfig<int> makeConfig(milliseconds retention, milliseconds maxDuration) {
        CollapseConfig<int> config;
        config.retentionDuration = retention;
        config.maxDuration = maxDuration;
        config.executeFunc = recorder_.sink();
        config.timer = timer_;
        config.logger = logger_;
        return config;
    }

    std::shared_ptr<ManualTimerPAL> timer_;
    std::shared_ptr<CapturingLogPAL> logger_;
    Recorder recorder_;
};

TEST_F(BatchCollapseTest, CreationStartsDriverLoop) {
    BatchCollapse<int> slot(makeConfig(milliseconds{5}, milliseconds{60000}));

    EXPECT_EQ(slot.driverState(), DriverState::Running);
    EXPECT_EQ(timer_->activeTimerCount(), 1u);
    EXPECT_EQ(timer_->lastInterval(), milliseconds{10});
    EXPECT_FALSE(slot.isCanceled());
    EXPECT_FALSE(slot.hasPending());
}

TEST_F(BatchCollapseTest, ValueIsPendingUntilRetentionElapses) {
    BatchCollapse<int> slot(makeConfig(milliseconds{5}, milliseconds{60000}));

    EXPECT_EQ(slot.collapse(10), CollapseOutcome::Inserted);
    ASSERT_TRUE(slot.value().has_value());
    EXPECT_EQ(*slot.value(), 10);

    timer_->tick(milliseconds{4});
    EXPECT_EQ(recorder_.count(), 0u);
    EXPECT_TRUE(slot.hasPending());

    timer_->tick(milliseconds{2});
    EXPECT_EQ(recorder_.values(), std::vector<int>{10});
    EXPECT_FALSE(slot.value().has_value());
}

TEST_F(BatchCollapseTest, FirstValueWins) {
    BatchCollapse<int> slot(makeConfig(milliseconds{5}, milliseconds{60000}));

    EXPECT_EQ(slot.collapse(1), CollapseOutcome::Inserted);
    EXPECT_EQ(slot.collapse(2), CollapseOutcome::Collapsed);
    EXPECT_EQ(slot.collapse(3), CollapseOutcome::Collapsed);
    EXPECT_EQ(*slot.value(), 1);

    timer_->tick(milliseconds{6});

    EXPECT_EQ(recorder_.values(), std::vector<int>{1});
}

TEST_F(BatchCollapseTest, RapidCollapsesExecuteOnceAfterLastWindow) {
    BatchCollapse<int> slot(makeConfig(milliseconds{5}, milliseconds{60000}));

    slot.collapse(10);
    timer_->tick(milliseconds{2});
    slot.collapse(10);
    timer_->tick(milliseconds{2});
    slot.collapse(10);

    // Last collapse at +4ms re-armed the window to +9ms
    timer_->tick(milliseconds{4});
    EXPECT_EQ(recorder_.count(), 0u);

    timer_->tick(milliseconds{2});
    EXPECT_EQ(recorder_.count(), 1u);

    for (int i = 0; i < 10; ++i) {
        timer_->tick(milliseconds{10});
    }
    EXPECT_EQ(recorder_.values(), std::vector<int>{10});
}

TEST_F(BatchCollapseTest, RearmPostponesUpToMaxDuration) {
    BatchCollapse<int> slot(makeConfig(milliseconds{100}, milliseconds{1000}));
    milliseconds elapsed{0};

    while (recorder_.count() == 0 && elapsed < milliseconds{5000}) {
        timer_->advanceTime(milliseconds{50});
        elapsed += milliseconds{50};
        slot.collapse(static_cast<int>(elapsed.count()));
        timer_->fireAll();
    }

    ASSERT_EQ(recorder_.count(), 1u);
    EXPECT_EQ(elapsed, milliseconds{1050});
    // The value collapsed first since the last flush is the one delivered
    EXPECT_EQ(recorder_.values().front(), 50);
}

TEST_F(BatchCollapseTest, SlotRefillsAfterFlush) {
    BatchCollapse<int> slot(makeConfig(milliseconds{5}, milliseconds{60000}));

    slot.collapse(1);
    timer_->tick(milliseconds{6});
    EXPECT_EQ(slot.collapse(2), CollapseOutcome::Inserted);
    timer_->tick(milliseconds{6});

    EXPECT_EQ(recorder_.values(), (std::vector<int>{1, 2}));
    auto stats = slot.statistics();
    EXPECT_EQ(stats.inserted, 2u);
    EXPECT_EQ(stats.flushed, 2u);
}

TEST_F(BatchCollapseTest, CancelDrainsPendingValue) {
    BatchCollapse<int> slot(makeConfig(milliseconds{5000}, milliseconds{60000}));
    slot.collapse(42);

    slot.cancel();

    EXPECT_EQ(recorder_.values(), std::vector<int>{42});
    EXPECT_TRUE(slot.isCanceled());
    EXPECT_FALSE(slot.hasPending());
    EXPECT_EQ(slot.driverState(), DriverState::Stopped);
    EXPECT_EQ(slot.statistics().drained, 1u);
    EXPECT_TRUE(logger_->hasLog(pal::LogLevel::Info, "drained 1"));
}

TEST_F(BatchCollapseTest, CancelWithNothingPending) {
    BatchCollapse<int> slot(makeConfig(milliseconds{5}, milliseconds{60000}));

    slot.cancel();

    EXPECT_EQ(recorder_.count(), 0u);
    EXPECT_TRUE(slot.isCanceled());
}

TEST_F(BatchCollapseTest, NoTimerFlushAfterCancel) {
    BatchCollapse<int> slot(makeConfig(milliseconds{5}, milliseconds{60000}));
    slot.cancel();

    EXPECT_EQ(slot.collapse(7), CollapseOutcome::Inserted);
    timer_->tick(milliseconds{100});

    EXPECT_EQ(recorder_.count(), 0u);
    EXPECT_EQ(*slot.value(), 7);
}

TEST_F(BatchCollapseTest, DestructionDoesNotDrain) {
    {
        BatchCollapse<int> slot(makeConfig(milliseconds{5000}, milliseconds{60000}));
        slot.collapse(1);
    }

    EXPECT_EQ(recorder_.count(), 0u);
    EXPECT_EQ(timer_->activeTimerCount(), 0u);
    EXPECT_TRUE(logger_->hasLog(pal::LogLevel::Warning, "1 pending value(s) not flushed"));
}

// =============================================================================
// Real-time tests (platform timer)
// =============================================================================

#if defined(__linux__)

TEST(BatchCollapseRealtimeTest, FlushesAfterRetentionWindow) {
    Recorder recorder;
    CollapseConfig<int> config;
    config.retentionDuration = milliseconds{5};
    config.maxDuration = milliseconds{60000};
    config.executeFunc = recorder.sink();

    BatchCollapse<int> slot(config);
    slot.collapse(10);

    ASSERT_TRUE(slot.value().has_value());
    EXPECT_EQ(*slot.value(), 10);

    std::this_thread::sleep_for(milliseconds{10});
    ASSERT_TRUE(waitUntil([&]() { return recorder.count() == 1; }, milliseconds{2000}));

    EXPECT_EQ(recorder.values(), std::vector<int>{10});
    EXPECT_FALSE(slot.value().has_value());
}

TEST(BatchCollapseRealtimeTest, BurstExecutesExactlyOnce) {
    Recorder recorder;
    CollapseConfig<int> config;
    config.retentionDuration = milliseconds{20};
    config.maxDuration = milliseconds{60000};
    config.executeFunc = recorder.sink();

    BatchCollapse<int> slot(config);
    slot.collapse(10);
    slot.collapse(10);
    slot.collapse(10);

    ASSERT_TRUE(waitUntil([&]() { return recorder.count() >= 1; }, milliseconds{2000}));
    std::this_thread::sleep_for(milliseconds{60});

    EXPECT_EQ(recorder.values(), std::vector<int>{10});
}

TEST(BatchCollapseRealtimeTest, CancelDrainsBeforeRetention) {
    Recorder recorder;
    CollapseConfig<int> config;
    config.retentionDuration = milliseconds{60000};
    config.maxDuration = milliseconds{120000};
    config.executeFunc = recorder.sink();

    BatchCollapse<int> slot(config);
    slot.collapse(5);
    slot.cancel();

    EXPECT_EQ(recorder.values(), std::vector<int>{5});
    EXPECT_TRUE(slot.isCanceled());
}

#endif // defined(__linux__)

} // namespace test
} // namespace core
} // namespace batchcollapse
