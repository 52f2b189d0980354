// BatchCollapse - Coalescing retention timer
// Tests for Linux Timer PAL Implementation

#include <gtest/gtest.h>
#include "batchcollapse/pal/timer_pal.hpp"
#include "batchcollapse/pal/pal_types.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <thread>

#if defined(__linux__)
#include "batchcollapse/pal/linux/linux_timer_pal.hpp"
#endif

namespace batchcollapse {
namespace pal {
namespace test {

#if defined(__linux__)

namespace {

bool waitUntil(const std::function<bool()>& condition,
               std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return condition();
}

} // anonymous namespace

// =============================================================================
// Linux Timer PAL Tests
// =============================================================================

class LinuxTimerPALTest : public ::testing::Test {
protected:
    void SetUp() override {
        timerPal_ = std::make_unique<linux::LinuxTimerPAL>();
    }

    void TearDown() override {
        timerPal_.reset();
    }

    std::unique_ptr<linux::LinuxTimerPAL> timerPal_;
};

TEST_F(LinuxTimerPALTest, FactoryReturnsLinuxImplementation) {
    auto timer = createPlatformTimer();
    ASSERT_NE(timer, nullptr);
    EXPECT_NE(dynamic_cast<linux::LinuxTimerPAL*>(timer.get()), nullptr);
}

TEST_F(LinuxTimerPALTest, ScheduleRepeatingReturnsValidHandle) {
    auto result = timerPal_->scheduleRepeating(
        std::chrono::milliseconds{10}, []() {});

    ASSERT_TRUE(result.isSuccess());
    EXPECT_NE(result.value(), INVALID_TIMER_HANDLE);
    EXPECT_EQ(timerPal_->activeTimerCount(), 1u);
}

TEST_F(LinuxTimerPALTest, HandlesAreUnique) {
    auto first = timerPal_->scheduleRepeating(std::chrono::milliseconds{50}, []() {});
    auto second = timerPal_->scheduleRepeating(std::chrono::milliseconds{50}, []() {});

    ASSERT_TRUE(first.isSuccess());
    ASSERT_TRUE(second.isSuccess());
    EXPECT_NE(first.value(), second.value());
    EXPECT_EQ(timerPal_->activeTimerCount(), 2u);
}

TEST_F(LinuxTimerPALTest, RepeatingTimerFiresMultipleTimes) {
    std::atomic<int> fires{0};

    auto result = timerPal_->scheduleRepeating(
        std::chrono::milliseconds{10},
        [&fires]() { fires++; }
    );
    ASSERT_TRUE(result.isSuccess());

    EXPECT_TRUE(waitUntil([&fires]() { return fires.load() >= 3; }));
}

TEST_F(LinuxTimerPALTest, FirstFireWaitsForOneInterval) {
    std::atomic<bool> fired{false};
    auto start = std::chrono::steady_clock::now();
    std::atomic<int64_t> elapsedMs{-1};

    auto result = timerPal_->scheduleRepeating(
        std::chrono::milliseconds{50},
        [&fired, &elapsedMs, start]() {
            if (!fired.exchange(true)) {
                elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - start).count();
            }
        }
    );
    ASSERT_TRUE(result.isSuccess());

    ASSERT_TRUE(waitUntil([&fired]() { return fired.load(); }));
    EXPECT_GE(elapsedMs.load(), 45);
}

TEST_F(LinuxTimerPALTest, NonPositiveIntervalIsRejected) {
    auto zero = timerPal_->scheduleRepeating(std::chrono::milliseconds{0}, []() {});
    ASSERT_TRUE(zero.isError());
    EXPECT_EQ(zero.error().code, TimerErrorCode::InvalidInterval);

    auto negative = timerPal_->scheduleRepeating(std::chrono::milliseconds{-5}, []() {});
    ASSERT_TRUE(negative.isError());
    EXPECT_EQ(negative.error().code, TimerErrorCode::InvalidInterval);

    EXPECT_EQ(timerPal_->activeTimerCount(), 0u);
}

// =============================================================================
// Cancellation Tests
// =============================================================================

TEST_F(LinuxTimerPALTest, CancelStopsFurtherCallbacks) {
    std::atomic<int> fires{0};

    auto result = timerPal_->scheduleRepeating(
        std::chrono::milliseconds{5},
        [&fires]() { fires++; }
    );
    ASSERT_TRUE(result.isSuccess());
    ASSERT_TRUE(waitUntil([&fires]() { return fires.load() >= 1; }));

    auto cancelResult = timerPal_->cancelTimer(result.value());
    EXPECT_TRUE(cancelResult.isSuccess());
    EXPECT_EQ(timerPal_->activeTimerCount(), 0u);

    int afterCancel = fires.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(fires.load(), afterCancel);
}

TEST_F(LinuxTimerPALTest, CancelTwiceReportsAlreadyCancelled) {
    auto result = timerPal_->scheduleRepeating(std::chrono::milliseconds{100}, []() {});
    ASSERT_TRUE(result.isSuccess());

    EXPECT_TRUE(timerPal_->cancelTimer(result.value()).isSuccess());

    auto second = timerPal_->cancelTimer(result.value());
    ASSERT_TRUE(second.isError());
    EXPECT_EQ(second.error().code, TimerErrorCode::AlreadyCancelled);
}

TEST_F(LinuxTimerPALTest, CancelInvalidHandleFails) {
    auto result = timerPal_->cancelTimer(INVALID_TIMER_HANDLE);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, TimerErrorCode::InvalidHandle);
}

TEST_F(LinuxTimerPALTest, CancelWaitsForRunningCallback) {
    std::atomic<bool> entered{false};
    std::atomic<bool> finished{false};

    auto result = timerPal_->scheduleRepeating(
        std::chrono::milliseconds{5},
        [&entered, &finished]() {
            if (entered.exchange(true)) {
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            finished = true;
        }
    );
    ASSERT_TRUE(result.isSuccess());
    ASSERT_TRUE(waitUntil([&entered]() { return entered.load(); }));

    EXPECT_TRUE(timerPal_->cancelTimer(result.value()).isSuccess());
    EXPECT_TRUE(finished.load());
}

TEST_F(LinuxTimerPALTest, CallbackCanCancelItsOwnTimer) {
    std::atomic<int> fires{0};
    std::atomic<bool> cancelled{false};
    TimerHandle handle = INVALID_TIMER_HANDLE;
    std::atomic<bool> handleReady{false};

    auto result = timerPal_->scheduleRepeating(
        std::chrono::milliseconds{5},
        [this, &fires, &cancelled, &handle, &handleReady]() {
            fires++;
            if (handleReady.load() && !cancelled.load()) {
                cancelled = timerPal_->cancelTimer(handle).isSuccess();
            }
        }
    );
    ASSERT_TRUE(result.isSuccess());
    handle = result.value();
    handleReady = true;

    ASSERT_TRUE(waitUntil([&cancelled]() { return cancelled.load(); }));
    EXPECT_EQ(timerPal_->activeTimerCount(), 0u);

    int afterCancel = fires.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_EQ(fires.load(), afterCancel);
}

TEST_F(LinuxTimerPALTest, DestructorWithActiveTimersIsClean) {
    std::atomic<int> fires{0};
    for (int i = 0; i < 5; ++i) {
        auto result = timerPal_->scheduleRepeating(
            std::chrono::milliseconds{5},
            [&fires]() { fires++; }
        );
        ASSERT_TRUE(result.isSuccess());
    }

    ASSERT_TRUE(waitUntil([&fires]() { return fires.load() >= 5; }));
    EXPECT_NO_THROW(timerPal_.reset());
}

// =============================================================================
// Clock Tests
// =============================================================================

TEST_F(LinuxTimerPALTest, NowIsMonotonic) {
    auto first = timerPal_->now();
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    auto second = timerPal_->now();

    EXPECT_GE(second - first, std::chrono::milliseconds(5));
}

#endif // defined(__linux__)

} // namespace test
} // namespace pal
} // namespace batchcollapse
