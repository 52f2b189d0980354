// BatchCollapse - Coalescing retention timer
// Tests for the Driver Loop

#include <gtest/gtest.h>
#include "batchcollapse/core/driver_loop.hpp"
#include "../mocks/capturing_log_pal.hpp"
#include "../mocks/manual_timer_pal.hpp"

#include <memory>
#include <stdexcept>

namespace batchcollapse {
namespace core {
namespace test {

using mocks::CapturingLogPAL;
using mocks::ManualTimerPAL;

class DriverLoopTest : public ::testing::Test {
protected:
    void SetUp() override {
        timer_ = std::make_shared<ManualTimerPAL>();
        logger_ = std::make_shared<CapturingLogPAL>();
    }

    std::unique_ptr<DriverLoop> makeLoop() {
        return std::make_unique<DriverLoop>(
            timer_, std::chrono::milliseconds{10}, [this]() { ++ticks_; }, logger_);
    }

    std::shared_ptr<ManualTimerPAL> timer_;
    std::shared_ptr<CapturingLogPAL> logger_;
    int ticks_ = 0;
};

TEST_F(DriverLoopTest, StartsIdle) {
    auto loop = makeLoop();

    EXPECT_EQ(loop->state(), DriverState::Idle);
    EXPECT_EQ(timer_->activeTimerCount(), 0u);
}

TEST_F(DriverLoopTest, StartSchedulesRepeatingTimer) {
    auto loop = makeLoop();

    auto result = loop->start();

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(loop->state(), DriverState::Running);
    EXPECT_EQ(timer_->activeTimerCount(), 1u);
    EXPECT_EQ(timer_->lastInterval(), std::chrono::milliseconds{10});
    EXPECT_TRUE(logger_->hasLog(pal::LogLevel::Info, "Driver loop started"));
}

TEST_F(DriverLoopTest, EveryWakeUpRunsTick) {
    auto loop = makeLoop();
    ASSERT_TRUE(loop->start().isSuccess());

    timer_->fireAll();
    timer_->fireAll();
    timer_->fireAll();

    EXPECT_EQ(ticks_, 3);
    EXPECT_EQ(loop->tickCount(), 3u);
}

TEST_F(DriverLoopTest, StopIsTerminal) {
    auto loop = makeLoop();
    ASSERT_TRUE(loop->start().isSuccess());

    loop->stop();
    timer_->fireAll();

    EXPECT_EQ(loop->state(), DriverState::Stopped);
    EXPECT_EQ(ticks_, 0);
    EXPECT_EQ(timer_->activeTimerCount(), 0u);
    EXPECT_TRUE(logger_->hasLog(pal::LogLevel::Info, "exiting loop"));

    auto restart = loop->start();
    ASSERT_TRUE(restart.isError());
    EXPECT_EQ(restart.error().code, ErrorCode::InvalidState);
}

TEST_F(DriverLoopTest, StopIsIdempotent) {
    auto loop = makeLoop();
    ASSERT_TRUE(loop->start().isSuccess());

    loop->stop();
    loop->stop();

    EXPECT_EQ(timer_->cancelCount(), 1u);
    EXPECT_EQ(logger_->countAtLevel(pal::LogLevel::Warning), 0u);
}

TEST_F(DriverLoopTest, StopBeforeStartNeverSchedules) {
    auto loop = makeLoop();

    loop->stop();

    EXPECT_EQ(loop->state(), DriverState::Stopped);
    EXPECT_TRUE(loop->start().isError());
    EXPECT_EQ(timer_->activeTimerCount(), 0u);
}

TEST_F(DriverLoopTest, SecondStartFails) {
    auto loop = makeLoop();
    ASSERT_TRUE(loop->start().isSuccess());

    auto again = loop->start();

    ASSERT_TRUE(again.isError());
    EXPECT_EQ(again.error().code, ErrorCode::InvalidState);
    EXPECT_EQ(timer_->activeTimerCount(), 1u);
}

TEST_F(DriverLoopTest, NullTimerFailsToStart) {
    DriverLoop loop(nullptr, std::chrono::milliseconds{10}, []() {});

    auto result = loop.start();

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::NotInitialized);
    EXPECT_EQ(loop.state(), DriverState::Idle);
}

TEST_F(DriverLoopTest, SchedulingFailureStopsLoop) {
    timer_->setFailSchedule(true);
    auto loop = makeLoop();

    auto result = loop->start();

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::TimerFailed);
    EXPECT_EQ(loop->state(), DriverState::Stopped);
    EXPECT_TRUE(logger_->hasLog(pal::LogLevel::Error, "failed to start"));
}

TEST_F(DriverLoopTest, TickExceptionIsLoggedAndLoopContinues) {
    int calls = 0;
    DriverLoop loop(timer_, std::chrono::milliseconds{10}, [&calls]() {
        ++calls;
        throw std::runtime_error("tick failed");
    }, logger_);
    ASSERT_TRUE(loop.start().isSuccess());

    timer_->fireAll();
    timer_->fireAll();

    EXPECT_EQ(calls, 2);
    EXPECT_EQ(loop.state(), DriverState::Running);
    EXPECT_TRUE(logger_->hasLog(pal::LogLevel::Error, "tick failed"));
}

TEST_F(DriverLoopTest, DestructorCancelsTimer) {
    {
        auto loop = makeLoop();
        ASSERT_TRUE(loop->start().isSuccess());
    }

    EXPECT_EQ(timer_->activeTimerCount(), 0u);
}

TEST_F(DriverLoopTest, StopFromInsideTick) {
    std::unique_ptr<DriverLoop> loop;
    int calls = 0;
    loop = std::make_unique<DriverLoop>(timer_, std::chrono::milliseconds{10}, [&]() {
        ++calls;
        loop->stop();
    }, logger_);
    ASSERT_TRUE(loop->start().isSuccess());

    timer_->fireAll();
    timer_->fireAll();

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(loop->state(), DriverState::Stopped);
}

} // namespace test
} // namespace core
} // namespace batchcollapse
