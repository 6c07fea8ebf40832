#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include "core/test_base.hpp"
#include "trade_pilot/engine/periodic_task.hpp"

using namespace trade_pilot;
using namespace trade_pilot::testing;
using namespace std::chrono_literals;

class PeriodicTaskTest : public TestBase {
protected:
    template <typename Pred>
    bool wait_until(Pred pred, std::chrono::milliseconds limit = 2000ms) {
        auto deadline = std::chrono::steady_clock::now() + limit;
        while (std::chrono::steady_clock::now() < deadline) {
            if (pred()) {
                return true;
            }
            std::this_thread::sleep_for(5ms);
        }
        return pred();
    }
};

TEST_F(PeriodicTaskTest, RunsHandlerRepeatedly) {
    std::atomic<int> calls{0};
    PeriodicTask task("test_task", 10ms, [&calls]() { calls++; });
    ASSERT_TRUE(task.start().is_ok());
    EXPECT_TRUE(task.is_running());

    EXPECT_TRUE(wait_until([&calls]() { return calls.load() >= 3; }));
    task.stop();
    EXPECT_FALSE(task.is_running());
    EXPECT_GE(task.tick_count(), 3u);
}

TEST_F(PeriodicTaskTest, NoHandlerRunsAfterStopReturns) {
    std::atomic<int> calls{0};
    PeriodicTask task("test_task", 5ms, [&calls]() { calls++; });
    ASSERT_TRUE(task.start().is_ok());
    EXPECT_TRUE(wait_until([&calls]() { return calls.load() >= 1; }));
    task.stop();

    int after_stop = calls.load();
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(calls.load(), after_stop);
}

TEST_F(PeriodicTaskTest, StopInterruptsLongPeriod) {
    PeriodicTask task("slow_task", std::chrono::milliseconds(60000), []() {});
    ASSERT_TRUE(task.start().is_ok());

    auto started = std::chrono::steady_clock::now();
    task.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - started, 1000ms);
    EXPECT_EQ(task.tick_count(), 0u);
}

TEST_F(PeriodicTaskTest, HandlerFailuresDoNotStopTheTask) {
    std::atomic<int> calls{0};
    PeriodicTask task("flaky_task", 5ms, [&calls]() {
        if (calls++ % 2 == 0) {
            throw std::runtime_error("tick failed");
        }
    });
    ASSERT_TRUE(task.start().is_ok());
    EXPECT_TRUE(wait_until([&task]() { return task.failure_count() >= 2 && task.tick_count() >= 2; }));
    EXPECT_TRUE(task.is_running());
    task.stop();
}

TEST_F(PeriodicTaskTest, RejectsInvalidConfiguration) {
    PeriodicTask zero_period("zero", 0ms, []() {});
    auto result = zero_period.start();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);

    PeriodicTask no_handler("empty", 10ms, PeriodicTask::Handler{});
    EXPECT_TRUE(no_handler.start().is_error());
    EXPECT_FALSE(no_handler.is_running());
}

TEST_F(PeriodicTaskTest, TracksStateAndRestarts) {
    PeriodicTask task("restartable", 10ms, []() {});
    ASSERT_TRUE(task.start().is_ok());
    auto running = StateManager::instance().get_state("restartable");
    ASSERT_TRUE(running.is_ok());
    EXPECT_EQ(running.value().state, ComponentState::RUNNING);

    task.stop();
    EXPECT_EQ(StateManager::instance().get_state("restartable").value().state,
              ComponentState::STOPPED);

    ASSERT_TRUE(task.start().is_ok());
    EXPECT_TRUE(task.is_running());
    EXPECT_EQ(StateManager::instance().get_state("restartable").value().state,
              ComponentState::RUNNING);
    task.stop();
}

TEST_F(PeriodicTaskTest, StopIsIdempotent) {
    PeriodicTask task("twice", 10ms, []() {});
    task.stop();
    ASSERT_TRUE(task.start().is_ok());
    task.stop();
    task.stop();
    EXPECT_FALSE(task.is_running());
}
