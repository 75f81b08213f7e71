#include <boa/platform/event_loop.h>
#include <boa/platform/timer.h>

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using namespace boa::platform;
using namespace std::chrono_literals;

// ---------------------------------------------------------------------------
// EventLoop
// ---------------------------------------------------------------------------
TEST(EventLoopTest, PostTaskAndRunPendingExecutesIt) {
    EventLoop loop;
    bool executed = false;

    loop.post_task([&executed]() { executed = true; });
    loop.run_pending();

    EXPECT_TRUE(executed);
}

TEST(EventLoopTest, TasksRunInPostingOrder) {
    EventLoop loop;
    std::vector<int> order;

    for (int i = 0; i < 5; ++i) {
        loop.post_task([i, &order]() { order.push_back(i); });
    }
    loop.run_pending();

    ASSERT_EQ(order.size(), 5u);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(order[i], i);
    }
}

TEST(EventLoopTest, DelayedTaskWaitsForItsTime) {
    EventLoop loop;
    bool executed = false;

    loop.post_delayed_task([&executed]() { executed = true; }, 50ms);

    loop.run_pending();
    EXPECT_FALSE(executed);

    std::this_thread::sleep_for(100ms);
    loop.run_pending();
    EXPECT_TRUE(executed);
}

TEST(EventLoopTest, QuitStopsRun) {
    EventLoop loop;
    loop.post_task([&loop]() { loop.quit(); });

    loop.run();

    EXPECT_FALSE(loop.is_running());
}

TEST(EventLoopTest, QuitFromAnotherThreadStopsRun) {
    EventLoop loop;
    std::thread stopper([&loop]() {
        std::this_thread::sleep_for(30ms);
        loop.quit();
    });

    loop.run();
    stopper.join();

    EXPECT_FALSE(loop.is_running());
}

TEST(EventLoopTest, PendingCountIncludesDelayedTasks) {
    EventLoop loop;
    EXPECT_EQ(loop.pending_count(), 0u);

    loop.post_task([]() {});
    loop.post_delayed_task([]() {}, 10s);
    EXPECT_EQ(loop.pending_count(), 2u);

    loop.run_pending();
    EXPECT_EQ(loop.pending_count(), 1u);
}

TEST(EventLoopTest, TaskPostedFromTaskRunsOnNextPass) {
    EventLoop loop;
    bool inner_executed = false;

    loop.post_task([&loop, &inner_executed]() {
        loop.post_task([&inner_executed]() { inner_executed = true; });
    });

    loop.run_pending();
    EXPECT_FALSE(inner_executed);
    loop.run_pending();
    EXPECT_TRUE(inner_executed);
}

TEST(EventLoopTest, RunForRunsDueTasksAndReturns) {
    EventLoop loop;
    std::vector<int> order;

    loop.post_delayed_task([&order]() { order.push_back(2); }, 20ms);
    loop.post_task([&order]() { order.push_back(1); });
    loop.post_delayed_task([&order]() { order.push_back(3); }, 10s);

    loop.run_for(200ms);

    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(order[0], 1);
    EXPECT_EQ(order[1], 2);
    EXPECT_FALSE(loop.is_running());
    EXPECT_EQ(loop.pending_count(), 1u);
}

TEST(EventLoopTest, RunForStopsEarlyOnQuit) {
    EventLoop loop;
    loop.post_task([&loop]() { loop.quit(); });

    auto start = std::chrono::steady_clock::now();
    loop.run_for(5s);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, 1s);
}

// ---------------------------------------------------------------------------
// Timer
// ---------------------------------------------------------------------------
TEST(TimerTest, OneShotFiresOnce) {
    EventLoop loop;
    int fired = 0;

    auto timer = Timer::one_shot(loop, 10ms, [&fired]() { ++fired; });
    EXPECT_TRUE(timer->is_active());

    loop.run_for(100ms);

    EXPECT_EQ(fired, 1);
    EXPECT_FALSE(timer->is_active());
}

TEST(TimerTest, CancelledTimerNeverFires) {
    EventLoop loop;
    bool fired = false;

    auto timer = Timer::one_shot(loop, 10ms, [&fired]() { fired = true; });
    timer->cancel();
    EXPECT_FALSE(timer->is_active());

    loop.run_for(60ms);
    EXPECT_FALSE(fired);
}

TEST(TimerTest, DestroyedTimerNeverFires) {
    EventLoop loop;
    bool fired = false;

    {
        auto timer = Timer::one_shot(loop, 10ms, [&fired]() { fired = true; });
    }

    loop.run_for(60ms);
    EXPECT_FALSE(fired);
}

TEST(TimerTest, ReplacingOneShotRestartsTheDelay) {
    EventLoop loop;
    std::vector<int> fired;

    auto timer = Timer::one_shot(loop, 30ms, [&fired]() { fired.push_back(1); });
    timer = Timer::one_shot(loop, 30ms, [&fired]() { fired.push_back(2); });

    loop.run_for(150ms);

    ASSERT_EQ(fired.size(), 1u);
    EXPECT_EQ(fired[0], 2);
}

TEST(TimerTest, RepeatingFiresUntilCancelled) {
    EventLoop loop;
    std::atomic<int> ticks{0};

    std::unique_ptr<Timer> timer;
    timer = Timer::repeating(loop, 5ms, [&]() {
        if (++ticks == 3) {
            timer->cancel();
        }
    });

    loop.run_for(200ms);

    EXPECT_EQ(ticks.load(), 3);
    EXPECT_FALSE(timer->is_active());
}
