#include "netrec/event_loop.hpp"

#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <future>
#include <stdexcept>
#include <string>
#include <vector>

using namespace netrec;
using netrec::test::ManualClock;
using std::chrono::milliseconds;

TEST(EventLoopTest, RunsTasksInOrder) {
    EventLoop loop;
    std::vector<int> order;
    loop.post([&] { order.push_back(1); });
    loop.post([&] { order.push_back(2); });
    loop.post([&] { order.push_back(3); });

    EXPECT_EQ(3u, loop.runReady());
    EXPECT_EQ(std::vector<int>({1, 2, 3}), order);
    EXPECT_EQ(0u, loop.runReady());
}

TEST(EventLoopTest, TasksPostedWhileRunningRunInSamePass) {
    EventLoop loop;
    std::vector<int> order;
    loop.post([&] {
        order.push_back(1);
        loop.post([&] { order.push_back(3); });
    });
    loop.post([&] { order.push_back(2); });

    EXPECT_EQ(3u, loop.runReady());
    EXPECT_EQ(std::vector<int>({1, 2, 3}), order);
}

TEST(EventLoopTest, TimerFiresAfterDelay) {
    ManualClock clock;
    EventLoop loop(clock.function());
    int fired = 0;
    loop.postDelayed("timer", milliseconds(100), [&] { fired++; });

    EXPECT_TRUE(loop.hasPending("timer"));
    loop.runReady();
    EXPECT_EQ(0, fired);

    clock.advance(milliseconds(99));
    loop.runReady();
    EXPECT_EQ(0, fired);

    clock.advance(milliseconds(1));
    loop.runReady();
    EXPECT_EQ(1, fired);
    EXPECT_FALSE(loop.hasPending("timer"));

    clock.advance(milliseconds(1000));
    loop.runReady();
    EXPECT_EQ(1, fired);
}

TEST(EventLoopTest, CancelledTimerNeverFires) {
    ManualClock clock;
    EventLoop loop(clock.function());
    int fired = 0;
    loop.postDelayed("timer", milliseconds(10), [&] { fired++; });
    loop.cancel("timer");
    loop.cancel("unknown");

    clock.advance(milliseconds(10));
    loop.runReady();
    EXPECT_EQ(0, fired);
}

TEST(EventLoopTest, SameTokenReplacesTimer) {
    ManualClock clock;
    EventLoop loop(clock.function());
    std::string fired;
    loop.postDelayed("timer", milliseconds(10), [&] { fired += "a"; });
    loop.postDelayed("timer", milliseconds(20), [&] { fired += "b"; });

    clock.advance(milliseconds(10));
    loop.runReady();
    EXPECT_EQ("", fired);

    clock.advance(milliseconds(10));
    loop.runReady();
    EXPECT_EQ("b", fired);
}

TEST(EventLoopTest, ExpiredTimersRunByDeadlineAfterQueuedTasks) {
    ManualClock clock;
    EventLoop loop(clock.function());
    std::string order;
    loop.postDelayed("late", milliseconds(20), [&] { order += "L"; });
    loop.postDelayed("early", milliseconds(10), [&] { order += "E"; });
    loop.post([&] { order += "T"; });

    clock.advance(milliseconds(30));
    EXPECT_EQ(3u, loop.runReady());
    EXPECT_EQ("TEL", order);
}

TEST(EventLoopTest, FailingTaskDoesNotStopLoop) {
    EventLoop loop;
    bool ran = false;
    loop.post([] { throw std::runtime_error("boom"); });
    loop.post([&] { ran = true; });

    EXPECT_EQ(2u, loop.runReady());
    EXPECT_TRUE(ran);
}

TEST(EventLoopTest, WorkerThreadRunsTasks) {
    EventLoop loop;
    loop.start();
    EXPECT_TRUE(loop.isRunning());

    std::promise<std::thread::id> ran;
    std::future<std::thread::id> result = ran.get_future();
    loop.post([&] { ran.set_value(std::this_thread::get_id()); });

    ASSERT_EQ(std::future_status::ready, result.wait_for(std::chrono::seconds(5)));
    EXPECT_NE(std::this_thread::get_id(), result.get());

    loop.stop();
    EXPECT_FALSE(loop.isRunning());
}

TEST(EventLoopTest, WorkerThreadRunsTimers) {
    EventLoop loop;
    loop.start();

    std::promise<void> fired;
    std::future<void> result = fired.get_future();
    loop.postDelayed("timer", milliseconds(20), [&] { fired.set_value(); });

    EXPECT_EQ(std::future_status::ready, result.wait_for(std::chrono::seconds(5)));
    loop.stop();
}
