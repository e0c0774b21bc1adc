#include <gtest/gtest.h>
#include <string>
#include <thread>
#include "event_loop.hpp"

using std::chrono::milliseconds;

TEST(EventLoopTest, RunsInDueOrderThenScheduleOrder) {
    EventLoop loop(true);
    std::string order;
    loop.call_after(milliseconds(20), [&]() { order += "c"; });
    loop.call_after(milliseconds(10), [&]() { order += "a"; });
    loop.call_after(milliseconds(10), [&]() { order += "b"; });
    loop.post([&]() { order += "0"; });
    loop.advance(milliseconds(15));
    EXPECT_EQ(order, "0ab");
    loop.advance(milliseconds(5));
    EXPECT_EQ(order, "0abc");
    EXPECT_EQ(loop.size(), 0u);
}

TEST(EventLoopTest, VirtualClockMovesOnlyThroughAdvance) {
    EventLoop loop(true);
    auto start = loop.now();
    EventLoop::Clock::time_point seen{};
    loop.call_after(milliseconds(40), [&]() { seen = loop.now(); });
    EXPECT_EQ(loop.now(), start);
    loop.advance(milliseconds(100));
    EXPECT_EQ(seen - start, milliseconds(40));
    EXPECT_EQ(loop.now() - start, milliseconds(100));
}

TEST(EventLoopTest, PeriodicTasksRepeatUntilCancelled) {
    EventLoop loop(true);
    int ticks = 0;
    auto id = loop.call_every(milliseconds(100), [&]() { ++ticks; });
    loop.advance(milliseconds(350));
    EXPECT_EQ(ticks, 3);
    EXPECT_TRUE(loop.pending(id));
    loop.cancel(id);
    EXPECT_FALSE(loop.pending(id));
    loop.advance(milliseconds(1000));
    EXPECT_EQ(ticks, 3);
}

TEST(EventLoopTest, PeriodicTaskCanCancelItself) {
    EventLoop loop(true);
    int ticks = 0;
    EventLoop::TimerId id = 0;
    id = loop.call_every(milliseconds(10), [&]() {
        if (++ticks == 2) loop.cancel(id);
    });
    loop.advance(milliseconds(100));
    EXPECT_EQ(ticks, 2);
    EXPECT_EQ(loop.size(), 0u);
}

TEST(EventLoopTest, TasksScheduledWhileRunningRunInTheSameAdvance) {
    EventLoop loop(true);
    std::string order;
    loop.call_after(milliseconds(10), [&]() {
        order += "a";
        loop.post([&]() { order += "b"; });
        loop.call_after(milliseconds(50), [&]() { order += "late"; });
    });
    loop.advance(milliseconds(20));
    EXPECT_EQ(order, "ab");
}

TEST(EventLoopTest, CancelledOneShotNeverRuns) {
    EventLoop loop(true);
    bool ran = false;
    auto id = loop.call_after(milliseconds(5), [&]() { ran = true; });
    loop.cancel(id);
    loop.cancel(id);
    loop.advance(milliseconds(10));
    EXPECT_FALSE(ran);
}

TEST(EventLoopTest, RunStopsWhenAsked) {
    EventLoop loop(true);
    int ticks = 0;
    loop.call_every(milliseconds(16), [&]() { ++ticks; });
    loop.call_after(milliseconds(100), [&]() { loop.stop(); });
    loop.run();
    EXPECT_EQ(ticks, 6);
}

TEST(EventLoopTest, ExternalPostWakesTheLoopEarly) {
    EventLoop loop;
    bool ran = false;
    bool fallback = false;
    loop.call_after(milliseconds(5000), [&]() {
        fallback = true;
        loop.stop();
    });
    auto started = EventLoop::Clock::now();
    std::thread worker([&]() {
        std::this_thread::sleep_for(milliseconds(20));
        loop.post_external([&]() {
            ran = true;
            loop.stop();
        });
    });
    loop.run();
    worker.join();
    EXPECT_TRUE(ran);
    EXPECT_FALSE(fallback);
    EXPECT_LT(EventLoop::Clock::now() - started, milliseconds(2000));
}

TEST(EventLoopTest, ExternalPostRunsOnNextVirtualAdvance) {
    EventLoop loop(true);
    int runs = 0;
    std::thread worker([&]() { loop.post_external([&]() { ++runs; }); });
    worker.join();
    EXPECT_EQ(runs, 0);
    loop.advance(milliseconds(0));
    EXPECT_EQ(runs, 1);
}
