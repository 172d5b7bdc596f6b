#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <vector>

#include "event_loop.hpp"
#include "fakes.hpp"

using livedet::EventLoop;
using livedet::testing::wait_until;
using namespace std::chrono_literals;

TEST(EventLoop, RunsTasksInPostOrder) {
    EventLoop loop;
    loop.start();
    std::mutex mu;
    std::vector<int> order;
    for (int i = 0; i < 5; ++i) {
        loop.post([&, i] {
            std::lock_guard<std::mutex> lock(mu);
            order.push_back(i);
        });
    }
    loop.call([] {});
    std::lock_guard<std::mutex> lock(mu);
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST(EventLoop, CallReturnsValueAndRunsOnLoopThread) {
    EventLoop loop;
    loop.start();
    EXPECT_FALSE(loop.in_loop_thread());
    bool on_loop = loop.call([&] { return loop.in_loop_thread(); });
    EXPECT_TRUE(on_loop);
    EXPECT_EQ(loop.call([] { return 41 + 1; }), 42);
}

TEST(EventLoop, CallIsReentrantFromTheLoop) {
    EventLoop loop;
    loop.start();
    int v = loop.call([&] { return loop.call([] { return 7; }); });
    EXPECT_EQ(v, 7);
}

TEST(EventLoop, TimerFiresAfterDelay) {
    EventLoop loop;
    loop.start();
    std::atomic<bool> fired{false};
    const auto t0 = std::chrono::steady_clock::now();
    std::atomic<long long> elapsed_ms{0};
    loop.post_after(30ms, [&] {
        elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::steady_clock::now() - t0).count();
        fired = true;
    });
    ASSERT_TRUE(wait_until([&] { return fired.load(); }));
    EXPECT_GE(elapsed_ms.load(), 30);
}

TEST(EventLoop, CancelledTimerNeverFires) {
    EventLoop loop;
    loop.start();
    std::atomic<bool> fired{false};
    auto id = loop.post_after(20ms, [&] { fired = true; });
    ASSERT_NE(id, 0u);
    loop.cancel(id);
    std::this_thread::sleep_for(60ms);
    EXPECT_FALSE(fired.load());
}

TEST(EventLoop, ThrowingTaskDoesNotStopTheLoop) {
    EventLoop loop;
    loop.start();
    loop.post([] { throw std::runtime_error("boom"); });
    EXPECT_EQ(loop.call([] { return 1; }), 1);
    EXPECT_TRUE(loop.running());
}

TEST(EventLoop, PostAfterStopIsRejected) {
    EventLoop loop;
    loop.start();
    loop.stop();
    EXPECT_FALSE(loop.post([] {}));
    EXPECT_EQ(loop.post_after(1ms, [] {}), 0u);
    EXPECT_THROW(loop.call([] { return 0; }), std::runtime_error);
}
