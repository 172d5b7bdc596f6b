#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>

namespace livedet {

// Single-threaded task and timer queue. Every connection transition, frame
// intake and result publication runs here, so connection state needs no
// locking of its own.
class EventLoop {
public:
    using Task = std::function<void()>;
    using TimerId = uint64_t;
    using Duration = std::chrono::milliseconds;

    EventLoop() = default;
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void start();
    // Pending tasks and timers are discarded.
    void stop();
    bool running() const { return running_.load(); }

    // False once the loop is stopped; the task is dropped.
    bool post(Task task);
    // Returns 0 when the loop is stopped.
    TimerId post_after(Duration delay, Task task);
    void cancel(TimerId id);

    bool in_loop_thread() const;

    // Runs fn on the loop and waits for its result. Runs inline when called
    // from the loop thread. Throws std::runtime_error if the loop is stopped.
    template <typename F>
    auto call(F&& fn) -> std::invoke_result_t<F> {
        using R = std::invoke_result_t<F>;
        if (in_loop_thread()) return fn();
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        auto fut = task->get_future();
        if (!post([task] { (*task)(); })) {
            throw std::runtime_error("event loop stopped");
        }
        return fut.get();
    }

private:
    struct Timer {
        std::chrono::steady_clock::time_point due;
        Task task;
    };

    void run();

    std::atomic<bool> running_{false};
    std::thread thread_;
    std::thread::id loop_id_;

    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    std::map<TimerId, Timer> timers_;
    TimerId next_timer_{1};
};

}  // namespace livedet
