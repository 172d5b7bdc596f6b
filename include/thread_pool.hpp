#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace livedet {

// Fixed-size worker pool with a FIFO task queue.
class ThreadPool {
public:
    using Task = std::function<void()>;

    explicit ThreadPool(std::size_t n) {
        if (n == 0) n = 1;
        size_ = n;
        workers_.reserve(n);
        for (std::size_t i = 0; i < n; ++i) {
            workers_.emplace_back([this] {
                for (;;) {
                    Task task;
                    {
                        std::unique_lock<std::mutex> lk(m_);
                        cv_.wait(lk, [this] { return stop_ || !q_.empty(); });
                        if (stop_ && q_.empty()) return;
                        task = std::move(q_.front());
                        q_.pop();
                    }
                    task();
                }
            });
        }
    }

    ~ThreadPool() { shutdown(); }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void post(Task task) {
        {
            std::lock_guard<std::mutex> lk(m_);
            if (stop_) throw std::runtime_error("ThreadPool stopped");
            q_.push(std::move(task));
        }
        cv_.notify_one();
    }

    // Runs whatever is already queued, then joins the workers.
    void shutdown() {
        {
            std::lock_guard<std::mutex> lk(m_);
            if (stop_ && workers_.empty()) return;
            stop_ = true;
        }
        cv_.notify_all();
        for (auto& t : workers_) {
            if (t.joinable()) t.join();
        }
        workers_.clear();
    }

    std::size_t size() const { return size_; }

private:
    std::vector<std::thread> workers_;
    std::queue<Task> q_;
    std::mutex m_;
    std::condition_variable cv_;
    bool stop_{false};
    std::size_t size_{0};
};

}  // namespace livedet
