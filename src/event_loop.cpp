#include "event_loop.hpp"

#include <iostream>

namespace livedet {

EventLoop::~EventLoop() {
    stop();
}

void EventLoop::start() {
    std::lock_guard<std::mutex> lock(mu_);
    if (running_) return;
    running_ = true;
    thread_ = std::thread(&EventLoop::run, this);
    loop_id_ = thread_.get_id();
}

void EventLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!running_) return;
        running_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        if (std::this_thread::get_id() == thread_.get_id()) {
            thread_.detach();
        } else {
            thread_.join();
        }
    }
    std::lock_guard<std::mutex> lock(mu_);
    tasks_.clear();
    timers_.clear();
}

bool EventLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!running_) return false;
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

EventLoop::TimerId EventLoop::post_after(Duration delay, Task task) {
    TimerId id = 0;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!running_) return 0;
        id = next_timer_++;
        timers_[id] = Timer{std::chrono::steady_clock::now() + delay, std::move(task)};
    }
    cv_.notify_one();
    return id;
}

void EventLoop::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mu_);
    timers_.erase(id);
}

bool EventLoop::in_loop_thread() const {
    std::lock_guard<std::mutex> lock(mu_);
    return running_ && std::this_thread::get_id() == loop_id_;
}

void EventLoop::run() {
    std::unique_lock<std::mutex> lock(mu_);
    while (running_) {
        const auto now = std::chrono::steady_clock::now();
        auto earliest = timers_.end();
        for (auto it = timers_.begin(); it != timers_.end(); ++it) {
            if (earliest == timers_.end() || it->second.due < earliest->second.due) earliest = it;
        }

        Task task;
        if (earliest != timers_.end() && earliest->second.due <= now) {
            task = std::move(earliest->second.task);
            timers_.erase(earliest);
        } else if (!tasks_.empty()) {
            task = std::move(tasks_.front());
            tasks_.pop_front();
        } else if (earliest != timers_.end()) {
            cv_.wait_until(lock, earliest->second.due);
            continue;
        } else {
            cv_.wait(lock);
            continue;
        }

        lock.unlock();
        try {
            task();
        } catch (const std::exception& e) {
            std::cerr << "[ERROR] Event loop task threw: " << e.what() << std::endl;
        }
        lock.lock();
    }
}

}  // namespace livedet
