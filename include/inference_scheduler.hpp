#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "frame_types.hpp"
#include "model_registry.hpp"
#include "thread_pool.hpp"

namespace livedet {

// Runs sampled frames through the model on a worker pool shared by all
// connections, with at most one inference in flight per connection.
class InferenceScheduler {
public:
    // Called on a worker thread once per accepted, non-cancelled submission.
    using ResultHandler = std::function<void(const std::string& connection_id, DetectionResult result)>;

    InferenceScheduler(ModelRegistry& registry, std::size_t workers, ResultHandler on_result);
    ~InferenceScheduler();

    InferenceScheduler(const InferenceScheduler&) = delete;
    InferenceScheduler& operator=(const InferenceScheduler&) = delete;

    // Never blocks. Deferred frames are converted on the worker. Returns false, and drops the frame, when this connection
    // already has an inference in flight or the scheduler is shut down.
    bool submit(const std::string& connection_id, uint64_t frame_index, const Frame& frame);

    // Cancels the connection's pending task. A task already inside the model
    // runs to completion but its result is not delivered.
    void cancel(const std::string& connection_id);

    bool in_flight(const std::string& connection_id) const;
    std::size_t in_flight_count() const;
    std::size_t workers() const { return pool_.size(); }
    uint64_t dropped() const { return dropped_.load(); }
    uint64_t failures() const { return failures_.load(); }

    void shutdown();

private:
    using CancelToken = std::shared_ptr<std::atomic<bool>>;

    void run(const std::string& connection_id, const CancelToken& token,
             uint64_t frame_index, Frame frame);

    ModelRegistry& registry_;
    ResultHandler on_result_;

    mutable std::mutex mu_;
    std::unordered_map<std::string, CancelToken> in_flight_;
    bool stopped_{false};

    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> failures_{0};

    ThreadPool pool_;   // last: joined before the members above go away
};

}  // namespace livedet
