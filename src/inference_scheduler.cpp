#include "inference_scheduler.hpp"

#include <iostream>

#include "errors.hpp"

namespace livedet {

InferenceScheduler::InferenceScheduler(ModelRegistry& registry, std::size_t workers, ResultHandler on_result)
    : registry_(registry), on_result_(std::move(on_result)), pool_(workers) {}

InferenceScheduler::~InferenceScheduler() {
    shutdown();
}

bool InferenceScheduler::submit(const std::string& connection_id, uint64_t frame_index, const Frame& frame) {
    auto token = std::make_shared<std::atomic<bool>>(false);
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (stopped_) return false;
        if (in_flight_.count(connection_id)) {
            ++dropped_;
            return false;
        }
        in_flight_[connection_id] = token;
    }

    try {
        pool_.post([this, connection_id, token, frame_index, frame]() mutable {
            run(connection_id, token, frame_index, std::move(frame));
        });
    } catch (const std::runtime_error& e) {
        std::cerr << "[WARN] Inference pool rejected frame " << frame_index
                  << " for connection " << connection_id << ": " << e.what() << std::endl;
        std::lock_guard<std::mutex> lock(mu_);
        in_flight_.erase(connection_id);
        return false;
    }
    return true;
}

void InferenceScheduler::run(const std::string& connection_id, const CancelToken& token,
                             uint64_t frame_index, Frame frame) {
    DetectionResult result;
    result.frame_index = frame_index;
    result.width = frame.width;
    result.height = frame.height;

    if (!token->load()) {
        try {
            if (!materialize(frame)) throw InferenceError("frame has no image");
            result.boxes = registry_.infer(frame.image);
        } catch (const std::exception& e) {
            ++failures_;
            result.boxes.clear();
            std::cerr << "[WARN] Inference failed for connection " << connection_id
                      << " frame " << frame_index << ": " << e.what() << std::endl;
        }
    }

    bool deliver = false;
    {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = in_flight_.find(connection_id);
        if (it != in_flight_.end() && it->second == token) {
            in_flight_.erase(it);
        }
        deliver = !token->load();
    }
    if (deliver && on_result_) {
        on_result_(connection_id, std::move(result));
    }
}

void InferenceScheduler::cancel(const std::string& connection_id) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = in_flight_.find(connection_id);
    if (it == in_flight_.end()) return;
    it->second->store(true);
    in_flight_.erase(it);
}

bool InferenceScheduler::in_flight(const std::string& connection_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    return in_flight_.count(connection_id) != 0;
}

std::size_t InferenceScheduler::in_flight_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return in_flight_.size();
}

void InferenceScheduler::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        stopped_ = true;
        for (auto& kv : in_flight_) kv.second->store(true);
        in_flight_.clear();
    }
    pool_.shutdown();
}

}  // namespace livedet
