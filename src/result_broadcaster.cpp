#include "result_broadcaster.hpp"

#include <iostream>

namespace livedet {

nlohmann::json detections_to_json(const std::vector<BoundingBox>& boxes) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& b : boxes) {
        arr.push_back({{"x", b.x}, {"y", b.y}, {"w", b.w}, {"h", b.h},
                       {"cls", b.cls}, {"conf", b.confidence}});
    }
    return arr;
}

std::string serialize_detection(const DetectionResult& result) {
    nlohmann::json msg = {
        {"type", "detection"},
        {"frameIndex", result.frame_index},
        {"w", result.width},
        {"h", result.height},
        {"detections", detections_to_json(result.boxes)},
    };
    return msg.dump();
}

void ResultBroadcaster::attach(const std::string& connection_id, std::shared_ptr<BackChannel> channel) {
    std::lock_guard<std::mutex> lock(mu_);
    Route route;
    route.channel = std::move(channel);
    routes_[connection_id] = std::move(route);
}

void ResultBroadcaster::detach(const std::string& connection_id) {
    std::lock_guard<std::mutex> lock(mu_);
    routes_.erase(connection_id);
}

bool ResultBroadcaster::publish(const std::string& connection_id, const DetectionResult& result) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = routes_.find(connection_id);
    if (it == routes_.end() || !it->second.channel) {
        ++dropped_;
        return false;
    }
    Route& route = it->second;
    if (route.has_sent && result.frame_index < route.last_index) {
        ++dropped_;
        return false;
    }
    if (!route.channel->is_open()) {
        ++dropped_;
        return false;
    }
    if (!route.channel->send(serialize_detection(result))) {
        std::cerr << "[WARN] Back-channel send failed for connection " << connection_id
                  << " frame " << result.frame_index << std::endl;
        ++dropped_;
        return false;
    }
    route.has_sent = true;
    route.last_index = result.frame_index;
    ++sent_;
    return true;
}

bool ResultBroadcaster::attached(const std::string& connection_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    return routes_.count(connection_id) != 0;
}

uint64_t ResultBroadcaster::sent() const {
    std::lock_guard<std::mutex> lock(mu_);
    return sent_;
}

uint64_t ResultBroadcaster::dropped() const {
    std::lock_guard<std::mutex> lock(mu_);
    return dropped_;
}

}  // namespace livedet
