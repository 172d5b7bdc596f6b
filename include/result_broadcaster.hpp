#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "frame_types.hpp"
#include "peer_transport.hpp"

namespace livedet {

// Back-channel wire format: {"type":"detection","frameIndex",..,"w","h","detections":[..]}
nlohmann::json detections_to_json(const std::vector<BoundingBox>& boxes);
std::string serialize_detection(const DetectionResult& result);

// Best-effort delivery of results to each connection's back-channel. Nothing
// is buffered: a result that cannot be sent right now is dropped.
class ResultBroadcaster {
public:
    void attach(const std::string& connection_id, std::shared_ptr<BackChannel> channel);
    // Forget the connection. Results published afterwards are dropped.
    void detach(const std::string& connection_id);

    // True when the result went out on the channel. Drops (returns false) when
    // the connection is unknown, the channel is not open, or the result's
    // frame index is lower than the last one sent on this connection.
    bool publish(const std::string& connection_id, const DetectionResult& result);

    bool attached(const std::string& connection_id) const;
    uint64_t sent() const;
    uint64_t dropped() const;

private:
    struct Route {
        std::shared_ptr<BackChannel> channel;
        bool has_sent{false};
        uint64_t last_index{0};
    };

    mutable std::mutex mu_;
    std::unordered_map<std::string, Route> routes_;
    uint64_t sent_{0};
    uint64_t dropped_{0};
};

}  // namespace livedet
