#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "connection.hpp"
#include "event_loop.hpp"
#include "inference_scheduler.hpp"
#include "model_registry.hpp"
#include "peer_transport.hpp"
#include "result_broadcaster.hpp"

namespace livedet {

// Parses {"sdp": "...", "type": "offer"}. Throws InvalidOfferError.
SessionDescription parse_offer(const std::string& body);

struct SignalingOptions {
    int sample_interval{5};
    std::chrono::milliseconds grace_period{5000};
};

struct OfferOutcome {
    std::string connection_id;
    std::optional<SessionDescription> answer;   // empty when negotiation failed
    bool degraded{false};   // the model could not be loaded
};

struct ConnectionInfo {
    std::string id;
    ConnectionState state{ConnectionState::New};
    bool degraded{false};   // live: follows the model registry
};

// Creates one Connection per accepted offer and keeps the set of active
// connections. Connections remove themselves when they reach CLOSED.
class SignalingService {
public:
    SignalingService(EventLoop& loop,
                     InferenceScheduler& scheduler,
                     ResultBroadcaster& broadcaster,
                     ModelRegistry& registry,
                     TransportFactory make_transport,
                     const SignalingOptions& opts);
    ~SignalingService();

    SignalingService(const SignalingService&) = delete;
    SignalingService& operator=(const SignalingService&) = delete;

    // Validates the offer, creates the connection and negotiates the answer.
    // Throws InvalidOfferError. Never fails because the model is missing;
    // the connection is flagged degraded instead.
    OfferOutcome handle_offer(const SessionDescription& offer);

    ModelStatus health() const { return registry_.status(); }

    std::shared_ptr<Connection> find(const std::string& id) const;
    std::vector<ConnectionInfo> connections() const;
    std::size_t active_count() const;

    // Explicit stop of every active connection.
    void close_all();

private:
    static void validate(const SessionDescription& offer);
    std::string next_id();
    void remove(const std::string& id);

    EventLoop& loop_;
    InferenceScheduler& scheduler_;
    ResultBroadcaster& broadcaster_;
    ModelRegistry& registry_;
    TransportFactory make_transport_;
    SignalingOptions opts_;

    mutable std::mutex mu_;
    std::unordered_map<std::string, std::shared_ptr<Connection>> active_;
    std::atomic<uint64_t> id_counter_{0};
};

}  // namespace livedet
