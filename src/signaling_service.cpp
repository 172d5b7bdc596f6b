#include "signaling_service.hpp"

#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>

#include <nlohmann/json.hpp>

#include "errors.hpp"

namespace livedet {

SessionDescription parse_offer(const std::string& body) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw InvalidOfferError(std::string("offer is not valid JSON: ") + e.what());
    }
    if (!j.is_object()) throw InvalidOfferError("offer must be a JSON object");

    auto sdp = j.find("sdp");
    auto type = j.find("type");
    if (sdp == j.end() || !sdp->is_string()) throw InvalidOfferError("offer is missing string field 'sdp'");
    if (type == j.end() || !type->is_string()) throw InvalidOfferError("offer is missing string field 'type'");
    return SessionDescription{sdp->get<std::string>(), type->get<std::string>()};
}

SignalingService::SignalingService(EventLoop& loop,
                                   InferenceScheduler& scheduler,
                                   ResultBroadcaster& broadcaster,
                                   ModelRegistry& registry,
                                   TransportFactory make_transport,
                                   const SignalingOptions& opts)
    : loop_(loop),
      scheduler_(scheduler),
      broadcaster_(broadcaster),
      registry_(registry),
      make_transport_(std::move(make_transport)),
      opts_(opts) {}

SignalingService::~SignalingService() {
    close_all();
}

void SignalingService::validate(const SessionDescription& offer) {
    if (offer.type != "offer") {
        throw InvalidOfferError("expected type 'offer', got '" + offer.type + "'");
    }
    const auto start = offer.sdp.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) throw InvalidOfferError("empty sdp");
    if (offer.sdp.compare(start, 2, "v=") != 0) {
        throw InvalidOfferError("sdp must start with a version line (v=)");
    }
}

std::string SignalingService::next_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream oss;
    oss << "pc-" << std::hex << std::setw(8) << std::setfill('0') << (rng() & 0xffffffffULL)
        << '-' << std::dec << ++id_counter_;
    return oss.str();
}

OfferOutcome SignalingService::handle_offer(const SessionDescription& offer) {
    validate(offer);

    ConnectionOptions copts;
    copts.sample_interval = opts_.sample_interval;
    copts.grace_period = opts_.grace_period;

    OfferOutcome outcome;
    outcome.connection_id = next_id();
    // Still loading is not degraded: inference waits for the load.
    outcome.degraded = registry_.degraded();

    auto conn = std::make_shared<Connection>(outcome.connection_id, make_transport_(), loop_, scheduler_,
                                             broadcaster_, copts,
                                             [this](const std::string& id) { remove(id); });
    conn->attach();
    {
        std::lock_guard<std::mutex> lock(mu_);
        active_[conn->id()] = conn;
    }
    std::cout << "[INFO] Created connection " << conn->id()
              << (outcome.degraded ? " (degraded: no model)" : "") << std::endl;

    outcome.answer = conn->negotiate(offer);
    return outcome;
}

void SignalingService::remove(const std::string& id) {
    std::shared_ptr<Connection> doomed;
    {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = active_.find(id);
        if (it == active_.end()) return;
        doomed = std::move(it->second);
        active_.erase(it);
    }
    std::cout << "[INFO] Removed connection " << id << " (" << active_count() << " active)" << std::endl;
}

std::shared_ptr<Connection> SignalingService::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = active_.find(id);
    return it == active_.end() ? nullptr : it->second;
}

std::vector<ConnectionInfo> SignalingService::connections() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<ConnectionInfo> out;
    out.reserve(active_.size());
    for (const auto& kv : active_) {
        out.push_back(ConnectionInfo{kv.first, kv.second->state(), registry_.degraded()});
    }
    return out;
}

std::size_t SignalingService::active_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return active_.size();
}

void SignalingService::close_all() {
    std::vector<std::shared_ptr<Connection>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mu_);
        for (const auto& kv : active_) snapshot.push_back(kv.second);
    }
    for (auto& conn : snapshot) conn->stop();
    std::lock_guard<std::mutex> lock(mu_);
    active_.clear();
}

}  // namespace livedet
