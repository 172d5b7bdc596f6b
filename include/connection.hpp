#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "event_loop.hpp"
#include "frame_sampler.hpp"
#include "frame_types.hpp"
#include "peer_transport.hpp"

namespace livedet {

class InferenceScheduler;
class ResultBroadcaster;

enum class ConnectionState { New, Negotiating, Connected, Disconnected, Failed, Closed };

enum class ConnectionEvent {
    OfferAccepted,
    TransportConnected,
    TransportDisconnected,
    TransportFailed,
    TransportClosed,
    GraceExpired,
    Stop,
};

const char* connection_state_to_string(ConnectionState state);
const char* connection_event_to_string(ConnectionEvent ev);

// The whole transition table. Returns `from` unchanged for events that do
// not apply in that state.
ConnectionState next_state(ConnectionState from, ConnectionEvent ev);

ConnectionEvent to_connection_event(TransportEvent ev);

struct ConnectionOptions {
    int sample_interval{5};
    std::chrono::milliseconds grace_period{5000};
};

// One peer session. Owns the transport (media intake + back-channel) and
// the per-connection sampling counter. All state lives on the event loop:
// handle() and frame intake must run there, everything arriving from other
// threads is posted.
class Connection : public std::enable_shared_from_this<Connection> {
public:
    using ClosedHandler = std::function<void(const std::string& id)>;

    Connection(std::string id,
               std::unique_ptr<PeerTransport> transport,
               EventLoop& loop,
               InferenceScheduler& scheduler,
               ResultBroadcaster& broadcaster,
               const ConnectionOptions& opts,
               ClosedHandler on_closed);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Wires transport callbacks to the loop and registers the back-channel.
    // Call once, right after construction.
    void attach();

    // Called from the signaling thread. Moves NEW -> NEGOTIATING, then runs
    // the transport negotiation off the loop. Returns the answer, or nullopt
    // when negotiation failed (the connection is then FAILED). Rethrows
    // InvalidOfferError after closing the connection.
    std::optional<SessionDescription> negotiate(const SessionDescription& offer);

    // Single transition entry point. Loop thread only.
    void handle(ConnectionEvent ev);

    // Thread-safe: posts the event to the loop.
    void post(ConnectionEvent ev);

    // Explicit stop from any thread; blocks until CLOSED when the loop runs.
    void stop();

    // Media intake. Loop thread only.
    void on_frame(const Frame& frame);

    const std::string& id() const { return id_; }
    ConnectionState state() const { return state_.load(); }
    bool released() const { return released_.load(); }
    uint64_t frames_received() const { return frames_received_.load(); }
    uint64_t frames_submitted() const { return frames_submitted_.load(); }

private:
    void enter(ConnectionState next);
    void arm_grace_timer();
    void disarm_grace_timer();
    void release();

    const std::string id_;
    std::unique_ptr<PeerTransport> transport_;
    std::shared_ptr<BackChannel> channel_;
    EventLoop& loop_;
    InferenceScheduler& scheduler_;
    ResultBroadcaster& broadcaster_;
    ClosedHandler on_closed_;

    FrameSampler sampler_;
    const std::chrono::milliseconds grace_period_;

    std::atomic<ConnectionState> state_{ConnectionState::New};
    std::atomic<bool> released_{false};
    EventLoop::TimerId grace_timer_{0};

    std::atomic<uint64_t> frames_received_{0};
    std::atomic<uint64_t> frames_submitted_{0};
};

}  // namespace livedet
