#include "connection.hpp"

#include <iostream>

#include "errors.hpp"
#include "inference_scheduler.hpp"
#include "result_broadcaster.hpp"

namespace livedet {

const char* connection_state_to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::New: return "NEW";
        case ConnectionState::Negotiating: return "NEGOTIATING";
        case ConnectionState::Connected: return "CONNECTED";
        case ConnectionState::Disconnected: return "DISCONNECTED";
        case ConnectionState::Failed: return "FAILED";
        case ConnectionState::Closed: return "CLOSED";
    }
    return "UNKNOWN";
}

const char* connection_event_to_string(ConnectionEvent ev) {
    switch (ev) {
        case ConnectionEvent::OfferAccepted: return "offer-accepted";
        case ConnectionEvent::TransportConnected: return "transport-connected";
        case ConnectionEvent::TransportDisconnected: return "transport-disconnected";
        case ConnectionEvent::TransportFailed: return "transport-failed";
        case ConnectionEvent::TransportClosed: return "transport-closed";
        case ConnectionEvent::GraceExpired: return "grace-expired";
        case ConnectionEvent::Stop: return "stop";
    }
    return "unknown";
}

const char* transport_event_to_string(TransportEvent ev) {
    switch (ev) {
        case TransportEvent::Connected: return "connected";
        case TransportEvent::Disconnected: return "disconnected";
        case TransportEvent::Failed: return "failed";
        case TransportEvent::Closed: return "closed";
    }
    return "unknown";
}

ConnectionEvent to_connection_event(TransportEvent ev) {
    switch (ev) {
        case TransportEvent::Connected: return ConnectionEvent::TransportConnected;
        case TransportEvent::Disconnected: return ConnectionEvent::TransportDisconnected;
        case TransportEvent::Failed: return ConnectionEvent::TransportFailed;
        case TransportEvent::Closed: return ConnectionEvent::TransportClosed;
    }
    return ConnectionEvent::TransportFailed;
}

ConnectionState next_state(ConnectionState from, ConnectionEvent ev) {
    using S = ConnectionState;
    if (from == S::Closed) return S::Closed;

    switch (ev) {
        case ConnectionEvent::OfferAccepted:
            return from == S::New ? S::Negotiating : from;
        case ConnectionEvent::TransportConnected:
            // DISCONNECTED -> CONNECTED is the transport's own ICE recovery.
            return (from == S::Negotiating || from == S::Disconnected) ? S::Connected : from;
        case ConnectionEvent::TransportDisconnected:
            return from == S::Connected ? S::Disconnected : from;
        case ConnectionEvent::TransportFailed:
            return S::Failed;
        case ConnectionEvent::TransportClosed:
        case ConnectionEvent::Stop:
            return S::Closed;
        case ConnectionEvent::GraceExpired:
            return (from == S::Disconnected || from == S::Failed) ? S::Closed : from;
    }
    return from;
}

Connection::Connection(std::string id,
                       std::unique_ptr<PeerTransport> transport,
                       EventLoop& loop,
                       InferenceScheduler& scheduler,
                       ResultBroadcaster& broadcaster,
                       const ConnectionOptions& opts,
                       ClosedHandler on_closed)
    : id_(std::move(id)),
      transport_(std::move(transport)),
      loop_(loop),
      scheduler_(scheduler),
      broadcaster_(broadcaster),
      on_closed_(std::move(on_closed)),
      sampler_(opts.sample_interval),
      grace_period_(opts.grace_period) {}

Connection::~Connection() {
    // Only reached without release() when the owner dropped us mid-session.
    if (!released_.exchange(true)) {
        scheduler_.cancel(id_);
        broadcaster_.detach(id_);
        if (channel_) channel_->close();
        if (transport_) transport_->close();
    }
}

void Connection::attach() {
    channel_ = transport_->back_channel();
    broadcaster_.attach(id_, channel_);

    std::weak_ptr<Connection> weak = weak_from_this();
    EventLoop* loop = &loop_;
    TransportHandlers handlers;
    handlers.on_event = [weak, loop](TransportEvent ev) {
        loop->post([weak, ev] {
            if (auto self = weak.lock()) self->handle(to_connection_event(ev));
        });
    };
    handlers.on_frame = [weak, loop](Frame frame) {
        loop->post([weak, frame = std::move(frame)] {
            if (auto self = weak.lock()) self->on_frame(frame);
        });
    };
    transport_->set_handlers(std::move(handlers));
}

std::optional<SessionDescription> Connection::negotiate(const SessionDescription& offer) {
    loop_.call([this] { handle(ConnectionEvent::OfferAccepted); });
    if (state() != ConnectionState::Negotiating) return std::nullopt;

    try {
        return transport_->negotiate(offer);
    } catch (const InvalidOfferError& e) {
        std::cerr << "[WARN] Connection " << id_ << ": offer rejected by transport: " << e.what() << std::endl;
        stop();
        throw;
    } catch (const TransportError& e) {
        std::cerr << "[WARN] Connection " << id_ << ": negotiation failed: " << e.what() << std::endl;
        loop_.call([this] { handle(ConnectionEvent::TransportFailed); });
        return std::nullopt;
    }
}

void Connection::post(ConnectionEvent ev) {
    std::weak_ptr<Connection> weak = weak_from_this();
    loop_.post([weak, ev] {
        if (auto self = weak.lock()) self->handle(ev);
    });
}

void Connection::stop() {
    if (loop_.running()) {
        try {
            loop_.call([this] { handle(ConnectionEvent::Stop); });
            return;
        } catch (const std::exception& e) {
            // The loop went away between the check and the call.
            std::cerr << "[WARN] Connection " << id_ << ": stopping off-loop (" << e.what() << ")" << std::endl;
        }
    }
    handle(ConnectionEvent::Stop);
}

void Connection::handle(ConnectionEvent ev) {
    // on_closed_ may drop the owner's reference while we are still inside.
    auto keep_alive = weak_from_this().lock();

    const ConnectionState from = state_.load();
    const ConnectionState to = next_state(from, ev);
    if (to == from) return;

    std::cout << "[INFO] Connection " << id_ << ": " << connection_state_to_string(from)
              << " -> " << connection_state_to_string(to)
              << " (" << connection_event_to_string(ev) << ")" << std::endl;
    enter(to);
}

void Connection::enter(ConnectionState next) {
    state_.store(next);
    switch (next) {
        case ConnectionState::Connected:
            disarm_grace_timer();
            break;
        case ConnectionState::Disconnected:
        case ConnectionState::Failed:
            arm_grace_timer();
            break;
        case ConnectionState::Closed:
            release();
            break;
        default:
            break;
    }
}

void Connection::arm_grace_timer() {
    if (grace_timer_ != 0) return;
    std::weak_ptr<Connection> weak = weak_from_this();
    grace_timer_ = loop_.post_after(grace_period_, [weak] {
        if (auto self = weak.lock()) {
            self->grace_timer_ = 0;
            self->handle(ConnectionEvent::GraceExpired);
        }
    });
}

void Connection::disarm_grace_timer() {
    if (grace_timer_ == 0) return;
    loop_.cancel(grace_timer_);
    grace_timer_ = 0;
}

void Connection::release() {
    if (released_.exchange(true)) return;

    disarm_grace_timer();
    scheduler_.cancel(id_);
    broadcaster_.detach(id_);
    if (channel_) {
        channel_->close();
        channel_.reset();
    }
    transport_->close();

    std::cout << "[INFO] Connection " << id_ << " released (" << frames_received_.load()
              << " frames received, " << frames_submitted_.load() << " submitted)" << std::endl;
    if (on_closed_) on_closed_(id_);
}

void Connection::on_frame(const Frame& frame) {
    ++frames_received_;
    const ConnectionState st = state_.load();
    if (st != ConnectionState::Negotiating && st != ConnectionState::Connected) return;

    const uint64_t index = sampler_.frames_seen();
    if (!sampler_.offer(frame)) return;
    if (scheduler_.submit(id_, index, frame)) ++frames_submitted_;
}

}  // namespace livedet
