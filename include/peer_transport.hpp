#pragma once

#include <functional>
#include <memory>
#include <string>

#include "frame_types.hpp"

namespace livedet {

struct SessionDescription {
    std::string sdp;
    std::string type;   // "offer" or "answer"
};

// Low-level link events reported by a transport. Each maps to one
// ConnectionEvent.
enum class TransportEvent { Connected, Disconnected, Failed, Closed };

const char* transport_event_to_string(TransportEvent ev);

// Server-to-client message channel carried on the peer session.
class BackChannel {
public:
    virtual ~BackChannel() = default;

    virtual bool is_open() const = 0;
    // Returns false when the message could not be handed to the channel.
    virtual bool send(const std::string& text) = 0;
    virtual void close() = 0;
};

struct TransportHandlers {
    std::function<void(TransportEvent)> on_event;
    std::function<void(Frame)> on_frame;
};

// One peer session: negotiation, media intake and the back-channel.
class PeerTransport {
public:
    virtual ~PeerTransport() = default;

    // Must be called before negotiate(). Handlers may run on any thread.
    virtual void set_handlers(TransportHandlers handlers) = 0;

    // Applies the remote offer and blocks until the local answer is
    // complete. Throws InvalidOfferError when the offer is rejected and
    // TransportError on any other failure.
    virtual SessionDescription negotiate(const SessionDescription& offer) = 0;

    virtual std::shared_ptr<BackChannel> back_channel() const = 0;

    // Idempotent. No handler is invoked once close() has returned.
    virtual void close() = 0;
};

using TransportFactory = std::function<std::unique_ptr<PeerTransport>()>;

}  // namespace livedet
