#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <rtc/rtc.hpp>

#include "peer_transport.hpp"

namespace livedet {

struct RtcTransportOptions {
    std::vector<std::string> stun_servers;
    std::chrono::milliseconds negotiation_timeout{5000};
};

// Back-channel over a libdatachannel data channel. Sends on the server's own
// "detections" channel, or on a client-created one when ours is not open.
class RtcBackChannel : public BackChannel {
public:
    void bind(std::shared_ptr<rtc::DataChannel> dc);

    bool is_open() const override;
    bool send(const std::string& text) override;
    void close() override;

private:
    std::shared_ptr<rtc::DataChannel> active() const;

    mutable std::mutex mu_;
    std::vector<std::shared_ptr<rtc::DataChannel>> channels_;
    bool closed_{false};
};

class RtcPeerTransport : public PeerTransport {
public:
    explicit RtcPeerTransport(const RtcTransportOptions& opts);
    ~RtcPeerTransport() override;

    void set_handlers(TransportHandlers handlers) override;
    SessionDescription negotiate(const SessionDescription& offer) override;
    std::shared_ptr<BackChannel> back_channel() const override { return channel_; }
    void close() override;

private:
    // Declares a receive-only H.264 track for every video section of the
    // offer so the answer carries our codec choice.
    void prepare_tracks(rtc::Description& remote);
    void bind_video(std::shared_ptr<rtc::Track> track);

    void emit_event(TransportEvent ev);
    void emit_frame(Frame frame);

    RtcTransportOptions opts_;
    std::shared_ptr<rtc::PeerConnection> pc_;
    std::shared_ptr<RtcBackChannel> channel_;

    std::mutex tracks_mu_;
    std::vector<std::shared_ptr<rtc::Track>> tracks_;

    std::mutex handlers_mu_;
    TransportHandlers handlers_;

    std::mutex gather_mu_;
    std::condition_variable gather_cv_;
    bool gathered_{false};

    std::atomic<bool> closed_{false};
};

TransportFactory make_rtc_transport_factory(const RtcTransportOptions& opts);

}  // namespace livedet
