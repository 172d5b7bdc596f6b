#include "rtc_peer_transport.hpp"

#include <iostream>
#include <stdexcept>
#include <variant>

#include "errors.hpp"
#include "video_decoder.hpp"

namespace livedet {

void RtcBackChannel::bind(std::shared_ptr<rtc::DataChannel> dc) {
    if (!dc) return;
    std::lock_guard<std::mutex> lock(mu_);
    if (closed_) {
        dc->close();
        return;
    }
    channels_.push_back(std::move(dc));
}

std::shared_ptr<rtc::DataChannel> RtcBackChannel::active() const {
    std::lock_guard<std::mutex> lock(mu_);
    if (closed_) return nullptr;
    for (const auto& dc : channels_) {
        if (dc->isOpen()) return dc;
    }
    return nullptr;
}

bool RtcBackChannel::is_open() const {
    return active() != nullptr;
}

bool RtcBackChannel::send(const std::string& text) {
    auto dc = active();
    if (!dc) return false;
    try {
        dc->send(text);   // false only means buffered
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[WARN] Data channel send failed: " << e.what() << std::endl;
        return false;
    }
}

void RtcBackChannel::close() {
    std::vector<std::shared_ptr<rtc::DataChannel>> channels;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (closed_) return;
        closed_ = true;
        channels.swap(channels_);
    }
    for (auto& dc : channels) {
        dc->resetCallbacks();
        dc->close();
    }
}

RtcPeerTransport::RtcPeerTransport(const RtcTransportOptions& opts)
    : opts_(opts), channel_(std::make_shared<RtcBackChannel>()) {
    rtc::Configuration cfg;
    for (const auto& url : opts_.stun_servers) {
        cfg.iceServers.emplace_back(url);
    }
    pc_ = std::make_shared<rtc::PeerConnection>(cfg);

    pc_->onStateChange([this](rtc::PeerConnection::State state) {
        switch (state) {
            case rtc::PeerConnection::State::Connected: emit_event(TransportEvent::Connected); break;
            case rtc::PeerConnection::State::Disconnected: emit_event(TransportEvent::Disconnected); break;
            case rtc::PeerConnection::State::Failed: emit_event(TransportEvent::Failed); break;
            case rtc::PeerConnection::State::Closed: emit_event(TransportEvent::Closed); break;
            default: break;
        }
    });

    pc_->onGatheringStateChange([this](rtc::PeerConnection::GatheringState state) {
        if (state != rtc::PeerConnection::GatheringState::Complete) return;
        {
            std::lock_guard<std::mutex> lock(gather_mu_);
            gathered_ = true;
        }
        gather_cv_.notify_all();
    });

    pc_->onTrack([this](std::shared_ptr<rtc::Track> track) {
        if (track->description().type() == "video") bind_video(track);
    });

    pc_->onDataChannel([this](std::shared_ptr<rtc::DataChannel> dc) {
        std::cout << "[INFO] Incoming data channel '" << dc->label() << "'" << std::endl;
        channel_->bind(dc);
    });
}

RtcPeerTransport::~RtcPeerTransport() {
    close();
}

void RtcPeerTransport::set_handlers(TransportHandlers handlers) {
    std::lock_guard<std::mutex> lock(handlers_mu_);
    if (closed_) return;
    handlers_ = std::move(handlers);
}

void RtcPeerTransport::emit_event(TransportEvent ev) {
    std::lock_guard<std::mutex> lock(handlers_mu_);
    if (handlers_.on_event) handlers_.on_event(ev);
}

void RtcPeerTransport::emit_frame(Frame frame) {
    std::lock_guard<std::mutex> lock(handlers_mu_);
    if (handlers_.on_frame) handlers_.on_frame(std::move(frame));
}

void RtcPeerTransport::prepare_tracks(rtc::Description& remote) {
    for (int i = 0; i < remote.mediaCount(); ++i) {
        auto entry = remote.media(i);
        if (!std::holds_alternative<rtc::Description::Media*>(entry)) continue;
        auto* media = std::get<rtc::Description::Media*>(entry);
        if (media->type() != "video") continue;

        rtc::Description::Video recv(media->mid(), rtc::Description::Direction::RecvOnly);
        int codecs = 0;
        for (int pt : media->payloadTypes()) {
            const auto* map = media->rtpMap(pt);
            if (map && map->format == "H264") {
                recv.addH264Codec(pt);
                ++codecs;
            }
        }
        if (codecs == 0) {
            throw InvalidOfferError("video section '" + media->mid() + "' offers no H264 payload");
        }
        bind_video(pc_->addTrack(recv));
    }
}

void RtcPeerTransport::bind_video(std::shared_ptr<rtc::Track> track) {
    std::shared_ptr<VideoDecoder> decoder;
    try {
        decoder = std::make_shared<VideoDecoder>();
    } catch (const TransportError& e) {
        std::cerr << "[ERROR] Cannot decode track " << track->mid() << ": " << e.what() << std::endl;
        return;
    }

    auto depacketizer = std::make_shared<rtc::H264RtpDepacketizer>();
    depacketizer->addToChain(std::make_shared<rtc::RtcpReceivingSession>());
    track->setMediaHandler(depacketizer);

    track->onFrame([this, decoder](rtc::binary data, rtc::FrameInfo info) {
        auto frames = decoder->decode(reinterpret_cast<const uint8_t*>(data.data()), data.size(), info.timestamp);
        for (auto& frame : frames) {
            emit_frame(std::move(frame));
        }
    });
    std::cout << "[INFO] Receiving H264 video on mid " << track->mid() << std::endl;
    std::lock_guard<std::mutex> lock(tracks_mu_);
    tracks_.push_back(std::move(track));
}

SessionDescription RtcPeerTransport::negotiate(const SessionDescription& offer) {
    if (closed_) throw TransportError("transport closed");

    rtc::Description remote = [&] {
        try {
            return rtc::Description(offer.sdp, offer.type);
        } catch (const std::invalid_argument& e) {
            throw InvalidOfferError(std::string("unparseable sdp: ") + e.what());
        }
    }();

    try {
        prepare_tracks(remote);
        pc_->setRemoteDescription(remote);
    } catch (const InvalidOfferError&) {
        throw;
    } catch (const std::invalid_argument& e) {
        throw InvalidOfferError(e.what());
    } catch (const std::exception& e) {
        throw TransportError(std::string("setRemoteDescription failed: ") + e.what());
    }

    if (remote.hasApplication()) {
        channel_->bind(pc_->createDataChannel("detections"));
    } else {
        std::cerr << "[WARN] Offer has no data section; detections cannot be delivered" << std::endl;
    }

    {
        std::unique_lock<std::mutex> lock(gather_mu_);
        if (!gather_cv_.wait_for(lock, opts_.negotiation_timeout, [this] { return gathered_ || closed_.load(); })) {
            std::cerr << "[WARN] ICE gathering did not complete within "
                      << opts_.negotiation_timeout.count() << "ms; answering with partial candidates" << std::endl;
        }
    }
    if (closed_) throw TransportError("transport closed during negotiation");

    auto local = pc_->localDescription();
    if (!local) throw TransportError("no local description was generated");
    return SessionDescription{std::string(*local), local->typeString()};
}

void RtcPeerTransport::close() {
    if (closed_.exchange(true)) return;
    {
        std::lock_guard<std::mutex> lock(handlers_mu_);
        handlers_ = TransportHandlers{};
    }
    {
        std::lock_guard<std::mutex> lock(gather_mu_);
    }
    gather_cv_.notify_all();

    channel_->close();
    std::vector<std::shared_ptr<rtc::Track>> tracks;
    {
        std::lock_guard<std::mutex> lock(tracks_mu_);
        tracks.swap(tracks_);
    }
    for (auto& track : tracks) {
        track->resetCallbacks();
    }
    pc_->resetCallbacks();
    pc_->close();
}

TransportFactory make_rtc_transport_factory(const RtcTransportOptions& opts) {
    return [opts]() -> std::unique_ptr<PeerTransport> {
        return std::make_unique<RtcPeerTransport>(opts);
    };
}

}  // namespace livedet
