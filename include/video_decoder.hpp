#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "frame_types.hpp"

struct AVCodecContext;
struct AVFrame;
struct AVPacket;

namespace livedet {

// H.264 Annex-B access units in, deferred frames out: each Frame keeps a
// reference to its decoded picture and converts it to BGR only when
// materialize() is called. decode() is not thread-safe (one decoder per
// track); the conversion is.
class VideoDecoder {
public:
    VideoDecoder();   // throws TransportError when no H.264 decoder is available
    ~VideoDecoder();

    VideoDecoder(const VideoDecoder&) = delete;
    VideoDecoder& operator=(const VideoDecoder&) = delete;

    std::vector<Frame> decode(const uint8_t* data, std::size_t size, uint64_t sequence);

    uint64_t errors() const { return errors_; }

private:
    void release();

    AVCodecContext* ctx_{nullptr};
    AVPacket* pkt_{nullptr};
    AVFrame* frame_{nullptr};
    uint64_t errors_{0};
};

}  // namespace livedet
