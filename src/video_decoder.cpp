#include "video_decoder.hpp"

#include <iostream>
#include <memory>
#include <string>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/error.h>
#include <libavutil/imgutils.h>
#include <libswscale/swscale.h>
}

#include "errors.hpp"

namespace livedet {

namespace {
std::string err2str(int err) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(err, buf, sizeof(buf));
    return std::string(buf);
}

cv::Mat to_bgr(const AVFrame* frame) {
    const int w = frame->width;
    const int h = frame->height;
    if (w <= 0 || h <= 0) return {};

    SwsContext* sws = sws_getContext(w, h, static_cast<AVPixelFormat>(frame->format),
                                     w, h, AV_PIX_FMT_BGR24, SWS_BILINEAR, nullptr, nullptr, nullptr);
    if (!sws) {
        std::cerr << "[WARN] decoder: sws_getContext failed" << std::endl;
        return {};
    }
    cv::Mat bgr(h, w, CV_8UC3);
    uint8_t* dst[4] = {bgr.data, nullptr, nullptr, nullptr};
    int dst_stride[4] = {static_cast<int>(bgr.step[0]), 0, 0, 0};
    sws_scale(sws, frame->data, frame->linesize, 0, h, dst, dst_stride);
    sws_freeContext(sws);
    return bgr;
}

void free_frame(AVFrame* frame) {
    av_frame_free(&frame);
}
}  // namespace

VideoDecoder::VideoDecoder() {
    const AVCodec* codec = avcodec_find_decoder(AV_CODEC_ID_H264);
    if (!codec) throw TransportError("no H.264 decoder available");

    ctx_ = avcodec_alloc_context3(codec);
    pkt_ = av_packet_alloc();
    frame_ = av_frame_alloc();
    if (!ctx_ || !pkt_ || !frame_) {
        release();
        throw TransportError("decoder allocation failed");
    }
    ctx_->flags2 |= AV_CODEC_FLAG2_CHUNKS;
    int ret = avcodec_open2(ctx_, codec, nullptr);
    if (ret < 0) {
        const std::string msg = "avcodec_open2 failed: " + err2str(ret);
        release();
        throw TransportError(msg);
    }
}

VideoDecoder::~VideoDecoder() {
    release();
}

void VideoDecoder::release() {
    if (frame_) { av_frame_free(&frame_); }
    if (pkt_) { av_packet_free(&pkt_); }
    if (ctx_) { avcodec_free_context(&ctx_); }
}

std::vector<Frame> VideoDecoder::decode(const uint8_t* data, std::size_t size, uint64_t sequence) {
    std::vector<Frame> out;
    if (!data || size == 0) return out;

    pkt_->data = const_cast<uint8_t*>(data);
    pkt_->size = static_cast<int>(size);
    int ret = avcodec_send_packet(ctx_, pkt_);
    pkt_->data = nullptr;
    pkt_->size = 0;
    if (ret < 0 && ret != AVERROR(EAGAIN)) {
        // Typical until the first keyframe arrives.
        if (errors_++ % 100 == 0) {
            std::cerr << "[WARN] decoder: avcodec_send_packet failed: " << err2str(ret) << std::endl;
        }
        return out;
    }

    for (;;) {
        ret = avcodec_receive_frame(ctx_, frame_);
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) break;
        if (ret < 0) {
            ++errors_;
            std::cerr << "[WARN] decoder: avcodec_receive_frame failed: " << err2str(ret) << std::endl;
            break;
        }
        if (frame_->width > 0 && frame_->height > 0) {
            // The clone shares the decoder's buffers by reference count.
            std::shared_ptr<AVFrame> picture(av_frame_clone(frame_), free_frame);
            if (picture) {
                Frame f;
                f.sequence = sequence;
                f.width = picture->width;
                f.height = picture->height;
                f.captured_at = Clock::now();
                f.convert = [picture] { return to_bgr(picture.get()); };
                out.push_back(std::move(f));
            }
        }
        av_frame_unref(frame_);
    }
    return out;
}

}  // namespace livedet
