#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace livedet {

using Clock = std::chrono::steady_clock;

// One decoded video frame from a connection's media intake.
struct Frame {
    cv::Mat image;              // BGR, shared buffer, never written after capture
    uint64_t sequence{0};       // source-assigned (RTP timestamp for WebRTC intake)
    int width{0};
    int height{0};
    Clock::time_point captured_at{};

    // Set by intakes that defer pixel conversion; image stays empty until
    // materialize() runs it. Must be safe to call from any thread.
    std::function<cv::Mat()> convert;
};

// Produces the BGR image for a deferred frame. False when there is none.
inline bool materialize(Frame& frame) {
    if (frame.image.empty() && frame.convert) {
        frame.image = frame.convert();
        frame.convert = nullptr;
    }
    return !frame.image.empty();
}

struct BoundingBox {
    int x{0};
    int y{0};
    int w{0};
    int h{0};
    std::string cls;
    float confidence{0.0f};     // [0, 1]
};

struct DetectionResult {
    uint64_t frame_index{0};
    int width{0};
    int height{0};
    std::vector<BoundingBox> boxes;
};

inline Frame make_frame(const cv::Mat& image, uint64_t sequence) {
    Frame f;
    f.image = image;
    f.sequence = sequence;
    f.width = image.cols;
    f.height = image.rows;
    f.captured_at = Clock::now();
    return f;
}

}  // namespace livedet
