#pragma once

#include <cstdint>

#include "frame_types.hpp"

namespace livedet {

// Per-connection every-Kth-frame gate. Frames are offered strictly in arrival
// order by a single reader; nothing is retained between calls.
class FrameSampler {
public:
    explicit FrameSampler(int interval = 5);

    // Counts the frame and reports whether it should go to inference. The
    // first frame (index 0) is always forwarded, then every interval-th.
    bool offer(const Frame& frame);

    // Arrival index of the most recently offered frame.
    uint64_t last_index() const { return next_index_ == 0 ? 0 : next_index_ - 1; }
    uint64_t frames_seen() const { return next_index_; }
    uint64_t frames_forwarded() const { return forwarded_; }
    int interval() const { return interval_; }

private:
    int interval_;
    uint64_t next_index_{0};
    uint64_t forwarded_{0};
};

}  // namespace livedet
