#include "frame_sampler.hpp"

namespace livedet {

FrameSampler::FrameSampler(int interval) : interval_(interval < 1 ? 1 : interval) {}

bool FrameSampler::offer(const Frame&) {
    const uint64_t n = next_index_++;
    if (n % static_cast<uint64_t>(interval_) != 0) return false;
    ++forwarded_;
    return true;
}

}  // namespace livedet
