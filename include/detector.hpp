#pragma once

#include <opencv2/core.hpp>
#include <vector>

#include "frame_types.hpp"

namespace livedet {

class Detector {
public:
    virtual ~Detector() = default;

    virtual std::vector<BoundingBox> detect(const cv::Mat& bgr) = 0;

    // False when concurrent detect() calls on one instance are unsafe.
    virtual bool reentrant() const { return false; }
};

// Degraded-mode stand-in: never detects anything.
class NullDetector : public Detector {
public:
    std::vector<BoundingBox> detect(const cv::Mat&) override { return {}; }
    bool reentrant() const override { return true; }
};

}  // namespace livedet
