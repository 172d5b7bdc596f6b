#pragma once

#include <cstdint>
#include <opencv2/dnn.hpp>
#include <memory>
#include <string>
#include <vector>

#include "detector.hpp"

#ifdef LIVEDET_USE_ONNXRUNTIME
#include <onnxruntime_cxx_api.h>
#endif

namespace livedet {

struct YoloOptions {
    std::string class_names_path;
    int img_size{640};
    float conf_threshold{0.25f};
    float nms_threshold{0.45f};
    bool use_onnxruntime{true};
};

struct YoloDecodeOptions {
    int input_size{640};
    float conf_threshold{0.25f};
    float nms_threshold{0.45f};
};

// Decodes a [N, 5+C] (v5) or [4+C, N] (v8) prediction tensor, with or without
// a leading batch dimension, into boxes in frame coordinates. Applies the
// confidence threshold and NMS, and clamps boxes to the frame.
std::vector<BoundingBox> decode_yolo_output(const float* data, const std::vector<int64_t>& shape,
                                            int frame_w, int frame_h, const YoloDecodeOptions& opts,
                                            const std::vector<std::string>& class_names);

// YOLO (v5/v8 ONNX export) detector. Throws ModelUnavailableError from the
// constructor when the weights cannot be loaded.
class YoloDetector : public Detector {
public:
    YoloDetector(const std::string& model_path, const YoloOptions& opts);

    std::vector<BoundingBox> detect(const cv::Mat& bgr) override;
    bool reentrant() const override { return use_ort_; }

private:
    void load_class_names(const std::string& path);

    std::vector<BoundingBox> run_opencv(const cv::Mat& bgr);
#ifdef LIVEDET_USE_ONNXRUNTIME
    std::vector<BoundingBox> run_ort(const cv::Mat& bgr);
#endif

    cv::dnn::Net net_;
    std::vector<std::string> class_names_;
    int input_size_;
    YoloDecodeOptions decode_opts_;
    bool use_ort_{false};

#ifdef LIVEDET_USE_ONNXRUNTIME
    Ort::Env env_{ORT_LOGGING_LEVEL_WARNING, "livedet"};
    std::unique_ptr<Ort::Session> session_;
    Ort::MemoryInfo mem_info_{Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU)};
    std::vector<std::string> input_name_strs_;
    std::vector<const char*> input_names_;
    std::vector<std::string> output_name_strs_;
    std::vector<const char*> output_names_;
#endif
};

}  // namespace livedet
