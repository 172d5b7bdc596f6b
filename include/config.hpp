#pragma once

#include <string>
#include <vector>

namespace livedet {

struct AppConfig {
    std::string host{"0.0.0.0"};
    int port{8002};

    std::string model_path{"models/yolov5s.onnx"};
    std::string model_url{"https://github.com/ultralytics/yolov5/releases/download/v7.0/yolov5s.onnx"};
    std::string model_cache_path{"models/yolov5s.download.onnx"};
    std::string class_names_path{};   // optional path to names file
    int img_size{640};
    float conf_threshold{0.25f};
    float nms_threshold{0.45f};
    bool use_ort{true};               // use ONNX Runtime when available

    int sample_interval{5};           // forward every Kth frame
    int worker_threads{2};
    int grace_period_ms{5000};
    int negotiation_timeout_ms{5000};
    std::vector<std::string> stun_servers{"stun:stun.l.google.com:19302",
                                          "stun:stun1.l.google.com:19302"};
};

AppConfig parse_args(int argc, char** argv);

// Replaces out-of-range values with defaults, warning for each one.
void sanitize(AppConfig& cfg);

std::vector<std::string> split_list(const std::string& s, char sep = ',');

}  // namespace livedet
