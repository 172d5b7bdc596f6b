#include "yolo_detector.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <opencv2/imgproc.hpp>

#include "errors.hpp"

namespace livedet {

YoloDetector::YoloDetector(const std::string& model_path, const YoloOptions& opts)
    : input_size_(opts.img_size),
      decode_opts_{opts.img_size, opts.conf_threshold, opts.nms_threshold},
      use_ort_(opts.use_onnxruntime) {
    class_names_ = {"person", "bicycle", "car", "motorcycle", "airplane", "bus", "train", "truck",
                    "boat",   "traffic light", "fire hydrant", "stop sign", "parking meter", "bench",
                    "bird",   "cat",           "dog",         "horse",     "sheep",         "cow",
                    "elephant", "bear", "zebra", "giraffe", "backpack", "umbrella",
                    "handbag", "tie", "suitcase", "frisbee", "skis", "snowboard",
                    "sports ball", "kite", "baseball bat", "baseball glove", "skateboard",
                    "surfboard", "tennis racket", "bottle", "wine glass", "cup", "fork",
                    "knife", "spoon", "bowl", "banana", "apple", "sandwich", "orange",
                    "broccoli", "carrot", "hot dog", "pizza", "donut", "cake", "chair",
                    "couch", "potted plant", "bed", "dining table", "toilet", "tv", "laptop",
                    "mouse", "remote", "keyboard", "cell phone", "microwave", "oven", "toaster",
                    "sink", "refrigerator", "book", "clock", "vase", "scissors", "teddy bear",
                    "hair drier", "toothbrush"};
    if (!opts.class_names_path.empty()) {
        load_class_names(opts.class_names_path);
    }

#ifdef LIVEDET_USE_ONNXRUNTIME
    if (use_ort_) {
        try {
            Ort::SessionOptions so;
            so.SetGraphOptimizationLevel(ORT_ENABLE_ALL);
            session_ = std::make_unique<Ort::Session>(env_, model_path.c_str(), so);

            Ort::AllocatorWithDefaultOptions allocator;
            const size_t in_count = session_->GetInputCount();
            for (size_t i = 0; i < in_count; ++i) {
                auto name = session_->GetInputNameAllocated(i, allocator);
                input_name_strs_.push_back(name.get());
            }
            const size_t out_count = session_->GetOutputCount();
            for (size_t i = 0; i < out_count; ++i) {
                auto name = session_->GetOutputNameAllocated(i, allocator);
                output_name_strs_.push_back(name.get());
            }
            for (const auto& s : input_name_strs_) input_names_.push_back(s.c_str());
            for (const auto& s : output_name_strs_) output_names_.push_back(s.c_str());
            std::cout << "[INFO] Loaded ORT model: " << model_path << std::endl;
            return;
        } catch (const std::exception& e) {
            std::cerr << "[WARN] ONNX Runtime load failed (" << e.what() << "); falling back to OpenCV DNN." << std::endl;
            session_.reset();
            use_ort_ = false;
        }
    }
#else
    use_ort_ = false;
#endif

    try {
        net_ = cv::dnn::readNet(model_path);
    } catch (const cv::Exception& e) {
        throw ModelUnavailableError("cannot load " + model_path + ": " + e.what());
    }
    if (net_.empty()) {
        throw ModelUnavailableError("cannot load " + model_path);
    }
    net_.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
    net_.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
    std::cout << "[INFO] Loaded OpenCV DNN model: " << model_path << std::endl;
}

void YoloDetector::load_class_names(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        std::cerr << "[WARN] Unable to open class names file: " << path << std::endl;
        return;
    }
    std::vector<std::string> names;
    std::string line;
    while (std::getline(f, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) names.push_back(line);
    }
    if (!names.empty()) class_names_ = std::move(names);
}

namespace {

std::string label_for(const std::vector<std::string>& names, int cls) {
    if (cls >= 0 && cls < static_cast<int>(names.size())) return names[cls];
    return "class_" + std::to_string(cls);
}

}  // namespace

std::vector<BoundingBox> YoloDetector::detect(const cv::Mat& bgr) {
    if (bgr.empty()) return {};
    try {
#ifdef LIVEDET_USE_ONNXRUNTIME
        if (use_ort_ && session_) {
            return run_ort(bgr);
        }
#endif
        return run_opencv(bgr);
    } catch (const cv::Exception& e) {
        throw InferenceError(e.what());
#ifdef LIVEDET_USE_ONNXRUNTIME
    } catch (const Ort::Exception& e) {
        throw InferenceError(e.what());
#endif
    }
}

std::vector<BoundingBox> decode_yolo_output(const float* data, const std::vector<int64_t>& shape,
                                            int frame_w, int frame_h, const YoloDecodeOptions& opts,
                                            const std::vector<std::string>& class_names) {
    if (!data || frame_w <= 0 || frame_h <= 0 || opts.input_size <= 0) return {};

    int rows = 0;
    int dims = 0;
    bool channel_first = false;
    if (shape.size() == 3) {
        rows = static_cast<int>(shape[1]);
        dims = static_cast<int>(shape[2]);
        if (shape[2] > shape[1]) {
            rows = static_cast<int>(shape[2]);
            dims = static_cast<int>(shape[1]);
            channel_first = true;
        }
    } else if (shape.size() == 2) {
        rows = static_cast<int>(shape[0]);
        dims = static_cast<int>(shape[1]);
    } else {
        return {};
    }

    // v8 exports are channel-first and carry no objectness column.
    const int class_start = channel_first ? 4 : 5;
    const int classes = std::max(1, dims - class_start);
    const float scale_x = static_cast<float>(frame_w) / static_cast<float>(opts.input_size);
    const float scale_y = static_cast<float>(frame_h) / static_cast<float>(opts.input_size);

    std::vector<cv::Rect> rects;
    std::vector<float> scores;
    std::vector<int> class_ids;

    for (int i = 0; i < rows; ++i) {
        const float* ptr = channel_first ? (data + i) : (data + i * dims);
        auto item = [&](int idx) -> float {
            return channel_first ? ptr[idx * rows] : ptr[idx];
        };

        const float objectness = channel_first ? 1.0f : item(4);
        if (objectness < opts.conf_threshold) continue;

        int best_cls = -1;
        float best_score = 0.0f;
        for (int c = 0; c < classes && class_start + c < dims; ++c) {
            float conf = objectness * item(class_start + c);
            if (conf > best_score) {
                best_score = conf;
                best_cls = c;
            }
        }
        if (best_score < opts.conf_threshold) continue;

        const float cx = item(0);
        const float cy = item(1);
        const float w = item(2);
        const float h = item(3);
        const int x0 = static_cast<int>((cx - 0.5f * w) * scale_x);
        const int y0 = static_cast<int>((cy - 0.5f * h) * scale_y);
        const int x1 = static_cast<int>((cx + 0.5f * w) * scale_x);
        const int y1 = static_cast<int>((cy + 0.5f * h) * scale_y);
        rects.emplace_back(x0, y0, x1 - x0, y1 - y0);
        scores.push_back(best_score);
        class_ids.push_back(best_cls);
    }

    std::vector<int> keep;
    cv::dnn::NMSBoxes(rects, scores, opts.conf_threshold, opts.nms_threshold, keep);

    const cv::Rect bounds(0, 0, frame_w, frame_h);
    std::vector<BoundingBox> out;
    out.reserve(keep.size());
    for (int idx : keep) {
        cv::Rect r = rects[idx] & bounds;
        if (r.width <= 0 || r.height <= 0) continue;
        out.push_back(BoundingBox{r.x, r.y, r.width, r.height, label_for(class_names, class_ids[idx]),
                                  std::min(1.0f, scores[idx])});
    }
    return out;
}

std::vector<BoundingBox> YoloDetector::run_opencv(const cv::Mat& bgr) {
    cv::Mat blob = cv::dnn::blobFromImage(bgr, 1.0 / 255.0, cv::Size(input_size_, input_size_),
                                          cv::Scalar(), true, false);
    net_.setInput(blob);
    cv::Mat pred = net_.forward();

    std::vector<int64_t> shape;
    for (int i = 0; i < pred.dims; ++i) shape.push_back(pred.size[i]);
    if (!shape.empty() && shape.size() > 3 && shape[0] == 1) shape.erase(shape.begin());
    return decode_yolo_output(reinterpret_cast<const float*>(pred.data), shape, bgr.cols, bgr.rows,
                              decode_opts_, class_names_);
}

#ifdef LIVEDET_USE_ONNXRUNTIME
std::vector<BoundingBox> YoloDetector::run_ort(const cv::Mat& bgr) {
    cv::Mat resized;
    cv::resize(bgr, resized, cv::Size(input_size_, input_size_));
    cv::Mat rgb;
    cv::cvtColor(resized, rgb, cv::COLOR_BGR2RGB);
    rgb.convertTo(rgb, CV_32F, 1.0 / 255.0);

    std::vector<float> blob;
    blob.reserve(3 * input_size_ * input_size_);
    std::vector<int64_t> input_shape{1, 3, input_size_, input_size_};
    for (int c = 0; c < 3; ++c) {
        for (int y = 0; y < input_size_; ++y) {
            const float* row = rgb.ptr<float>(y);
            for (int x = 0; x < input_size_; ++x) {
                blob.push_back(row[x * 3 + c]);
            }
        }
    }

    Ort::Value input_tensor = Ort::Value::CreateTensor<float>(mem_info_, blob.data(), blob.size(),
                                                              input_shape.data(), input_shape.size());
    auto outputs = session_->Run(Ort::RunOptions{nullptr},
                                 input_names_.data(), &input_tensor, 1,
                                 output_names_.data(), output_names_.size());
    if (outputs.empty()) return {};

    auto& out = outputs.front();
    const float* data = out.GetTensorData<float>();
    std::vector<int64_t> shape = out.GetTensorTypeAndShapeInfo().GetShape();
    return decode_yolo_output(data, shape, bgr.cols, bgr.rows, decode_opts_, class_names_);
}
#endif

}  // namespace livedet
