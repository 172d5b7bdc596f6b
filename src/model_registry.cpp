#include "model_registry.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>

#include <httplib.h>

#include "errors.hpp"
#include "yolo_detector.hpp"

namespace livedet {

const char* model_status_to_string(ModelStatus status) {
    switch (status) {
        case ModelStatus::Ready: return "ready";
        case ModelStatus::Degraded: return "degraded";
        default: return "unreachable";
    }
}

ModelRegistry::ModelRegistry(std::vector<ModelSource> chain) : chain_(std::move(chain)) {}

std::vector<ModelSource> ModelRegistry::default_chain(const AppConfig& cfg) {
    YoloOptions opts;
    opts.class_names_path = cfg.class_names_path;
    opts.img_size = cfg.img_size;
    opts.conf_threshold = cfg.conf_threshold;
    opts.nms_threshold = cfg.nms_threshold;
    opts.use_onnxruntime = cfg.use_ort;

    std::vector<ModelSource> chain;
    const std::string local = cfg.model_path;
    chain.push_back({"local:" + local, [local, opts]() -> std::unique_ptr<Detector> {
        if (!std::filesystem::exists(local)) {
            throw ModelUnavailableError("weights file not found: " + local);
        }
        return std::make_unique<YoloDetector>(local, opts);
    }});

    const std::string url = cfg.model_url;
    const std::string cache = cfg.model_cache_path;
    if (!url.empty()) {
        chain.push_back({"download:" + url, [url, cache, opts]() -> std::unique_ptr<Detector> {
            download_weights(url, cache);
            return std::make_unique<YoloDetector>(cache, opts);
        }});
    }
    return chain;
}

void ModelRegistry::load() {
    std::call_once(once_, [this] { load_once(); });
}

void ModelRegistry::load_once() {
    for (const auto& source : chain_) {
        std::cout << "[INFO] Loading model from " << source.name << std::endl;
        try {
            auto detector = source.load();
            if (!detector) {
                std::cerr << "[WARN] Model source " << source.name << " produced no detector" << std::endl;
                continue;
            }
            serialize_ = !detector->reentrant();
            detector_ = std::move(detector);
            source_name_ = source.name;
            status_.store(ModelStatus::Ready);
            std::cout << "[INFO] Model ready (" << source.name << ")" << std::endl;
            return;
        } catch (const std::exception& e) {
            std::cerr << "[WARN] Model source " << source.name << " failed: " << e.what() << std::endl;
        }
    }

    std::cerr << "[ERROR] No model could be loaded; running in degraded mode (no detections)" << std::endl;
    detector_ = std::make_unique<NullDetector>();
    serialize_ = false;
    source_name_ = "none";
    status_.store(ModelStatus::Degraded);
}

std::string ModelRegistry::source_name() const {
    if (status_.load() == ModelStatus::Unloaded) return "";
    return source_name_;
}

std::vector<BoundingBox> ModelRegistry::infer(const cv::Mat& bgr) {
    load();
    if (status_.load() == ModelStatus::Degraded) return {};

    try {
        if (serialize_) {
            std::lock_guard<std::mutex> lock(infer_mu_);
            return detector_->detect(bgr);
        }
        return detector_->detect(bgr);
    } catch (const InferenceError&) {
        throw;
    } catch (const std::exception& e) {
        throw InferenceError(e.what());
    }
}

namespace {

struct ParsedUrl {
    std::string origin;   // scheme://host[:port]
    std::string path;
};

ParsedUrl split_url(const std::string& url) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        throw ModelUnavailableError("not an absolute URL: " + url);
    }
    const auto path_start = url.find('/', scheme_end + 3);
    if (path_start == std::string::npos) return {url, "/"};
    return {url.substr(0, path_start), url.substr(path_start)};
}

}  // namespace

void download_weights(const std::string& url, const std::string& path) {
    if (std::filesystem::exists(path)) {
        std::cout << "[INFO] Using cached weights: " << path << std::endl;
        return;
    }

    const ParsedUrl parts = split_url(url);
    httplib::Client cli(parts.origin);
    cli.set_follow_location(true);
    cli.set_connection_timeout(10, 0);
    cli.set_read_timeout(60, 0);

    std::cout << "[INFO] Downloading weights from " << url << std::endl;
    auto res = cli.Get(parts.path);
    if (!res) {
        throw ModelUnavailableError("download failed: " + httplib::to_string(res.error()));
    }
    if (res->status != 200 || res->body.empty()) {
        throw ModelUnavailableError("download failed with HTTP status " + std::to_string(res->status));
    }

    std::error_code ec;
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) throw ModelUnavailableError("cannot create " + parent.string() + ": " + ec.message());
    }

    const std::string tmp = path + ".part";
    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f) throw ModelUnavailableError("cannot write " + tmp);
        f.write(res->body.data(), static_cast<std::streamsize>(res->body.size()));
        if (!f) throw ModelUnavailableError("short write to " + tmp);
    }
    std::filesystem::rename(tmp, path, ec);
    if (ec) throw ModelUnavailableError("cannot move weights into " + path + ": " + ec.message());
    std::cout << "[INFO] Saved weights to " << path << " (" << res->body.size() << " bytes)" << std::endl;
}

}  // namespace livedet
