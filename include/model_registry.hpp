#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "config.hpp"
#include "detector.hpp"
#include "frame_types.hpp"

namespace livedet {

enum class ModelStatus { Unloaded, Ready, Degraded };

const char* model_status_to_string(ModelStatus status);

// A named way of producing a detector. The loader throws
// ModelUnavailableError (or any std::exception) when it cannot.
struct ModelSource {
    std::string name;
    std::function<std::unique_ptr<Detector>()> load;
};

// Owns the one detector shared by every connection. Constructed once at
// start-up and passed by reference; the detector itself is built lazily on
// the first load()/infer(), trying each source in order and degrading to a
// NullDetector when all of them fail.
class ModelRegistry {
public:
    explicit ModelRegistry(std::vector<ModelSource> chain);

    // Local weights file, then the download-and-cache source.
    static std::vector<ModelSource> default_chain(const AppConfig& cfg);

    // Idempotent. Concurrent callers block until the single load finishes.
    void load();

    // Safe from any number of threads. Returns an empty list in degraded
    // mode. Detector failures surface as InferenceError.
    std::vector<BoundingBox> infer(const cv::Mat& bgr);

    ModelStatus status() const { return status_.load(); }
    bool ready() const { return status_.load() == ModelStatus::Ready; }
    bool degraded() const { return status_.load() == ModelStatus::Degraded; }
    std::string source_name() const;

private:
    void load_once();

    std::vector<ModelSource> chain_;
    std::once_flag once_;
    std::atomic<ModelStatus> status_{ModelStatus::Unloaded};
    std::unique_ptr<Detector> detector_;
    std::string source_name_;
    bool serialize_{true};
    std::mutex infer_mu_;
};

// Fetches url into path unless path already exists. Throws
// ModelUnavailableError on any network or file failure.
void download_weights(const std::string& url, const std::string& path);

}  // namespace livedet
