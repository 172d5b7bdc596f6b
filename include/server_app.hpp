#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include <httplib.h>

#include "config.hpp"
#include "event_loop.hpp"
#include "http_api.hpp"
#include "inference_scheduler.hpp"
#include "model_registry.hpp"
#include "peer_transport.hpp"
#include "result_broadcaster.hpp"
#include "signaling_service.hpp"

namespace livedet {

class ServerApp {
public:
    // An empty factory selects the libdatachannel transport.
    explicit ServerApp(const AppConfig& cfg, TransportFactory make_transport = {});
    ~ServerApp();

    void start();
    void stop();
    bool running() const { return http_running_; }

    ModelRegistry& registry() { return registry_; }
    SignalingService& signaling() { return *signaling_; }

private:
    void run_http();
    void setup_routes();

    AppConfig cfg_;
    EventLoop loop_;
    ModelRegistry registry_;
    ResultBroadcaster broadcaster_;
    std::unique_ptr<InferenceScheduler> scheduler_;
    std::unique_ptr<SignalingService> signaling_;

    std::atomic<bool> http_running_{false};
    std::thread http_thread_;
    std::unique_ptr<httplib::Server> http_srv_;
    std::thread warmup_thread_;
};

}  // namespace livedet
