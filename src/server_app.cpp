#include "server_app.hpp"

#include <chrono>
#include <iostream>
#include <utility>

#include "rtc_peer_transport.hpp"

namespace livedet {

namespace {

void respond(httplib::Response& res, const ApiResponse& api) {
    res.status = api.status;
    res.set_content(api.body, "application/json");
}

void respond_internal_error(httplib::Response& res, const std::exception& e) {
    std::cerr << "[ERROR] Request failed: " << e.what() << std::endl;
    res.status = 500;
    res.set_content("{\"error\":\"internal error\"}", "application/json");
}

}  // namespace

ServerApp::ServerApp(const AppConfig& cfg, TransportFactory make_transport)
    : cfg_(cfg), registry_(ModelRegistry::default_chain(cfg)) {
    if (!make_transport) {
        RtcTransportOptions topts;
        topts.stun_servers = cfg_.stun_servers;
        topts.negotiation_timeout = std::chrono::milliseconds(cfg_.negotiation_timeout_ms);
        make_transport = make_rtc_transport_factory(topts);
    }

    scheduler_ = std::make_unique<InferenceScheduler>(
        registry_, static_cast<std::size_t>(cfg_.worker_threads),
        [this](const std::string& id, DetectionResult result) {
            loop_.post([this, id, result = std::move(result)] { broadcaster_.publish(id, result); });
        });

    SignalingOptions sopts;
    sopts.sample_interval = cfg_.sample_interval;
    sopts.grace_period = std::chrono::milliseconds(cfg_.grace_period_ms);
    signaling_ = std::make_unique<SignalingService>(loop_, *scheduler_, broadcaster_, registry_,
                                                    std::move(make_transport), sopts);
}

ServerApp::~ServerApp() {
    stop();
}

void ServerApp::start() {
    if (http_running_) return;
    loop_.start();
    warmup_thread_ = std::thread([this] { registry_.load(); });

    http_srv_ = std::make_unique<httplib::Server>();
    setup_routes();
    http_running_ = true;
    http_thread_ = std::thread(&ServerApp::run_http, this);
}

void ServerApp::stop() {
    if (http_srv_) {
        http_srv_->stop();
    }
    if (http_thread_.joinable()) http_thread_.join();
    http_running_ = false;

    if (signaling_) signaling_->close_all();
    if (scheduler_) scheduler_->shutdown();
    loop_.stop();
    if (warmup_thread_.joinable()) warmup_thread_.join();
}

void ServerApp::run_http() {
    std::cout << "[INFO] Listening on http://" << cfg_.host << ":" << cfg_.port << std::endl;
    if (!http_srv_->listen(cfg_.host, cfg_.port)) {
        std::cerr << "[ERROR] HTTP server could not listen on " << cfg_.host << ":" << cfg_.port << std::endl;
    }
    http_running_ = false;
}

void ServerApp::setup_routes() {
    http_srv_->set_default_headers({{"Access-Control-Allow-Origin", "*"},
                                    {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
                                    {"Access-Control-Allow-Headers", "Content-Type"},
                                    {"Cache-Control", "no-store"}});

    http_srv_->Options(R"(.*)", [](const httplib::Request&, httplib::Response& res) {
        res.status = 204;
    });

    http_srv_->Post("/offer", [this](const httplib::Request& req, httplib::Response& res) {
        try {
            respond(res, offer_endpoint(*signaling_, req.body));
        } catch (const std::exception& e) {
            respond_internal_error(res, e);
        }
    });

    http_srv_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        respond(res, health_endpoint(registry_.status()));
    });

    http_srv_->Post("/detect", [this](const httplib::Request& req, httplib::Response& res) {
        try {
            respond(res, detect_endpoint(registry_, req.body));
        } catch (const std::exception& e) {
            respond_internal_error(res, e);
        }
    });

    http_srv_->Get("/status", [this](const httplib::Request&, httplib::Response& res) {
        respond(res, status_endpoint(*signaling_, registry_, cfg_, scheduler_->workers()));
    });
}

}  // namespace livedet
