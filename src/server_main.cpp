#include "config.hpp"
#include "server_app.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

#include <rtc/rtc.hpp>

namespace {
std::atomic<bool> g_stop{false};

void on_signal(int) {
    g_stop = true;
}
}  // namespace

int main(int argc, char** argv) {
    livedet::AppConfig cfg = livedet::parse_args(argc, argv);

    std::cout << "[INFO] Starting livedet server (HTTP signaling + WebRTC + inference)\n";
    std::cout << "       model   : " << cfg.model_path << "\n";
    std::cout << "       interval: every " << cfg.sample_interval << " frame(s)\n";
    std::cout << "       workers : " << cfg.worker_threads << "\n";

    rtc::InitLogger(rtc::LogLevel::Warning);
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    try {
        livedet::ServerApp app(cfg);
        app.start();
        std::cout << "[INFO] Press Ctrl+C to exit" << std::endl;
        // Give the listener a moment before treating "not running" as a bind failure.
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        while (!g_stop && app.running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        app.stop();
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return 1;
    }

    std::cout << "[INFO] Stopped livedet server" << std::endl;
    return 0;
}
