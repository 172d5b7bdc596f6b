#include "config.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>

namespace livedet {

static bool arg_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

std::vector<std::string> split_list(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == sep) {
            if (!cur.empty()) out.push_back(cur);
            cur.clear();
        } else if (c != ' ') {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

void sanitize(AppConfig& cfg) {
    const AppConfig defaults;
    if (cfg.port <= 0 || cfg.port > 65535) {
        std::cerr << "[WARN] Invalid port " << cfg.port << ", using " << defaults.port << std::endl;
        cfg.port = defaults.port;
    }
    if (cfg.sample_interval < 1) {
        std::cerr << "[WARN] Invalid detection interval " << cfg.sample_interval
                  << ", using " << defaults.sample_interval << std::endl;
        cfg.sample_interval = defaults.sample_interval;
    }
    if (cfg.worker_threads < 1) {
        std::cerr << "[WARN] Invalid worker count " << cfg.worker_threads
                  << ", using " << defaults.worker_threads << std::endl;
        cfg.worker_threads = defaults.worker_threads;
    }
    if (cfg.grace_period_ms < 0) {
        std::cerr << "[WARN] Invalid grace period " << cfg.grace_period_ms
                  << "ms, using " << defaults.grace_period_ms << "ms" << std::endl;
        cfg.grace_period_ms = defaults.grace_period_ms;
    }
    if (cfg.negotiation_timeout_ms <= 0) {
        cfg.negotiation_timeout_ms = defaults.negotiation_timeout_ms;
    }
    if (cfg.img_size <= 0) cfg.img_size = defaults.img_size;
}

AppConfig parse_args(int argc, char** argv) {
    AppConfig cfg;

    if (const char* v = std::getenv("SERVER_HOST")) cfg.host = v;
    if (const char* v = std::getenv("SERVER_PORT")) cfg.port = std::atoi(v);
    if (const char* v = std::getenv("MODEL_PATH")) cfg.model_path = v;
    if (const char* v = std::getenv("MODEL_URL")) cfg.model_url = v;
    if (const char* v = std::getenv("MODEL_CACHE")) cfg.model_cache_path = v;
    if (const char* v = std::getenv("CLASS_NAMES")) cfg.class_names_path = v;
    if (const char* v = std::getenv("IMG_SIZE")) cfg.img_size = std::atoi(v);
    if (const char* v = std::getenv("CONFIDENCE_THRESHOLD")) cfg.conf_threshold = static_cast<float>(std::atof(v));
    if (const char* v = std::getenv("NMS_THRESHOLD")) cfg.nms_threshold = static_cast<float>(std::atof(v));
    if (const char* v = std::getenv("DETECTION_INTERVAL")) cfg.sample_interval = std::atoi(v);
    if (const char* v = std::getenv("WORKER_THREADS")) cfg.worker_threads = std::atoi(v);
    if (const char* v = std::getenv("GRACE_PERIOD_MS")) cfg.grace_period_ms = std::atoi(v);
    if (const char* v = std::getenv("NEGOTIATION_TIMEOUT_MS")) cfg.negotiation_timeout_ms = std::atoi(v);
    if (const char* v = std::getenv("STUN_SERVERS")) cfg.stun_servers = split_list(v);

    bool stun_from_args = false;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        auto next = [&](int offset = 1) -> const char* {
            if (i + offset < argc) return argv[i + offset];
            return nullptr;
        };

        if (arg_eq(arg, "--host") && next()) {
            cfg.host = next();
            i++;
        } else if (arg_eq(arg, "--port") && next()) {
            cfg.port = std::atoi(next());
            i++;
        } else if (arg_eq(arg, "--model") && next()) {
            cfg.model_path = next();
            i++;
        } else if (arg_eq(arg, "--model-url") && next()) {
            cfg.model_url = next();
            i++;
        } else if (arg_eq(arg, "--model-cache") && next()) {
            cfg.model_cache_path = next();
            i++;
        } else if (arg_eq(arg, "--class-names") && next()) {
            cfg.class_names_path = next();
            i++;
        } else if (arg_eq(arg, "--img") && next()) {
            cfg.img_size = std::atoi(next());
            i++;
        } else if (arg_eq(arg, "--conf") && next()) {
            cfg.conf_threshold = static_cast<float>(std::atof(next()));
            i++;
        } else if (arg_eq(arg, "--nms") && next()) {
            cfg.nms_threshold = static_cast<float>(std::atof(next()));
            i++;
        } else if (arg_eq(arg, "--interval") && next()) {
            cfg.sample_interval = std::atoi(next());
            i++;
        } else if (arg_eq(arg, "--workers") && next()) {
            cfg.worker_threads = std::atoi(next());
            i++;
        } else if (arg_eq(arg, "--grace-ms") && next()) {
            cfg.grace_period_ms = std::atoi(next());
            i++;
        } else if (arg_eq(arg, "--negotiation-timeout-ms") && next()) {
            cfg.negotiation_timeout_ms = std::atoi(next());
            i++;
        } else if (arg_eq(arg, "--stun") && next()) {
            if (!stun_from_args) cfg.stun_servers.clear();
            stun_from_args = true;
            cfg.stun_servers.push_back(next());
            i++;
        } else if (arg_eq(arg, "--no-ort")) {
            cfg.use_ort = false;
        } else if (arg_eq(arg, "--use-ort")) {
            cfg.use_ort = true;
        } else if (arg_eq(arg, "--help")) {
            std::cout << "Usage: livedet_server [--host <addr>] [--port <int>] [--model <onnx>]\n"
                      << "                      [--model-url <url>] [--model-cache <path>] [--class-names <file>]\n"
                      << "                      [--img <size>] [--conf <thresh>] [--nms <thresh>]\n"
                      << "                      [--interval <K>] [--workers <N>] [--grace-ms <ms>]\n"
                      << "                      [--negotiation-timeout-ms <ms>] [--stun <url>]...\n"
                      << "                      [--use-ort|--no-ort]\n";
            std::exit(0);
        } else {
            std::cerr << "[WARN] Ignoring unknown argument: " << arg << std::endl;
        }
    }

    sanitize(cfg);
    return cfg;
}

}  // namespace livedet
