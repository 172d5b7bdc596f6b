#pragma once

#include <string>

#include "config.hpp"
#include "model_registry.hpp"
#include "signaling_service.hpp"

namespace livedet {

struct ApiResponse {
    int status{200};
    std::string body;
};

// POST /offer
ApiResponse offer_endpoint(SignalingService& signaling, const std::string& body);

// GET /health
ApiResponse health_endpoint(ModelStatus status);

// POST /detect: {"image": "<base64, optional data: URL prefix>"}
ApiResponse detect_endpoint(ModelRegistry& registry, const std::string& body);

// GET /status
ApiResponse status_endpoint(const SignalingService& signaling, const ModelRegistry& registry,
                            const AppConfig& cfg, std::size_t workers);

// Returns false on malformed input.
bool decode_base64(const std::string& in, std::string& out);

}  // namespace livedet
