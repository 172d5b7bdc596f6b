#include "http_api.hpp"

#include <iostream>
#include <vector>

#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <opencv2/imgcodecs.hpp>

#include "errors.hpp"
#include "result_broadcaster.hpp"

namespace livedet {

namespace {

ApiResponse json_response(int status, const nlohmann::json& body) {
    return ApiResponse{status, body.dump()};
}

ApiResponse detect_error(const std::string& message) {
    return json_response(400, {{"error", message},
                               {"detections", nlohmann::json::array()},
                               {"w", 0},
                               {"h", 0}});
}

}  // namespace

bool decode_base64(const std::string& in, std::string& out) {
    out.clear();
    if (in.empty()) return false;

    EVP_ENCODE_CTX* ctx = EVP_ENCODE_CTX_new();
    if (!ctx) return false;
    EVP_DecodeInit(ctx);

    std::vector<unsigned char> buf(in.size() + 80);
    int len = 0;
    int total = 0;
    int rc = EVP_DecodeUpdate(ctx, buf.data(), &len,
                              reinterpret_cast<const unsigned char*>(in.data()), static_cast<int>(in.size()));
    if (rc < 0) {
        EVP_ENCODE_CTX_free(ctx);
        return false;
    }
    total = len;
    rc = EVP_DecodeFinal(ctx, buf.data() + total, &len);
    EVP_ENCODE_CTX_free(ctx);
    if (rc < 0) return false;
    total += len;

    out.assign(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(total));
    return total > 0;
}

ApiResponse offer_endpoint(SignalingService& signaling, const std::string& body) {
    try {
        const SessionDescription offer = parse_offer(body);
        OfferOutcome outcome = signaling.handle_offer(offer);
        if (!outcome.answer) {
            return json_response(503, {{"error", "negotiation failed"}, {"id", outcome.connection_id}});
        }
        return json_response(200, {{"sdp", outcome.answer->sdp},
                                   {"type", outcome.answer->type},
                                   {"id", outcome.connection_id},
                                   {"degraded", outcome.degraded}});
    } catch (const InvalidOfferError& e) {
        std::cerr << "[WARN] Rejected offer: " << e.what() << std::endl;
        return json_response(400, {{"error", e.what()}});
    }
}

ApiResponse health_endpoint(ModelStatus status) {
    return json_response(200, {{"status", model_status_to_string(status)}});
}

ApiResponse detect_endpoint(ModelRegistry& registry, const std::string& body) {
    nlohmann::json req = nlohmann::json::parse(body, nullptr, false);
    if (req.is_discarded() || !req.is_object()) return detect_error("body is not a JSON object");

    auto image_it = req.find("image");
    if (image_it == req.end() || !image_it->is_string()) return detect_error("missing string field 'image'");

    std::string b64 = image_it->get<std::string>();
    const auto comma = b64.find(',');
    if (comma != std::string::npos) b64 = b64.substr(comma + 1);   // data:image/png;base64,

    std::string bytes;
    if (!decode_base64(b64, bytes)) return detect_error("image is not valid base64");

    std::vector<unsigned char> raw(bytes.begin(), bytes.end());
    cv::Mat image = cv::imdecode(raw, cv::IMREAD_COLOR);
    if (image.empty()) return detect_error("image could not be decoded");

    nlohmann::json out = {{"w", image.cols}, {"h", image.rows}};
    try {
        out["detections"] = detections_to_json(registry.infer(image));
    } catch (const InferenceError& e) {
        std::cerr << "[WARN] Detection failed: " << e.what() << std::endl;
        out["detections"] = nlohmann::json::array();
        out["error"] = e.what();
    }
    return json_response(200, out);
}

ApiResponse status_endpoint(const SignalingService& signaling, const ModelRegistry& registry,
                            const AppConfig& cfg, std::size_t workers) {
    nlohmann::json conns = nlohmann::json::array();
    for (const auto& info : signaling.connections()) {
        conns.push_back({{"id", info.id},
                         {"state", connection_state_to_string(info.state)},
                         {"degraded", info.degraded}});
    }
    return json_response(200, {{"model", model_status_to_string(registry.status())},
                               {"model_source", registry.source_name()},
                               {"connections", conns},
                               {"sample_interval", cfg.sample_interval},
                               {"workers", workers}});
}

}  // namespace livedet
