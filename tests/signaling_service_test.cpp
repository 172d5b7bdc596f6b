#include <gtest/gtest.h>

#include <memory>
#include <mutex>
#include <vector>

#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "event_loop.hpp"
#include "fakes.hpp"
#include "http_api.hpp"
#include "inference_scheduler.hpp"
#include "model_registry.hpp"
#include "result_broadcaster.hpp"
#include "signaling_service.hpp"

using namespace livedet;
using namespace std::chrono_literals;
using livedet::testing::FakeDetector;
using livedet::testing::FakeTransport;
using livedet::testing::FakeTransportProbe;
using livedet::testing::chain_with;
using livedet::testing::failing_chain;
using livedet::testing::wait_until;

namespace {

const char* kOfferBody = R"({"sdp":"v=0\r\no=- 0 0 IN IP4 127.0.0.1\r\ns=-\r\n","type":"offer"})";

// Everything a SignalingService needs, wired the way the server wires it.
class Harness {
public:
    explicit Harness(std::vector<ModelSource> chain)
        : registry(std::move(chain)),
          scheduler(registry, 2, [this](const std::string& id, DetectionResult r) {
              loop.post([this, id, r = std::move(r)] { broadcaster.publish(id, r); });
          }) {
        loop.start();
        SignalingOptions opts;
        opts.sample_interval = 5;
        opts.grace_period = 40ms;
        signaling = std::make_unique<SignalingService>(
            loop, scheduler, broadcaster, registry,
            [this]() -> std::unique_ptr<PeerTransport> {
                auto probe = std::make_shared<FakeTransportProbe>();
                probe->mode = next_mode;
                std::lock_guard<std::mutex> lock(mu);
                probes.push_back(probe);
                return std::make_unique<FakeTransport>(probe);
            },
            opts);
    }

    ~Harness() {
        signaling.reset();
        scheduler.shutdown();
        loop.stop();
    }

    std::shared_ptr<FakeTransportProbe> probe(std::size_t i) {
        std::lock_guard<std::mutex> lock(mu);
        return probes.at(i);
    }

    std::size_t transports_created() {
        std::lock_guard<std::mutex> lock(mu);
        return probes.size();
    }

    EventLoop loop;
    ModelRegistry registry;
    ResultBroadcaster broadcaster;
    InferenceScheduler scheduler;
    std::unique_ptr<SignalingService> signaling;
    FakeTransportProbe::Mode next_mode{FakeTransportProbe::Mode::Answer};

private:
    std::mutex mu;
    std::vector<std::shared_ptr<FakeTransportProbe>> probes;
};

}  // namespace

TEST(ParseOffer, AcceptsWellFormedBody) {
    SessionDescription offer = parse_offer(kOfferBody);
    EXPECT_EQ(offer.type, "offer");
    EXPECT_EQ(offer.sdp.rfind("v=0", 0), 0u);
}

TEST(ParseOffer, RejectsMalformedBodies) {
    EXPECT_THROW(parse_offer("not json"), InvalidOfferError);
    EXPECT_THROW(parse_offer("[1,2]"), InvalidOfferError);
    EXPECT_THROW(parse_offer(R"({"type":"offer"})"), InvalidOfferError);
    EXPECT_THROW(parse_offer(R"({"sdp":5,"type":"offer"})"), InvalidOfferError);
}

TEST(SignalingService, ScenarioA_OfferReturnsAnswer) {
    FakeDetector det;
    Harness h(chain_with(&det));
    h.registry.load();

    ApiResponse res = offer_endpoint(*h.signaling, kOfferBody);
    ASSERT_EQ(res.status, 200);
    auto body = nlohmann::json::parse(res.body);
    EXPECT_EQ(body["type"], "answer");
    EXPECT_FALSE(body["sdp"].get<std::string>().empty());
    EXPECT_FALSE(body["degraded"].get<bool>());

    const std::string id = body["id"].get<std::string>();
    auto conn = h.signaling->find(id);
    ASSERT_NE(conn, nullptr);
    EXPECT_EQ(conn->state(), ConnectionState::Negotiating);
    EXPECT_EQ(h.signaling->active_count(), 1u);
}

TEST(SignalingService, ConnectionsHaveDistinctIds) {
    FakeDetector det;
    Harness h(chain_with(&det));
    auto a = h.signaling->handle_offer(parse_offer(kOfferBody));
    auto b = h.signaling->handle_offer(parse_offer(kOfferBody));
    EXPECT_NE(a.connection_id, b.connection_id);
    EXPECT_EQ(h.signaling->active_count(), 2u);
    EXPECT_EQ(h.transports_created(), 2u);
}

TEST(SignalingService, InvalidOfferIsRejectedWithoutCreatingConnection) {
    FakeDetector det;
    Harness h(chain_with(&det));

    EXPECT_EQ(offer_endpoint(*h.signaling, "{").status, 400);
    EXPECT_EQ(offer_endpoint(*h.signaling, R"({"sdp":"v=0","type":"answer"})").status, 400);
    EXPECT_EQ(offer_endpoint(*h.signaling, R"({"sdp":"garbage","type":"offer"})").status, 400);
    EXPECT_EQ(offer_endpoint(*h.signaling, R"({"sdp":"   ","type":"offer"})").status, 400);
    EXPECT_EQ(h.transports_created(), 0u);
    EXPECT_EQ(h.signaling->active_count(), 0u);
}

TEST(SignalingService, OfferRejectedByTransportIsClientError) {
    FakeDetector det;
    Harness h(chain_with(&det));
    h.next_mode = FakeTransportProbe::Mode::InvalidOffer;

    ApiResponse res = offer_endpoint(*h.signaling, kOfferBody);
    EXPECT_EQ(res.status, 400);
    EXPECT_EQ(h.signaling->active_count(), 0u);
    EXPECT_EQ(h.probe(0)->close_calls.load(), 1);
}

TEST(SignalingService, NegotiationFailureIsServiceUnavailable) {
    FakeDetector det;
    Harness h(chain_with(&det));
    h.next_mode = FakeTransportProbe::Mode::TransportFailure;

    ApiResponse res = offer_endpoint(*h.signaling, kOfferBody);
    EXPECT_EQ(res.status, 503);
    auto body = nlohmann::json::parse(res.body);
    EXPECT_EQ(body["error"], "negotiation failed");
    // The failed connection is torn down once its grace period runs out.
    ASSERT_TRUE(wait_until([&] { return h.signaling->active_count() == 0; }));
}

TEST(SignalingService, ModelUnavailableStillAnswersDegraded) {
    Harness h(failing_chain());
    h.registry.load();

    OfferOutcome outcome = h.signaling->handle_offer(parse_offer(kOfferBody));
    ASSERT_TRUE(outcome.answer.has_value());
    EXPECT_TRUE(outcome.degraded);
    EXPECT_EQ(h.signaling->health(), ModelStatus::Degraded);
    auto list = h.signaling->connections();
    ASSERT_EQ(list.size(), 1u);
    EXPECT_TRUE(list[0].degraded);
}

TEST(SignalingService, OfferDuringWarmUpIsNotDegraded) {
    FakeDetector det;
    Harness h(chain_with(&det));
    ASSERT_EQ(h.registry.status(), ModelStatus::Unloaded);

    OfferOutcome outcome = h.signaling->handle_offer(parse_offer(kOfferBody));
    ASSERT_TRUE(outcome.answer.has_value());
    EXPECT_FALSE(outcome.degraded);

    h.registry.load();
    auto list = h.signaling->connections();
    ASSERT_EQ(list.size(), 1u);
    EXPECT_FALSE(list[0].degraded);
}

TEST(SignalingService, ConnectionBecomesDegradedWhenWarmUpFails) {
    Harness h(failing_chain());
    OfferOutcome outcome = h.signaling->handle_offer(parse_offer(kOfferBody));
    EXPECT_FALSE(outcome.degraded);

    h.registry.load();
    auto list = h.signaling->connections();
    ASSERT_EQ(list.size(), 1u);
    EXPECT_TRUE(list[0].degraded);
}

TEST(SignalingService, HealthIsUnreachableBeforeLoad) {
    FakeDetector det;
    Harness h(chain_with(&det));
    EXPECT_EQ(health_endpoint(h.signaling->health()).body, R"({"status":"unreachable"})");
    h.registry.load();
    EXPECT_EQ(health_endpoint(h.signaling->health()).body, R"({"status":"ready"})");
}

TEST(SignalingService, ClosedConnectionIsRemoved) {
    FakeDetector det;
    Harness h(chain_with(&det));
    auto outcome = h.signaling->handle_offer(parse_offer(kOfferBody));
    h.probe(0)->fire(TransportEvent::Closed);
    ASSERT_TRUE(wait_until([&] { return h.signaling->active_count() == 0; }));
    EXPECT_EQ(h.signaling->find(outcome.connection_id), nullptr);
    EXPECT_EQ(h.probe(0)->close_calls.load(), 1);
}

TEST(SignalingService, CloseAllStopsEveryConnection) {
    FakeDetector det;
    Harness h(chain_with(&det));
    h.signaling->handle_offer(parse_offer(kOfferBody));
    h.signaling->handle_offer(parse_offer(kOfferBody));

    h.signaling->close_all();
    EXPECT_EQ(h.signaling->active_count(), 0u);
    EXPECT_EQ(h.probe(0)->close_calls.load(), 1);
    EXPECT_EQ(h.probe(1)->close_calls.load(), 1);
}

TEST(SignalingService, ConnectionsListReportsState) {
    FakeDetector det;
    Harness h(chain_with(&det));
    auto outcome = h.signaling->handle_offer(parse_offer(kOfferBody));
    h.probe(0)->fire(TransportEvent::Connected);
    ASSERT_TRUE(wait_until([&] {
        auto list = h.signaling->connections();
        return list.size() == 1 && list[0].state == ConnectionState::Connected;
    }));
    EXPECT_EQ(h.signaling->connections()[0].id, outcome.connection_id);
}
