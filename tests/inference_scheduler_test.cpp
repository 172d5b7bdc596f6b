#include <gtest/gtest.h>

#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "fakes.hpp"
#include "inference_scheduler.hpp"
#include "model_registry.hpp"

using namespace livedet;
using livedet::testing::FakeDetector;
using livedet::testing::chain_with;
using livedet::testing::deferred_frame;
using livedet::testing::test_frame;
using livedet::testing::wait_until;

namespace {

struct Collected {
    std::mutex mu;
    std::vector<std::pair<std::string, DetectionResult>> results;

    InferenceScheduler::ResultHandler handler() {
        return [this](const std::string& id, DetectionResult r) {
            std::lock_guard<std::mutex> lock(mu);
            results.emplace_back(id, std::move(r));
        };
    }
    std::size_t size() {
        std::lock_guard<std::mutex> lock(mu);
        return results.size();
    }
};

}  // namespace

TEST(InferenceScheduler, DeliversResultWithFrameIndexAndSize) {
    FakeDetector det({BoundingBox{5, 6, 7, 8, "car", 0.5f}});
    ModelRegistry registry(chain_with(&det));
    Collected out;
    InferenceScheduler scheduler(registry, 2, out.handler());

    ASSERT_TRUE(scheduler.submit("pc-1", 10, test_frame(0, 320, 240)));
    ASSERT_TRUE(wait_until([&] { return out.size() == 1; }));

    std::lock_guard<std::mutex> lock(out.mu);
    EXPECT_EQ(out.results[0].first, "pc-1");
    EXPECT_EQ(out.results[0].second.frame_index, 10u);
    EXPECT_EQ(out.results[0].second.width, 320);
    EXPECT_EQ(out.results[0].second.height, 240);
    ASSERT_EQ(out.results[0].second.boxes.size(), 1u);
    EXPECT_EQ(out.results[0].second.boxes[0].cls, "car");
}

TEST(InferenceScheduler, ScenarioE_SecondSubmissionWhileInFlightIsDropped) {
    FakeDetector det;
    det.hold();
    ModelRegistry registry(chain_with(&det));
    Collected out;
    InferenceScheduler scheduler(registry, 2, out.handler());

    ASSERT_TRUE(scheduler.submit("pc-1", 0, test_frame(0)));
    ASSERT_TRUE(det.wait_entered(1));
    EXPECT_TRUE(scheduler.in_flight("pc-1"));
    EXPECT_FALSE(scheduler.submit("pc-1", 5, test_frame(5)));
    EXPECT_EQ(scheduler.dropped(), 1u);

    det.release();
    ASSERT_TRUE(wait_until([&] { return out.size() == 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    std::lock_guard<std::mutex> lock(out.mu);
    ASSERT_EQ(out.results.size(), 1u);
    EXPECT_EQ(out.results[0].second.frame_index, 0u);
    EXPECT_EQ(det.calls(), 1);
}

TEST(InferenceScheduler, SlotFreesAfterCompletion) {
    FakeDetector det;
    ModelRegistry registry(chain_with(&det));
    Collected out;
    InferenceScheduler scheduler(registry, 1, out.handler());

    ASSERT_TRUE(scheduler.submit("pc-1", 0, test_frame(0)));
    ASSERT_TRUE(wait_until([&] { return !scheduler.in_flight("pc-1") && out.size() == 1; }));
    EXPECT_TRUE(scheduler.submit("pc-1", 5, test_frame(5)));
    ASSERT_TRUE(wait_until([&] { return out.size() == 2; }));
}

TEST(InferenceScheduler, ConnectionsDoNotBlockEachOther) {
    FakeDetector det;
    det.hold();
    ModelRegistry registry(chain_with(&det));
    Collected out;
    InferenceScheduler scheduler(registry, 2, out.handler());

    EXPECT_TRUE(scheduler.submit("pc-1", 0, test_frame(0)));
    EXPECT_TRUE(scheduler.submit("pc-2", 0, test_frame(0)));
    ASSERT_TRUE(det.wait_entered(2));
    EXPECT_EQ(scheduler.in_flight_count(), 2u);
    det.release();
    ASSERT_TRUE(wait_until([&] { return out.size() == 2; }));
}

TEST(InferenceScheduler, ConcurrentBurstKeepsOneInFlightPerConnection) {
    FakeDetector det;
    det.hold();
    ModelRegistry registry(chain_with(&det));
    Collected out;
    InferenceScheduler scheduler(registry, 4, out.handler());

    std::atomic<int> accepted{0};
    std::vector<std::thread> submitters;
    for (int t = 0; t < 4; ++t) {
        submitters.emplace_back([&, t] {
            for (int i = 0; i < 25; ++i) {
                if (scheduler.submit("pc-burst", static_cast<uint64_t>(t * 100 + i), test_frame(i))) ++accepted;
            }
        });
    }
    for (auto& s : submitters) s.join();

    EXPECT_EQ(accepted.load(), 1);
    EXPECT_EQ(scheduler.dropped(), 99u);
    det.release();
    ASSERT_TRUE(wait_until([&] { return out.size() == 1; }));
}

TEST(InferenceScheduler, DetectorFailureYieldsEmptyResult) {
    FakeDetector det({BoundingBox{0, 0, 1, 1, "x", 0.9f}});
    det.set_throw(true);
    ModelRegistry registry(chain_with(&det));
    Collected out;
    InferenceScheduler scheduler(registry, 1, out.handler());

    ASSERT_TRUE(scheduler.submit("pc-1", 3, test_frame(3)));
    ASSERT_TRUE(wait_until([&] { return out.size() == 1; }));
    EXPECT_EQ(scheduler.failures(), 1u);
    std::lock_guard<std::mutex> lock(out.mu);
    EXPECT_TRUE(out.results[0].second.boxes.empty());
    EXPECT_EQ(out.results[0].second.frame_index, 3u);
}

TEST(InferenceScheduler, CancelledResultIsNotDelivered) {
    FakeDetector det;
    det.hold();
    ModelRegistry registry(chain_with(&det));
    Collected out;
    InferenceScheduler scheduler(registry, 1, out.handler());

    ASSERT_TRUE(scheduler.submit("pc-1", 0, test_frame(0)));
    ASSERT_TRUE(det.wait_entered(1));
    scheduler.cancel("pc-1");
    EXPECT_FALSE(scheduler.in_flight("pc-1"));
    det.release();
    scheduler.shutdown();
    EXPECT_EQ(out.size(), 0u);
}

TEST(InferenceScheduler, SubmitAfterShutdownIsRejected) {
    FakeDetector det;
    ModelRegistry registry(chain_with(&det));
    Collected out;
    InferenceScheduler scheduler(registry, 1, out.handler());
    scheduler.shutdown();
    EXPECT_FALSE(scheduler.submit("pc-1", 0, test_frame(0)));
    scheduler.shutdown();
}

TEST(InferenceScheduler, DeferredFrameIsConvertedOnWorker) {
    FakeDetector det;
    ModelRegistry registry(chain_with(&det));
    Collected out;
    InferenceScheduler scheduler(registry, 1, out.handler());

    auto conversions = std::make_shared<std::atomic<int>>(0);
    ASSERT_TRUE(scheduler.submit("pc-1", 0, deferred_frame(0, conversions, 160, 120)));
    ASSERT_TRUE(wait_until([&] { return out.size() == 1; }));
    EXPECT_EQ(conversions->load(), 1);
    EXPECT_EQ(det.calls(), 1);
    EXPECT_EQ(scheduler.failures(), 0u);
}

TEST(InferenceScheduler, FrameThatFailsConversionYieldsEmptyResult) {
    FakeDetector det;
    ModelRegistry registry(chain_with(&det));
    Collected out;
    InferenceScheduler scheduler(registry, 1, out.handler());

    Frame frame;
    frame.width = 8;
    frame.height = 8;
    frame.convert = [] { return cv::Mat(); };
    ASSERT_TRUE(scheduler.submit("pc-1", 7, frame));
    ASSERT_TRUE(wait_until([&] { return out.size() == 1; }));
    EXPECT_EQ(det.calls(), 0);
    EXPECT_EQ(scheduler.failures(), 1u);
    std::lock_guard<std::mutex> lock(out.mu);
    EXPECT_TRUE(out.results[0].second.boxes.empty());
    EXPECT_EQ(out.results[0].second.width, 8);
}
