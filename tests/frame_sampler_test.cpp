#include <gtest/gtest.h>

#include <vector>

#include "fakes.hpp"
#include "frame_sampler.hpp"

using livedet::FrameSampler;
using livedet::testing::test_frame;

TEST(FrameSampler, ForwardsEveryFifthFrameStartingAtZero) {
    FrameSampler sampler(5);
    std::vector<uint64_t> forwarded;
    for (uint64_t seq = 0; seq <= 10; ++seq) {
        if (sampler.offer(test_frame(seq))) forwarded.push_back(sampler.last_index());
    }
    EXPECT_EQ(forwarded, (std::vector<uint64_t>{0, 5, 10}));
    EXPECT_EQ(sampler.frames_seen(), 11u);
    EXPECT_EQ(sampler.frames_forwarded(), 3u);
}

TEST(FrameSampler, IntervalOneForwardsEverything) {
    FrameSampler sampler(1);
    for (uint64_t seq = 0; seq < 4; ++seq) EXPECT_TRUE(sampler.offer(test_frame(seq)));
}

TEST(FrameSampler, NonPositiveIntervalIsClampedToOne) {
    FrameSampler sampler(0);
    EXPECT_EQ(sampler.interval(), 1);
    EXPECT_TRUE(sampler.offer(test_frame(0)));
    EXPECT_TRUE(sampler.offer(test_frame(1)));
}

TEST(FrameSampler, CountsArrivalOrderNotSourceSequence) {
    FrameSampler sampler(3);
    // Source sequence numbers (RTP timestamps) are irrelevant to the gate.
    EXPECT_TRUE(sampler.offer(test_frame(9000)));
    EXPECT_FALSE(sampler.offer(test_frame(12000)));
    EXPECT_FALSE(sampler.offer(test_frame(15000)));
    EXPECT_TRUE(sampler.offer(test_frame(18000)));
    EXPECT_EQ(sampler.last_index(), 3u);
}
