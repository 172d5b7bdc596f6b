#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

#include "yolo_detector.hpp"

using namespace livedet;

namespace {

const std::vector<std::string> kNames{"person", "car"};

YoloDecodeOptions options(int input_size) {
    YoloDecodeOptions opts;
    opts.input_size = input_size;
    opts.conf_threshold = 0.25f;
    opts.nms_threshold = 0.45f;
    return opts;
}

std::vector<BoundingBox> sorted_by_x(std::vector<BoundingBox> boxes) {
    std::sort(boxes.begin(), boxes.end(), [](const BoundingBox& a, const BoundingBox& b) { return a.x < b.x; });
    return boxes;
}

// Row-major [rows, 5+C]: cx, cy, w, h, objectness, class scores...
struct V5Tensor {
    static constexpr int kDims = 7;
    static constexpr int kRows = 8;
    std::vector<float> data = std::vector<float>(kRows * kDims, 0.0f);

    void set(int row, std::vector<float> values) {
        std::copy(values.begin(), values.end(), data.begin() + row * kDims);
    }
};

// Channel-first [4+C, N]: attribute a of box i lives at a * N + i.
struct V8Tensor {
    static constexpr int kDims = 6;
    static constexpr int kBoxes = 8;
    std::vector<float> data = std::vector<float>(kBoxes * kDims, 0.0f);

    void set(int box, std::vector<float> values) {
        for (int a = 0; a < static_cast<int>(values.size()); ++a) data[a * kBoxes + box] = values[a];
    }
};

}  // namespace

TEST(YoloDecode, V5LayoutAppliesObjectnessNmsAndClamping) {
    V5Tensor t;
    t.set(0, {50, 50, 20, 20, 0.9f, 0.9f, 0.1f});   // person, kept
    t.set(1, {52, 50, 20, 20, 0.8f, 0.9f, 0.0f});   // overlaps row 0
    t.set(2, {95, 10, 20, 10, 0.8f, 0.0f, 0.9f});   // car, crosses the right edge
    t.set(3, {20, 80, 10, 10, 0.1f, 0.9f, 0.0f});   // low objectness

    auto boxes = sorted_by_x(decode_yolo_output(t.data.data(), {1, V5Tensor::kRows, V5Tensor::kDims},
                                                100, 100, options(100), kNames));
    ASSERT_EQ(boxes.size(), 2u);

    EXPECT_EQ(boxes[0].cls, "person");
    EXPECT_EQ(boxes[0].x, 40);
    EXPECT_EQ(boxes[0].y, 40);
    EXPECT_EQ(boxes[0].w, 20);
    EXPECT_EQ(boxes[0].h, 20);
    EXPECT_NEAR(boxes[0].confidence, 0.81f, 1e-4);

    EXPECT_EQ(boxes[1].cls, "car");
    EXPECT_EQ(boxes[1].x, 85);
    EXPECT_EQ(boxes[1].y, 5);
    EXPECT_EQ(boxes[1].w, 15);
    EXPECT_EQ(boxes[1].h, 10);
}

TEST(YoloDecode, V8LayoutScalesToFrameAndClamps) {
    V8Tensor t;
    t.set(0, {50, 50, 20, 20, 0.9f, 0.05f});   // person
    t.set(1, {51, 51, 20, 20, 0.8f, 0.0f});    // overlaps box 0
    t.set(2, {5, 95, 20, 20, 0.0f, 0.7f});     // car, crosses the bottom-left corner
    t.set(3, {70, 20, 10, 10, 0.1f, 0.0f});    // below threshold

    // 200x100 frame from a 100x100 model input: x doubles, y is unchanged.
    auto boxes = sorted_by_x(decode_yolo_output(t.data.data(), {1, V8Tensor::kDims, V8Tensor::kBoxes},
                                                200, 100, options(100), kNames));
    ASSERT_EQ(boxes.size(), 2u);

    EXPECT_EQ(boxes[0].cls, "car");
    EXPECT_EQ(boxes[0].x, 0);
    EXPECT_EQ(boxes[0].y, 85);
    EXPECT_EQ(boxes[0].w, 30);
    EXPECT_EQ(boxes[0].h, 15);
    EXPECT_NEAR(boxes[0].confidence, 0.7f, 1e-4);

    EXPECT_EQ(boxes[1].cls, "person");
    EXPECT_EQ(boxes[1].x, 80);
    EXPECT_EQ(boxes[1].y, 40);
    EXPECT_EQ(boxes[1].w, 40);
    EXPECT_EQ(boxes[1].h, 20);
    EXPECT_NEAR(boxes[1].confidence, 0.9f, 1e-4);
}

TEST(YoloDecode, UnknownClassGetsNumericLabel) {
    V5Tensor t;
    t.set(0, {50, 50, 20, 20, 0.9f, 0.0f, 0.9f});
    auto boxes = decode_yolo_output(t.data.data(), {V5Tensor::kRows, V5Tensor::kDims}, 100, 100, options(100),
                                    {"person"});
    ASSERT_EQ(boxes.size(), 1u);
    EXPECT_EQ(boxes[0].cls, "class_1");
}

TEST(YoloDecode, BoxEntirelyOutsideFrameIsDropped) {
    V5Tensor t;
    t.set(0, {150, 150, 10, 10, 0.9f, 0.9f, 0.0f});
    EXPECT_TRUE(decode_yolo_output(t.data.data(), {1, V5Tensor::kRows, V5Tensor::kDims}, 100, 100,
                                   options(100), kNames).empty());
}

TEST(YoloDecode, UnsupportedShapeYieldsNothing) {
    std::vector<float> data(16, 0.5f);
    EXPECT_TRUE(decode_yolo_output(data.data(), {1, 1, 4, 4}, 100, 100, options(100), kNames).empty());
}
