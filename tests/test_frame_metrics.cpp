#include <gtest/gtest.h>
#include "vidsync/frame_metrics.hpp"
#include <opencv2/imgproc.hpp>

namespace vidsync {

class FrameMetricsTest : public ::testing::Test {
protected:
    void SetUp() override {
        cv::RNG rng(1234);
        base_ = cv::Mat(240, 320, CV_8UC1);
        rng.fill(base_, cv::RNG::NORMAL, 128, 40);
    }

    cv::Mat base_;
};

TEST_F(FrameMetricsTest, GrayscaleConversion) {
    cv::Mat bgr(10, 10, CV_8UC3, cv::Scalar(50, 50, 50));
    cv::Mat bgra(10, 10, CV_8UC4, cv::Scalar(50, 50, 50, 255));
    cv::Mat wide(10, 10, CV_16UC1, cv::Scalar(50));

    EXPECT_EQ(to_grayscale(bgr).type(), CV_8UC1);
    EXPECT_EQ(to_grayscale(bgra).type(), CV_8UC1);
    EXPECT_EQ(to_grayscale(wide).type(), CV_8UC1);
    EXPECT_EQ(to_grayscale(bgr).at<uchar>(5, 5), 50);
    EXPECT_THROW(to_grayscale(cv::Mat()), std::invalid_argument);
}

TEST_F(FrameMetricsTest, FlatFrameQuality) {
    cv::Mat flat(100, 100, CV_8UC1, cv::Scalar(255));
    auto q = assess_quality(flat);

    EXPECT_FLOAT_EQ(q.brightness, 255.0f);
    EXPECT_FLOAT_EQ(q.contrast, 0.0f);
    EXPECT_FLOAT_EQ(q.sharpness, 0.0f);
    EXPECT_NEAR(q.quality_score, 0.3f, 1e-5);
}

TEST_F(FrameMetricsTest, TexturedFrameScoresHigher) {
    cv::Mat flat(240, 320, CV_8UC1, cv::Scalar(128));
    auto flat_q = assess_quality(flat);
    auto textured_q = assess_quality(base_);

    EXPECT_GT(textured_q.contrast, 30.0f);
    EXPECT_GT(textured_q.sharpness, 0.5f);
    EXPECT_GT(textured_q.quality_score, flat_q.quality_score);
    EXPECT_GE(textured_q.quality_score, 0.0f);
    EXPECT_LE(textured_q.quality_score, 1.0f);
}

TEST_F(FrameMetricsTest, IdenticalFramesHaveZeroSceneScore) {
    EXPECT_NEAR(scene_change_score(base_, base_.clone()), 0.0f, 1e-6);
}

TEST_F(FrameMetricsTest, SceneScoreGrowsWithDifference) {
    cv::Mat shifted;
    base_.convertTo(shifted, -1, 1.0, 5.0);

    cv::RNG rng(99);
    cv::Mat noise(base_.size(), CV_8UC1);
    rng.fill(noise, cv::RNG::UNIFORM, 0, 256);

    float small = scene_change_score(base_, shifted);
    float large = scene_change_score(base_, noise);

    EXPECT_GT(small, 0.0f);
    EXPECT_LT(small, 0.3f);
    EXPECT_GT(large, small);
    EXPECT_GT(large, 0.3f);
    EXPECT_LE(large, 1.0f);
}

TEST_F(FrameMetricsTest, SceneScoreRejectsMismatchedInput) {
    cv::Mat bgr(240, 320, CV_8UC3, cv::Scalar(1, 2, 3));
    EXPECT_THROW(scene_change_score(base_, bgr), std::invalid_argument);
}

TEST_F(FrameMetricsTest, ContentHashStableUnderBrightnessShift) {
    cv::Mat shifted;
    base_.convertTo(shifted, -1, 1.0, 10.0);

    ContentHash a = content_hash(base_);
    ContentHash b = content_hash(shifted);

    EXPECT_LE(hamming_distance(a, b), 4);
    EXPECT_EQ(hamming_distance(a, a), 0);
}

TEST_F(FrameMetricsTest, ContentHashDistinguishesLayouts) {
    cv::Mat left(64, 64, CV_8UC1, cv::Scalar(0));
    cv::rectangle(left, cv::Rect(0, 0, 32, 64), cv::Scalar(255), -1);
    cv::Mat top(64, 64, CV_8UC1, cv::Scalar(0));
    cv::rectangle(top, cv::Rect(0, 0, 64, 32), cv::Scalar(255), -1);

    EXPECT_EQ(hamming_distance(content_hash(left), content_hash(top)), 32);
}

TEST_F(FrameMetricsTest, HexEncoding) {
    ContentHash hash{0x01, 0x23, 0x45, 0x67, 0x89, 0xab, 0xcd, 0xef};

    EXPECT_EQ(to_hex(hash), "0123456789abcdef");
    EXPECT_EQ(hash_from_hex("0123456789ABCDEF"), hash);
    EXPECT_THROW(hash_from_hex("0123"), std::invalid_argument);
    EXPECT_THROW(hash_from_hex("0123456789abcdeg"), std::invalid_argument);
}

TEST_F(FrameMetricsTest, HexRejectsSignsAndSpaces) {
    EXPECT_THROW(hash_from_hex("-10123456789abcd"), std::invalid_argument);
    EXPECT_THROW(hash_from_hex("+f0123456789abcd"), std::invalid_argument);
    EXPECT_THROW(hash_from_hex(" f0123456789abcd"), std::invalid_argument);
    EXPECT_THROW(hash_from_hex("0123456789abcd0x"), std::invalid_argument);
}

} // namespace vidsync
