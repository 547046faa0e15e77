#pragma once

#include "vidsync/types.hpp"
#include <opencv2/core.hpp>
#include <string>

namespace vidsync {

struct QualityMetrics {
    float brightness = 0.0f;
    float contrast = 0.0f;
    float sharpness = 0.0f;
    float quality_score = 0.0f;
};

// Any channel count or depth to an 8-bit single channel image.
cv::Mat to_grayscale(const cv::Mat& image);

// brightness = mean, contrast = stddev, sharpness = Laplacian variance / 1000
// capped at 1; quality_score = 0.3*brightness/255 + 0.3*contrast/100 +
// 0.4*sharpness, each term and the sum clamped to [0,1].
QualityMetrics assess_quality(const cv::Mat& gray);

// Dissimilarity in [0,1] between two grayscale frames: a blend of
// histogram correlation, mean intensity delta and variance delta.
float scene_change_score(const cv::Mat& prev_gray, const cv::Mat& curr_gray);

ContentHash content_hash(const cv::Mat& gray);
int hamming_distance(const ContentHash& a, const ContentHash& b);
std::string to_hex(const ContentHash& hash);
ContentHash hash_from_hex(const std::string& hex);

} // namespace vidsync
