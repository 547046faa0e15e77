#include "vidsync/frame_metrics.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <bitset>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace vidsync {

namespace {

constexpr int kHistogramBins = 256;

constexpr double kBrightnessScale = 255.0;
constexpr double kContrastScale = 100.0;
constexpr double kSharpnessScale = 1000.0;

constexpr double kBrightnessWeight = 0.3;
constexpr double kContrastWeight = 0.3;
constexpr double kSharpnessWeight = 0.4;

constexpr double kHistogramWeight = 0.5;
constexpr double kMeanDeltaWeight = 0.3;
constexpr double kVarianceDeltaWeight = 0.2;

inline double clamp01(double x) {
    if (!std::isfinite(x)) return 0.0;
    return std::clamp(x, 0.0, 1.0);
}

cv::Mat gray_histogram(const cv::Mat& gray) {
    const int channels[] = {0};
    const int hist_size[] = {kHistogramBins};
    const float range[] = {0.0f, 256.0f};
    const float* ranges[] = {range};

    cv::Mat hist;
    cv::calcHist(&gray, 1, channels, cv::Mat(), hist, 1, hist_size, ranges);
    return hist;
}

void mean_and_variance(const cv::Mat& gray, double& mean, double& variance) {
    cv::Scalar m, s;
    cv::meanStdDev(gray, m, s);
    mean = m[0];
    variance = s[0] * s[0];
}

void require_gray(const cv::Mat& gray, const char* what) {
    if (gray.empty()) {
        throw std::invalid_argument(std::string(what) + ": empty image");
    }
    if (gray.type() != CV_8UC1) {
        throw std::invalid_argument(std::string(what) + ": expected 8-bit grayscale");
    }
}

} // namespace

cv::Mat to_grayscale(const cv::Mat& image) {
    if (image.empty()) {
        throw std::invalid_argument("to_grayscale: empty image");
    }

    cv::Mat gray;
    switch (image.channels()) {
        case 1:
            gray = image;
            break;
        case 3:
            cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
            break;
        case 4:
            cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
            break;
        default:
            throw std::invalid_argument("to_grayscale: unsupported channel count " +
                                        std::to_string(image.channels()));
    }

    if (gray.depth() != CV_8U) {
        cv::Mat converted;
        // 16-bit sources are rescaled, float sources are assumed to be 0..1.
        const double scale = gray.depth() == CV_16U ? 1.0 / 257.0
                           : (gray.depth() == CV_32F || gray.depth() == CV_64F) ? 255.0
                           : 1.0;
        gray.convertTo(converted, CV_8U, scale);
        gray = converted;
    }
    return gray;
}

QualityMetrics assess_quality(const cv::Mat& gray) {
    require_gray(gray, "assess_quality");

    QualityMetrics metrics;
    double mean = 0.0;
    double variance = 0.0;
    mean_and_variance(gray, mean, variance);

    cv::Mat laplacian;
    cv::Laplacian(gray, laplacian, CV_64F);
    cv::Scalar lap_mean, lap_stddev;
    cv::meanStdDev(laplacian, lap_mean, lap_stddev);
    const double lap_variance = lap_stddev[0] * lap_stddev[0];

    metrics.brightness = static_cast<float>(mean);
    metrics.contrast = static_cast<float>(std::sqrt(variance));
    metrics.sharpness = static_cast<float>(std::min(1.0, lap_variance / kSharpnessScale));

    const double score = kBrightnessWeight * clamp01(mean / kBrightnessScale) +
                         kContrastWeight * clamp01(std::sqrt(variance) / kContrastScale) +
                         kSharpnessWeight * clamp01(lap_variance / kSharpnessScale);
    metrics.quality_score = static_cast<float>(clamp01(score));
    return metrics;
}

float scene_change_score(const cv::Mat& prev_gray, const cv::Mat& curr_gray) {
    require_gray(prev_gray, "scene_change_score");
    require_gray(curr_gray, "scene_change_score");

    // compareHist reports 1.0 when either histogram has zero variance.
    const double correlation = cv::compareHist(
        gray_histogram(prev_gray), gray_histogram(curr_gray), cv::HISTCMP_CORREL);

    double prev_mean = 0.0, prev_var = 0.0;
    double curr_mean = 0.0, curr_var = 0.0;
    mean_and_variance(prev_gray, prev_mean, prev_var);
    mean_and_variance(curr_gray, curr_mean, curr_var);

    const double hist_term = 1.0 - correlation;
    const double mean_term = std::abs(prev_mean - curr_mean) / 255.0;
    const double var_term = std::abs(prev_var - curr_var) / std::max({prev_var, curr_var, 1.0});

    const double score = kHistogramWeight * hist_term +
                         kMeanDeltaWeight * mean_term +
                         kVarianceDeltaWeight * var_term;
    return static_cast<float>(clamp01(score));
}

ContentHash content_hash(const cv::Mat& gray) {
    require_gray(gray, "content_hash");

    cv::Mat cells;
    cv::resize(gray, cells, cv::Size(8, 8), 0, 0, cv::INTER_AREA);
    const double average = cv::mean(cells)[0];

    ContentHash hash{};
    for (int row = 0; row < 8; ++row) {
        uint8_t byte = 0;
        for (int col = 0; col < 8; ++col) {
            byte = static_cast<uint8_t>(byte << 1);
            if (cells.at<uint8_t>(row, col) > average) {
                byte |= 1u;
            }
        }
        hash[static_cast<size_t>(row)] = byte;
    }
    return hash;
}

int hamming_distance(const ContentHash& a, const ContentHash& b) {
    int distance = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        distance += static_cast<int>(std::bitset<8>(a[i] ^ b[i]).count());
    }
    return distance;
}

std::string to_hex(const ContentHash& hash) {
    std::string out;
    out.reserve(hash.size() * 2);
    char buf[3];
    for (uint8_t byte : hash) {
        std::snprintf(buf, sizeof(buf), "%02x", byte);
        out += buf;
    }
    return out;
}

ContentHash hash_from_hex(const std::string& hex) {
    if (hex.size() != 16) {
        throw std::invalid_argument("content hash must be 16 hex digits: " + hex);
    }
    ContentHash hash{};
    for (unsigned char c : hex) {
        if (!std::isxdigit(c)) {
            throw std::invalid_argument("invalid hex digit in content hash: " + hex);
        }
    }
    for (size_t i = 0; i < hash.size(); ++i) {
        hash[i] = static_cast<uint8_t>(std::stoul(hex.substr(i * 2, 2), nullptr, 16));
    }
    return hash;
}

} // namespace vidsync
