#include "vidsync/frame_extractor.hpp"
#include "vidsync/errors.hpp"
#include "vidsync/frame_metrics.hpp"
#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace vidsync {

namespace {

constexpr double kMaxEvaluatedPerSecond = 10.0;
constexpr double kTimeEpsilon = 1e-9;
constexpr int kJpegQuality = 90;

// Policy multiples of min_interval.
constexpr double kHighQualityGap = 2.0;
constexpr double kPeriodicGap = 5.0;

struct Candidate {
    FramePacket packet;
    cv::Mat gray;
    QualityMetrics quality;
    float scene_score = 0.0f;
    bool first = false;
};

void validate(const ExtractionConfig& config) {
    if (config.max_frames < 1) {
        throw std::invalid_argument("max_frames must be at least 1");
    }
    if (!std::isfinite(config.min_interval) || config.min_interval < 0.0) {
        throw std::invalid_argument("min_interval must be a non-negative number of seconds");
    }
    if (!(config.scene_threshold >= 0.0f && config.scene_threshold <= 1.0f)) {
        throw std::invalid_argument("scene_threshold must be in [0, 1]");
    }
    if (!(config.quality_threshold >= 0.0f && config.quality_threshold <= 1.0f)) {
        throw std::invalid_argument("quality_threshold must be in [0, 1]");
    }
}

} // namespace

int sample_stride(double fps) {
    if (!(fps > 0.0) || !std::isfinite(fps)) {
        return 1;
    }
    return std::max(1, static_cast<int>(fps / kMaxEvaluatedPerSecond));
}

class FrameExtractor::Impl {
public:
    explicit Impl(const ExtractionConfig& config) : config_(config) {
        validate(config_);
    }

    ExtractionResult extract_key_frames(FrameSource& source, const CancelFlag* cancel) {
        ExtractionResult result;
        result.fps = source.fps();
        result.sample_stride = sample_stride(result.fps);
        result.total_frame_count = source.total_frame_count();
        prepare_output_dir();

        const int64_t stride = result.sample_stride;
        const int64_t total = result.total_frame_count;
        const int64_t last_evaluated_index = total > 0 ? ((total - 1) / stride) * stride : -1;
        const size_t max_frames = static_cast<size_t>(config_.max_frames);

        std::optional<Candidate> pending;
        cv::Mat prev_gray;
        FramePacket packet;
        last_selected_time_ = 0.0;

        for (int64_t index = 0; result.frames.size() < max_frames; ++index) {
            bool evaluate = index % stride == 0;

            // Only the VideoEnd slot is left: jump straight to the final frame.
            if (evaluate && !result.frames.empty() && result.frames.size() + 1 >= max_frames &&
                last_evaluated_index >= 0 && index < last_evaluated_index) {
                evaluate = false;
            }

            if (!evaluate) {
                if (!source.skip()) break;
                continue;
            }

            if (cancel && cancel->load()) {
                std::cerr << "[FrameExtractor] Cancelled at frame " << index
                          << " with " << result.frames.size() << " key frames selected" << std::endl;
                throw ExtractionCancelled(std::move(result.frames));
            }

            const ReadStatus status = source.next(packet);
            if (status == ReadStatus::EndOfStream) break;
            if (status == ReadStatus::DecodeError) {
                ++result.skipped_frames;
                std::cerr << "[FrameExtractor] Skipping undecodable frame " << index
                          << " of " << source.id() << std::endl;
                continue;
            }

            Candidate candidate = evaluate_frame(packet, prev_gray);
            candidate.first = result.evaluated_frames == 0;
            prev_gray = candidate.gray;
            ++result.evaluated_frames;

            if (pending) {
                decide(*pending, false, source.id(), result);
            }
            pending = std::move(candidate);
        }

        if (pending) {
            decide(*pending, true, source.id(), result);
        }

        if (result.evaluated_frames == 0) {
            throw SourceUnreadable("No decodable frames in " + source.id());
        }

        std::cout << "[FrameExtractor] Selected " << result.frames.size() << " key frames from "
                  << result.evaluated_frames << " evaluated frames (stride " << result.sample_stride
                  << ", " << result.skipped_frames << " skipped)" << std::endl;
        return result;
    }

    ExtractionResult extract_uniform(FrameSource& source, int count, const CancelFlag* cancel) {
        if (count < 1) {
            throw std::invalid_argument("uniform sample count must be at least 1");
        }
        const int64_t total = source.total_frame_count();
        if (total <= 0) {
            throw SourceUnreadable("Frame count unavailable for uniform sampling of " + source.id());
        }

        std::vector<int64_t> positions;
        positions.reserve(static_cast<size_t>(count));
        for (int64_t i = 0; i < count; ++i) {
            positions.push_back(std::min(total - 1, (i + 1) * total / (count + 1)));
        }
        positions.erase(std::unique(positions.begin(), positions.end()), positions.end());

        ExtractionResult result;
        result.fps = source.fps();
        result.total_frame_count = total;
        result.sample_stride = static_cast<int>(std::max<int64_t>(1, total / (count + 1)));
        prepare_output_dir();

        cv::Mat prev_gray;
        FramePacket packet;
        int64_t index = 0;
        bool exhausted = false;

        for (int64_t position : positions) {
            while (index < position && !exhausted) {
                exhausted = !source.skip();
                ++index;
            }
            if (exhausted) break;

            if (cancel && cancel->load()) {
                throw ExtractionCancelled(std::move(result.frames));
            }

            const ReadStatus status = source.next(packet);
            ++index;
            if (status == ReadStatus::EndOfStream) break;
            if (status == ReadStatus::DecodeError) {
                ++result.skipped_frames;
                std::cerr << "[FrameExtractor] Skipping undecodable frame " << position
                          << " of " << source.id() << std::endl;
                continue;
            }

            Candidate candidate = evaluate_frame(packet, prev_gray);
            prev_gray = candidate.gray;
            ++result.evaluated_frames;
            select(candidate, KeyFrameReason::UniformSample, source.id(), result);
        }

        if (result.evaluated_frames == 0) {
            throw SourceUnreadable("No decodable frames in " + source.id());
        }

        std::cout << "[FrameExtractor] Uniform sampling produced " << result.frames.size()
                  << " frames" << std::endl;
        return result;
    }

    const ExtractionConfig& get_config() const { return config_; }

private:
    Candidate evaluate_frame(const FramePacket& packet, const cv::Mat& prev_gray) const {
        Candidate candidate;
        candidate.packet = packet;
        candidate.gray = to_grayscale(packet.image);
        candidate.quality = assess_quality(candidate.gray);
        candidate.scene_score = prev_gray.empty() ? 0.0f
                                                  : scene_change_score(prev_gray, candidate.gray);
        return candidate;
    }

    void decide(const Candidate& candidate, bool is_last, const std::string& source_id,
                ExtractionResult& result) {
        const size_t max_frames = static_cast<size_t>(config_.max_frames);
        if (result.frames.size() >= max_frames) {
            return;
        }

        std::optional<KeyFrameReason> reason;
        if (candidate.first) {
            reason = KeyFrameReason::VideoStart;
        } else if (is_last) {
            reason = KeyFrameReason::VideoEnd;
        } else if (result.frames.size() + 1 < max_frames) {
            const double since_last = candidate.packet.timestamp - last_selected_time_;
            const double min_interval = config_.min_interval;

            if (since_last + kTimeEpsilon < min_interval) {
                return;
            }
            if (candidate.scene_score > config_.scene_threshold) {
                reason = KeyFrameReason::SceneChange;
            } else if (candidate.quality.quality_score > config_.quality_threshold &&
                       since_last + kTimeEpsilon >= kHighQualityGap * min_interval) {
                reason = KeyFrameReason::HighQuality;
            } else if (since_last + kTimeEpsilon >= kPeriodicGap * min_interval) {
                reason = KeyFrameReason::PeriodicSample;
            }
        }

        if (reason) {
            select(candidate, *reason, source_id, result);
        }
    }

    void select(const Candidate& candidate, KeyFrameReason reason, const std::string& source_id,
                ExtractionResult& result) {
        FrameInfo info;
        info.frame_number = candidate.packet.frame_number;
        info.timestamp = candidate.packet.timestamp;
        info.scene_change_score = candidate.scene_score;
        info.quality_score = candidate.quality.quality_score;
        info.is_key_frame = true;
        info.key_frame_reason = reason;
        info.brightness = candidate.quality.brightness;
        info.contrast = candidate.quality.contrast;
        info.sharpness = candidate.quality.sharpness;
        info.content_hash = content_hash(candidate.gray);
        info.frame_path = write_key_frame(candidate.packet, source_id, reason);

        if (config_.keep_images) {
            result.images.push_back(candidate.packet.image);
        }
        result.frames.push_back(std::move(info));
        last_selected_time_ = candidate.packet.timestamp;
    }

    void prepare_output_dir() const {
        if (config_.output_dir.empty()) {
            return;
        }
        std::error_code ec;
        std::filesystem::create_directories(config_.output_dir, ec);
        if (ec) {
            throw std::runtime_error("Cannot create key frame directory " + config_.output_dir +
                                     ": " + ec.message());
        }
    }

    std::optional<std::string> write_key_frame(const FramePacket& packet,
                                               const std::string& source_id,
                                               KeyFrameReason reason) const {
        if (config_.output_dir.empty()) {
            return std::nullopt;
        }

        const std::string stem = std::filesystem::path(source_id).stem().string();
        char number[32];
        std::snprintf(number, sizeof(number), "%06lld", static_cast<long long>(packet.frame_number));
        const std::string prefix = reason == KeyFrameReason::UniformSample ? "uniform_" : "frame_";
        const std::filesystem::path path =
            std::filesystem::path(config_.output_dir) / (prefix + stem + "_" + number + ".jpg");

        try {
            if (cv::imwrite(path.string(), packet.image, {cv::IMWRITE_JPEG_QUALITY, kJpegQuality})) {
                return path.string();
            }
            std::cerr << "[FrameExtractor] Failed to write key frame " << path << std::endl;
        } catch (const cv::Exception& e) {
            std::cerr << "[FrameExtractor] Failed to write key frame " << path << ": "
                      << e.what() << std::endl;
        }
        return std::nullopt;
    }

    ExtractionConfig config_;
    double last_selected_time_ = 0.0;
};

FrameExtractor::FrameExtractor(const ExtractionConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

FrameExtractor::~FrameExtractor() = default;

ExtractionResult FrameExtractor::extract_key_frames(FrameSource& source, const CancelFlag* cancel) {
    return pimpl_->extract_key_frames(source, cancel);
}

ExtractionResult FrameExtractor::extract(const std::string& video_path, const CancelFlag* cancel) {
    VideoCaptureSource source(video_path);

    std::cout << "[FrameExtractor] Extracting key frames from " << video_path
              << " (total frames: " << source.total_frame_count()
              << ", fps: " << source.fps() << ")" << std::endl;

    return pimpl_->extract_key_frames(source, cancel);
}

ExtractionResult FrameExtractor::extract_uniform(FrameSource& source, int count,
                                                 const CancelFlag* cancel) {
    return pimpl_->extract_uniform(source, count, cancel);
}

const ExtractionConfig& FrameExtractor::config() const {
    return pimpl_->get_config();
}

} // namespace vidsync
