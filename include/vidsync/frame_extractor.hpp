#pragma once

#include "vidsync/frame_source.hpp"
#include "vidsync/types.hpp"
#include <opencv2/core.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace vidsync {

using CancelFlag = std::atomic<bool>;

struct ExtractionConfig {
    float scene_threshold = 0.3f;
    double min_interval = 1.0;      // seconds
    int max_frames = 100;
    float quality_threshold = 0.5f;
    std::string output_dir;         // key frames written as JPEG when set
    bool keep_images = false;       // retain key frame pixels in the result
};

struct ExtractionResult {
    std::vector<FrameInfo> frames;
    std::vector<cv::Mat> images;    // parallel to frames when keep_images
    size_t evaluated_frames = 0;
    size_t skipped_frames = 0;
    int sample_stride = 1;
    double fps = 0.0;
    int64_t total_frame_count = -1;
};

// Evaluate at most ~10 frames per second of video.
int sample_stride(double fps);

class FrameExtractor {
public:
    explicit FrameExtractor(const ExtractionConfig& config);
    ~FrameExtractor();

    // Single forward scan selecting key frames. Throws SourceUnreadable when
    // nothing can be decoded and ExtractionCancelled when *cancel turns true.
    ExtractionResult extract_key_frames(FrameSource& source,
                                        const CancelFlag* cancel = nullptr);
    ExtractionResult extract(const std::string& video_path,
                             const CancelFlag* cancel = nullptr);

    // Evenly spaced frames; requires a known frame count.
    ExtractionResult extract_uniform(FrameSource& source, int count,
                                     const CancelFlag* cancel = nullptr);

    const ExtractionConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace vidsync
