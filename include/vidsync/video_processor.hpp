#pragma once

#include "vidsync/annotation.hpp"
#include "vidsync/frame_extractor.hpp"
#include "vidsync/frame_source.hpp"
#include "vidsync/timeline_aligner.hpp"
#include "vidsync/types.hpp"
#include <algorithm>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace vidsync {

struct AnalysisConfig {
    ExtractionConfig extraction;
    AlignmentConfig alignment;
    int num_threads = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
};

// (phase, percent 0..100, message). Phases: extract, annotate, transcribe, align, done.
using ProgressCallback = std::function<void(const std::string&, float, const std::string&)>;

struct MultimodalReport {
    std::string video_path;
    ExtractionResult extraction;
    std::vector<VisualEvent> visual_events;
    std::vector<AudioEvent> audio_events;
    std::vector<EmotionEvent> emotion_events;
    AlignmentResult alignment;
    size_t annotation_failures = 0;
    std::optional<std::string> transcription_error;
    std::chrono::milliseconds processing_time{0};
};

struct AnalysisJob {
    std::string video_path;
    std::shared_ptr<VisualAnnotator> annotator;
    std::shared_ptr<Transcriber> transcriber;   // may be null: no audio
};

struct BatchResult {
    std::map<std::string, MultimodalReport> reports;
    std::map<std::string, std::string> errors;
};

class VideoProcessor {
public:
    explicit VideoProcessor(const AnalysisConfig& config = {});
    ~VideoProcessor();

    VideoInfo get_video_info(const std::string& video_path);
    ExtractionResult extract_key_frames(const std::string& video_path,
                                        const CancelFlag* cancel = nullptr);

    MultimodalReport analyze_video(const std::string& video_path,
                                   VisualAnnotator& annotator,
                                   Transcriber* transcriber = nullptr,
                                   const ProgressCallback& progress = nullptr,
                                   const CancelFlag* cancel = nullptr);

    // Same pipeline over an already opened source; media_path is what the
    // transcriber receives.
    MultimodalReport analyze_source(FrameSource& source,
                                    const std::string& media_path,
                                    VisualAnnotator& annotator,
                                    Transcriber* transcriber = nullptr,
                                    const ProgressCallback& progress = nullptr,
                                    const CancelFlag* cancel = nullptr);

    // Independent videos run concurrently; a failed video lands in errors.
    BatchResult batch_analyze(const std::vector<AnalysisJob>& jobs);

    const AnalysisConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace vidsync
