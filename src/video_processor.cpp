#include "vidsync/video_processor.hpp"
#include "vidsync/errors.hpp"
#include <algorithm>
#include <future>
#include <iostream>
#include <utility>

namespace vidsync {

class VideoProcessor::Impl {
public:
    explicit Impl(const AnalysisConfig& config)
        : config_(config)
        , aligner_(config.alignment) {
        if (config_.num_threads < 1) {
            config_.num_threads = 1;
        }
        // Fails fast on a bad extraction config.
        FrameExtractor probe(config_.extraction);

        std::cout << "VideoProcessor initialized with:" << std::endl;
        std::cout << "  Max frames: " << config_.extraction.max_frames << std::endl;
        std::cout << "  Scene threshold: " << config_.extraction.scene_threshold << std::endl;
        std::cout << "  Min interval: " << config_.extraction.min_interval << "s" << std::endl;
        std::cout << "  Segment duration: " << config_.alignment.segment_duration << "s" << std::endl;
        std::cout << "  Threads: " << config_.num_threads << std::endl;
    }

    VideoInfo get_video_info(const std::string& video_path) {
        return probe_video(video_path);
    }

    ExtractionResult extract_key_frames(const std::string& video_path, const CancelFlag* cancel) {
        FrameExtractor extractor(config_.extraction);
        return extractor.extract(video_path, cancel);
    }

    MultimodalReport analyze_source(FrameSource& source,
                                    const std::string& media_path,
                                    VisualAnnotator& annotator,
                                    Transcriber* transcriber,
                                    const ProgressCallback& progress,
                                    const CancelFlag* cancel) {
        auto start_time = std::chrono::high_resolution_clock::now();

        MultimodalReport report;
        report.video_path = media_path;

        // Annotation needs the pixels of every key frame.
        ExtractionConfig extraction = config_.extraction;
        extraction.keep_images = true;
        FrameExtractor extractor(extraction);

        notify(progress, "extract", 0.0f, "Extracting key frames from " + source.id());
        report.extraction = extractor.extract_key_frames(source, cancel);
        notify(progress, "extract", 100.0f,
               std::to_string(report.extraction.frames.size()) + " key frames");

        annotate(report, annotator, progress, cancel);
        report.extraction.images.clear();

        transcribe(report, transcriber, media_path, progress);

        notify(progress, "align", 0.0f, "Aligning modalities");
        report.alignment = aligner_.align(report.visual_events, report.audio_events,
                                          report.emotion_events);
        notify(progress, "align", 100.0f,
               std::to_string(report.alignment.temporal_segments.size()) + " temporal segments");

        auto end_time = std::chrono::high_resolution_clock::now();
        report.processing_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            end_time - start_time);

        notify(progress, "done", 100.0f,
               "Finished in " + std::to_string(report.processing_time.count()) + "ms");
        return report;
    }

    MultimodalReport analyze_video(const std::string& video_path,
                                   VisualAnnotator& annotator,
                                   Transcriber* transcriber,
                                   const ProgressCallback& progress,
                                   const CancelFlag* cancel) {
        VideoCaptureSource source(video_path);
        return analyze_source(source, video_path, annotator, transcriber, progress, cancel);
    }

    BatchResult batch_analyze(const std::vector<AnalysisJob>& jobs) {
        BatchResult results;
        for (const auto& job : jobs) {
            if (!job.annotator) {
                throw std::invalid_argument("Batch job without annotator: " + job.video_path);
            }
        }

        size_t batch_size = calculate_optimal_batch_size(jobs.size());

        std::cout << "Processing " << jobs.size() << " videos in batches of "
                  << batch_size << std::endl;

        for (size_t i = 0; i < jobs.size(); i += batch_size) {
            size_t end_idx = std::min(i + batch_size, jobs.size());

            std::vector<std::future<MultimodalReport>> futures;
            for (size_t j = i; j < end_idx; ++j) {
                const AnalysisJob& job = jobs[j];
                futures.emplace_back(
                    std::async(std::launch::async, [this, &job]() {
                        return analyze_video(job.video_path, *job.annotator,
                                             job.transcriber.get(), nullptr, nullptr);
                    })
                );
            }

            for (size_t j = i; j < end_idx; ++j) {
                const std::string& path = jobs[j].video_path;
                try {
                    MultimodalReport report = futures[j - i].get();
                    std::cout << "Completed: " << path << " (quality: "
                              << to_string(report.alignment.quality.quality_level) << ")"
                              << std::endl;
                    results.reports[path] = std::move(report);
                } catch (const std::exception& e) {
                    std::cerr << "Failed: " << path << ": " << e.what() << std::endl;
                    results.errors[path] = e.what();
                }
            }
        }

        return results;
    }

    const AnalysisConfig& config() const { return config_; }

private:
    static void notify(const ProgressCallback& progress, const std::string& phase,
                       float percent, const std::string& message) {
        if (progress) {
            progress(phase, percent, message);
        }
    }

    void annotate(MultimodalReport& report, VisualAnnotator& annotator,
                  const ProgressCallback& progress, const CancelFlag* cancel) {
        const auto& frames = report.extraction.frames;
        const auto& images = report.extraction.images;

        for (size_t i = 0; i < frames.size(); ++i) {
            if (cancel && cancel->load()) {
                throw ExtractionCancelled(frames);
            }

            try {
                VisualEvent event = annotator.annotate(frames[i], images[i]);
                if (!event.frame_number) {
                    event.frame_number = frames[i].frame_number;
                }
                report.visual_events.push_back(std::move(event));
            } catch (const AnnotationError& e) {
                ++report.annotation_failures;
                std::cerr << "[VideoProcessor] Annotation failed for frame "
                          << frames[i].frame_number << ": " << e.what() << std::endl;
            } catch (const std::exception& e) {
                ++report.annotation_failures;
                std::cerr << "[VideoProcessor] Annotator error on frame "
                          << frames[i].frame_number << ": " << e.what() << std::endl;
            }

            notify(progress, "annotate", 100.0f * static_cast<float>(i + 1) / frames.size(),
                   "Annotated frame " + std::to_string(frames[i].frame_number));
        }

        // Annotators may shift timestamps; the aligner expects them ordered.
        std::stable_sort(report.visual_events.begin(), report.visual_events.end(),
                         [](const VisualEvent& a, const VisualEvent& b) {
                             return a.timestamp < b.timestamp;
                         });
    }

    void transcribe(MultimodalReport& report, Transcriber* transcriber,
                    const std::string& media_path, const ProgressCallback& progress) {
        if (!transcriber) {
            notify(progress, "transcribe", 100.0f, "No transcriber; continuing without audio");
            return;
        }

        notify(progress, "transcribe", 0.0f, "Transcribing " + media_path);
        try {
            Transcript transcript = transcriber->transcribe(media_path);
            report.audio_events = normalize_audio_events(std::move(transcript.audio_events));
            report.emotion_events = std::move(transcript.emotion_events);
        } catch (const TranscriptionError& e) {
            drop_audio(report, e.what());
        } catch (const std::exception& e) {
            drop_audio(report, std::string("transcriber error: ") + e.what());
        }
        notify(progress, "transcribe", 100.0f,
               std::to_string(report.audio_events.size()) + " speech segments");
    }

    static void drop_audio(MultimodalReport& report, const std::string& error) {
        report.audio_events.clear();
        report.emotion_events.clear();
        report.transcription_error = error;
        std::cerr << "[VideoProcessor] Transcription failed, aligning without audio: "
                  << error << std::endl;
    }

    size_t calculate_optimal_batch_size(size_t total_jobs) const {
        size_t max_by_threads = static_cast<size_t>(config_.num_threads);
        return std::max<size_t>(1, std::min(max_by_threads, total_jobs));
    }

    AnalysisConfig config_;
    TimelineAligner aligner_;
};

VideoProcessor::VideoProcessor(const AnalysisConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

VideoProcessor::~VideoProcessor() = default;

VideoInfo VideoProcessor::get_video_info(const std::string& video_path) {
    return pimpl_->get_video_info(video_path);
}

ExtractionResult VideoProcessor::extract_key_frames(const std::string& video_path,
                                                    const CancelFlag* cancel) {
    return pimpl_->extract_key_frames(video_path, cancel);
}

MultimodalReport VideoProcessor::analyze_video(const std::string& video_path,
                                               VisualAnnotator& annotator,
                                               Transcriber* transcriber,
                                               const ProgressCallback& progress,
                                               const CancelFlag* cancel) {
    return pimpl_->analyze_video(video_path, annotator, transcriber, progress, cancel);
}

MultimodalReport VideoProcessor::analyze_source(FrameSource& source,
                                                const std::string& media_path,
                                                VisualAnnotator& annotator,
                                                Transcriber* transcriber,
                                                const ProgressCallback& progress,
                                                const CancelFlag* cancel) {
    return pimpl_->analyze_source(source, media_path, annotator, transcriber, progress, cancel);
}

BatchResult VideoProcessor::batch_analyze(const std::vector<AnalysisJob>& jobs) {
    return pimpl_->batch_analyze(jobs);
}

const AnalysisConfig& VideoProcessor::config() const {
    return pimpl_->config();
}

} // namespace vidsync
