#include <gtest/gtest.h>
#include "vidsync/errors.hpp"
#include "vidsync/video_processor.hpp"
#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>
#include <algorithm>
#include <atomic>
#include <cstdio>
#include <stdexcept>

namespace vidsync {

namespace {

// Labels each frame "dark" or "bright" from its pixels; fails on chosen frames.
class BrightnessAnnotator : public VisualAnnotator {
public:
    explicit BrightnessAnnotator(std::set<int64_t> failing = {}) : failing_(std::move(failing)) {}

    VisualEvent annotate(const FrameInfo& frame, const cv::Mat& pixels) override {
        if (failing_.count(frame.frame_number) > 0) {
            throw AnnotationError("annotator unavailable");
        }
        VisualEvent event;
        event.timestamp = frame.timestamp;
        event.scene_type = cv::mean(pixels)[0] < 150.0 ? "dark" : "bright";
        event.themes = {event.scene_type};
        event.confidence = 0.9f;
        return event;
    }

private:
    std::set<int64_t> failing_;
};

class FixedTranscriber : public Transcriber {
public:
    explicit FixedTranscriber(std::vector<AudioEvent> audio) : audio_(std::move(audio)) {}

    Transcript transcribe(const std::string& /*media_path*/) override {
        Transcript transcript;
        transcript.audio_events = audio_;
        return transcript;
    }

private:
    std::vector<AudioEvent> audio_;
};

class FailingTranscriber : public Transcriber {
public:
    Transcript transcribe(const std::string& media_path) override {
        throw TranscriptionError("no audio track in " + media_path);
    }
};

// Stands in for a backend that breaks with something other than AnnotationError.
class CrashingAnnotator : public BrightnessAnnotator {
public:
    explicit CrashingAnnotator(int64_t crash_frame) : crash_frame_(crash_frame) {}

    VisualEvent annotate(const FrameInfo& frame, const cv::Mat& pixels) override {
        if (frame.frame_number == crash_frame_) {
            throw std::runtime_error("backend connection reset");
        }
        return BrightnessAnnotator::annotate(frame, pixels);
    }

private:
    int64_t crash_frame_;
};

class CrashingTranscriber : public Transcriber {
public:
    Transcript transcribe(const std::string& /*media_path*/) override {
        throw std::runtime_error("decoder out of memory");
    }
};

} // namespace

class VideoProcessingTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.extraction.max_frames = 8;
        config_.extraction.min_interval = 1.0;
        config_.num_threads = 2;
    }

    void TearDown() override {
        std::remove("test_processing.avi");
    }

    // 5 seconds at 10fps: dark until frame 25, bright afterwards.
    static MatSequenceSource make_source() {
        std::vector<cv::Mat> frames;
        for (int i = 0; i < 50; ++i) {
            int value = i < 25 ? 60 : 220;
            frames.emplace_back(120, 160, CV_8UC3, cv::Scalar(value, value, value));
        }
        return MatSequenceSource(frames, 10.0, "synthetic.mp4");
    }

    bool create_test_video() {
        cv::VideoWriter writer;
        int fourcc = cv::VideoWriter::fourcc('M', 'J', 'P', 'G');
        if (!writer.open("test_processing.avi", fourcc, 10.0, cv::Size(160, 120))) {
            return false;
        }
        for (int i = 0; i < 30; ++i) {
            int value = i < 15 ? 60 : 220;
            writer << cv::Mat(120, 160, CV_8UC3, cv::Scalar(value, value, value));
        }
        writer.release();
        return true;
    }

    AnalysisConfig config_;
};

TEST_F(VideoProcessingTest, FullPipelineOnSyntheticSource) {
    VideoProcessor processor(config_);
    BrightnessAnnotator annotator;
    FixedTranscriber transcriber({{2.0, 3.0, "the bright room", 0.9f}});

    std::vector<std::string> phases;
    auto progress = [&phases](const std::string& phase, float percent, const std::string&) {
        EXPECT_GE(percent, 0.0f);
        EXPECT_LE(percent, 100.0f);
        phases.push_back(phase);
    };

    auto source = make_source();
    auto report = processor.analyze_source(source, "synthetic.mp4", annotator, &transcriber, progress);

    ASSERT_EQ(report.extraction.frames.size(), 3u);
    EXPECT_TRUE(report.extraction.images.empty());
    ASSERT_EQ(report.visual_events.size(), 3u);
    EXPECT_EQ(report.visual_events[0].scene_type, "dark");
    EXPECT_EQ(report.visual_events[1].scene_type, "bright");
    EXPECT_EQ(*report.visual_events[1].frame_number, 25);
    EXPECT_EQ(report.annotation_failures, 0u);
    EXPECT_FALSE(report.transcription_error.has_value());

    const auto& alignment = report.alignment;
    ASSERT_EQ(alignment.temporal_segments.size(), 1u);
    EXPECT_EQ(alignment.temporal_segments[0].visual_frame_count, 1u);
    ASSERT_EQ(alignment.sync_events.size(), 1u);
    EXPECT_EQ(alignment.sync_events[0].sync_type, SyncType::SceneAudioSync);
    EXPECT_FLOAT_EQ(alignment.sync_events[0].sync_confidence, 0.9f);
    EXPECT_EQ(alignment.semantic_links.size(), 1u);
    EXPECT_EQ(alignment.quality.quality_level, QualityLevel::High);

    ASSERT_FALSE(phases.empty());
    EXPECT_EQ(phases.front(), "extract");
    EXPECT_EQ(phases.back(), "done");
    for (const char* phase : {"annotate", "transcribe", "align"}) {
        EXPECT_NE(std::find(phases.begin(), phases.end(), phase), phases.end()) << phase;
    }
}

TEST_F(VideoProcessingTest, AnnotationFailuresAreCounted) {
    VideoProcessor processor(config_);
    BrightnessAnnotator annotator({25});

    auto source = make_source();
    auto report = processor.analyze_source(source, "synthetic.mp4", annotator);

    EXPECT_EQ(report.extraction.frames.size(), 3u);
    EXPECT_EQ(report.annotation_failures, 1u);
    ASSERT_EQ(report.visual_events.size(), 2u);
    EXPECT_EQ(*report.visual_events[0].frame_number, 0);
    EXPECT_EQ(*report.visual_events[1].frame_number, 49);
}

TEST_F(VideoProcessingTest, TranscriptionFailureDegradesToVisualOnly) {
    VideoProcessor processor(config_);
    BrightnessAnnotator annotator;
    FailingTranscriber transcriber;

    auto source = make_source();
    auto report = processor.analyze_source(source, "synthetic.mp4", annotator, &transcriber);

    ASSERT_TRUE(report.transcription_error.has_value());
    EXPECT_NE(report.transcription_error->find("synthetic.mp4"), std::string::npos);
    EXPECT_TRUE(report.audio_events.empty());
    EXPECT_EQ(report.visual_events.size(), 3u);
    EXPECT_TRUE(report.alignment.temporal_segments.empty());
    EXPECT_EQ(report.alignment.scene_changes.size(), 1u);
    EXPECT_EQ(report.alignment.quality.quality_level, QualityLevel::Low);
}

TEST_F(VideoProcessingTest, UnexpectedAnnotatorErrorIsCounted) {
    VideoProcessor processor(config_);
    CrashingAnnotator annotator(25);

    auto source = make_source();
    auto report = processor.analyze_source(source, "synthetic.mp4", annotator);

    EXPECT_EQ(report.extraction.frames.size(), 3u);
    EXPECT_EQ(report.annotation_failures, 1u);
    ASSERT_EQ(report.visual_events.size(), 2u);
    EXPECT_EQ(*report.visual_events[1].frame_number, 49);
}

TEST_F(VideoProcessingTest, UnexpectedTranscriberErrorDegradesToVisualOnly) {
    VideoProcessor processor(config_);
    BrightnessAnnotator annotator;
    CrashingTranscriber transcriber;

    auto source = make_source();
    auto report = processor.analyze_source(source, "synthetic.mp4", annotator, &transcriber);

    ASSERT_TRUE(report.transcription_error.has_value());
    EXPECT_NE(report.transcription_error->find("decoder out of memory"), std::string::npos);
    EXPECT_TRUE(report.audio_events.empty());
    EXPECT_EQ(report.visual_events.size(), 3u);
    EXPECT_EQ(report.alignment.quality.quality_level, QualityLevel::Low);
}

TEST_F(VideoProcessingTest, OverlappingTranscriptIsRejected) {
    VideoProcessor processor(config_);
    BrightnessAnnotator annotator;
    FixedTranscriber transcriber({{0.0, 2.0, "a", 0.9f}, {1.0, 3.0, "b", 0.9f}});

    auto source = make_source();
    auto report = processor.analyze_source(source, "synthetic.mp4", annotator, &transcriber);

    EXPECT_TRUE(report.transcription_error.has_value());
    EXPECT_TRUE(report.audio_events.empty());
}

TEST_F(VideoProcessingTest, CancellationPropagates) {
    VideoProcessor processor(config_);
    BrightnessAnnotator annotator;
    std::atomic<bool> cancel{true};

    auto source = make_source();
    EXPECT_THROW(processor.analyze_source(source, "synthetic.mp4", annotator, nullptr, nullptr, &cancel),
                 ExtractionCancelled);
}

TEST_F(VideoProcessingTest, InvalidVideoHandling) {
    VideoProcessor processor(config_);
    BrightnessAnnotator annotator;

    EXPECT_THROW(processor.get_video_info("nonexistent.avi"), SourceUnreadable);
    EXPECT_THROW(processor.extract_key_frames("nonexistent.avi"), SourceUnreadable);
    EXPECT_THROW(processor.analyze_video("nonexistent.avi", annotator), SourceUnreadable);
}

TEST_F(VideoProcessingTest, ConfigurationValidation) {
    AnalysisConfig bad = config_;
    bad.extraction.max_frames = 0;
    EXPECT_THROW(VideoProcessor{bad}, std::invalid_argument);

    bad = config_;
    bad.alignment.segment_duration = -1.0;
    EXPECT_THROW(VideoProcessor{bad}, std::invalid_argument);
}

TEST_F(VideoProcessingTest, BatchProcessing) {
    if (!create_test_video()) {
        GTEST_SKIP() << "MJPG writer unavailable";
    }

    VideoProcessor processor(config_);
    auto annotator = std::make_shared<BrightnessAnnotator>();
    auto transcriber = std::make_shared<FixedTranscriber>(
        std::vector<AudioEvent>{{1.0, 2.0, "lights on", 0.8f}});

    std::vector<AnalysisJob> jobs = {
        {"test_processing.avi", annotator, transcriber},
        {"nonexistent.avi", annotator, nullptr},
    };

    auto results = processor.batch_analyze(jobs);

    ASSERT_EQ(results.reports.size(), 1u);
    ASSERT_EQ(results.errors.size(), 1u);
    EXPECT_EQ(results.errors.count("nonexistent.avi"), 1u);

    const auto& report = results.reports.at("test_processing.avi");
    EXPECT_GE(report.extraction.frames.size(), 2u);
    EXPECT_EQ(report.audio_events.size(), 1u);
}

TEST_F(VideoProcessingTest, BatchRequiresAnnotator) {
    VideoProcessor processor(config_);
    std::vector<AnalysisJob> jobs = {{"test_processing.avi", nullptr, nullptr}};

    EXPECT_THROW(processor.batch_analyze(jobs), std::invalid_argument);
}

} // namespace vidsync
