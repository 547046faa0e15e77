#include <gtest/gtest.h>
#include "vidsync/serialization.hpp"
#include "vidsync/timeline_aligner.hpp"

using json = nlohmann::json;

namespace vidsync {

class SerializationTest : public ::testing::Test {
protected:
    void SetUp() override {
        frame_.frame_number = 42;
        frame_.timestamp = 1.4;
        frame_.scene_change_score = 0.55f;
        frame_.quality_score = 0.25f;
        frame_.is_key_frame = true;
        frame_.key_frame_reason = KeyFrameReason::SceneChange;
        frame_.brightness = 120.5f;
        frame_.contrast = 33.0f;
        frame_.sharpness = 0.75f;
        frame_.content_hash = ContentHash{0xde, 0xad, 0xbe, 0xef, 0x00, 0x11, 0x22, 0x33};
    }

    FrameInfo frame_;
};

TEST_F(SerializationTest, EnumsAsSnakeCase) {
    EXPECT_EQ(json(KeyFrameReason::VideoStart), "video_start");
    EXPECT_EQ(json(KeyFrameReason::PeriodicSample), "periodic_sample");
    EXPECT_EQ(json(SyncType::EmotionVisualSync), "emotion_visual_sync");
    EXPECT_EQ(json(QualityLevel::Medium), "medium");
    EXPECT_EQ(json(EmotionChangeType::EmotionalToNeutral), "emotional_to_neutral");

    EXPECT_EQ(to_string(KeyFrameReason::HighQuality), "high_quality");
    EXPECT_EQ(to_string(QualityLevel::High), "high");
}

TEST_F(SerializationTest, FrameInfoFields) {
    json j = frame_;

    EXPECT_EQ(j.at("frame_number"), 42);
    EXPECT_EQ(j.at("key_frame_reason"), "scene_change");
    EXPECT_EQ(j.at("content_hash"), "deadbeef00112233");
    EXPECT_FALSE(j.contains("frame_path"));

    frame_.frame_path = "frames/frame_clip_000042.jpg";
    j = frame_;
    EXPECT_EQ(j.at("frame_path"), "frames/frame_clip_000042.jpg");

    FrameInfo back = j.get<FrameInfo>();
    EXPECT_EQ(back.frame_number, frame_.frame_number);
    EXPECT_DOUBLE_EQ(back.timestamp, frame_.timestamp);
    EXPECT_EQ(back.key_frame_reason, frame_.key_frame_reason);
    EXPECT_EQ(back.content_hash, frame_.content_hash);
    EXPECT_EQ(back.frame_path, frame_.frame_path);
}

TEST_F(SerializationTest, TimestampsKeepFullPrecision) {
    frame_.timestamp = 1.0 / 3.0;
    json parsed = json::parse(json(frame_).dump());

    EXPECT_EQ(parsed.at("timestamp").get<double>(), 1.0 / 3.0);
}

TEST_F(SerializationTest, VisualEventDefaults) {
    json j = json::parse(R"({"timestamp": 2.5, "themes": ["b", "a", "b"]})");
    VisualEvent event = j.get<VisualEvent>();

    EXPECT_DOUBLE_EQ(event.timestamp, 2.5);
    EXPECT_EQ(event.scene_type, "unknown");
    EXPECT_EQ(event.themes, (std::set<std::string>{"a", "b"}));
    EXPECT_FALSE(event.frame_number.has_value());

    json out = event;
    EXPECT_EQ(out.at("themes"), json::array({"a", "b"}));
    EXPECT_FALSE(out.contains("frame_number"));
}

TEST_F(SerializationTest, EmotionEventOptionals) {
    EmotionEvent event;
    event.timestamp = 3.0;
    event.from_emotion = "happy";
    event.to_emotion = "sad";

    json j = event;
    EXPECT_FALSE(j.contains("intensity"));
    EXPECT_FALSE(j.contains("change_type"));

    event.change_type = EmotionChangeType::PositiveToNegative;
    event.intensity = 1.6f;
    j = event;
    EXPECT_EQ(j.at("change_type"), "positive_to_negative");

    EmotionEvent back = j.get<EmotionEvent>();
    ASSERT_TRUE(back.change_type.has_value());
    EXPECT_EQ(*back.change_type, EmotionChangeType::PositiveToNegative);
    EXPECT_FALSE(back.confidence.has_value());
}

TEST_F(SerializationTest, MissingRequiredFieldThrows) {
    json j = json::parse(R"({"end": 2.0, "text": "hi"})");
    EXPECT_THROW(j.get<AudioEvent>(), json::out_of_range);
}

TEST_F(SerializationTest, AlignmentResultLayout) {
    VisualEvent a;
    a.timestamp = 0.5;
    a.scene_type = "a";
    VisualEvent b;
    b.timestamp = 1.5;
    b.scene_type = "b";
    AudioEvent speech;
    speech.start = 0.0;
    speech.end = 2.0;
    speech.text = "hello";

    TimelineAligner aligner;
    json j = aligner.align({a, b}, {speech}, {});

    ASSERT_TRUE(j.contains("unified_timeline"));
    EXPECT_EQ(j.at("unified_timeline").at("total_segments"), 3);
    EXPECT_EQ(j.at("unified_timeline").at("time_segments").size(), 3u);
    EXPECT_TRUE(j.at("unified_timeline").contains("modality_coverage"));
    EXPECT_EQ(j.at("temporal_segments").size(), 1u);
    EXPECT_DOUBLE_EQ(j.at("temporal_segments")[0].at("duration").get<double>(), 2.0);
    EXPECT_EQ(j.at("sync_events")[0].at("sync_type"), "scene_audio_sync");
    EXPECT_EQ(j.at("alignment_quality").at("quality_level"), "high");
}

TEST_F(SerializationTest, AlignmentResultReadsBack) {
    VisualEvent office;
    office.timestamp = 0.5;
    office.scene_type = "office";
    office.themes = {"meeting"};
    VisualEvent street;
    street.timestamp = 1.5;
    street.scene_type = "street";
    street.objects = {"car"};
    AudioEvent speech{0.0, 2.0, "the meeting ends", 0.9f};
    EmotionEvent shift;
    shift.timestamp = 1.7;
    shift.from_emotion = "neutral";
    shift.to_emotion = "happy";

    TimelineAligner aligner;
    AlignmentResult original = aligner.align({office, street}, {speech}, {shift});
    ASSERT_FALSE(original.sync_events.empty());
    ASSERT_FALSE(original.semantic_links.empty());

    const json stored = original;
    AlignmentResult loaded = json::parse(stored.dump()).get<AlignmentResult>();

    EXPECT_EQ(json(loaded), stored);
    EXPECT_DOUBLE_EQ(loaded.timeline.total_duration, original.timeline.total_duration);
    ASSERT_EQ(loaded.timeline.segments.size(), original.timeline.segments.size());
    EXPECT_EQ(loaded.timeline.segments[1].visual_events, original.timeline.segments[1].visual_events);
    ASSERT_EQ(loaded.temporal_segments.size(), 1u);
    EXPECT_EQ(loaded.temporal_segments[0].themes, original.temporal_segments[0].themes);
    EXPECT_EQ(loaded.temporal_segments[0].visual_frame_count, 2u);
    ASSERT_EQ(loaded.sync_events.size(), original.sync_events.size());
    for (size_t i = 0; i < loaded.sync_events.size(); ++i) {
        EXPECT_EQ(loaded.sync_events[i].sync_type, original.sync_events[i].sync_type);
        EXPECT_EQ(loaded.sync_events[i].matched_indices, original.sync_events[i].matched_indices);
        EXPECT_FLOAT_EQ(loaded.sync_events[i].sync_confidence, original.sync_events[i].sync_confidence);
    }
    EXPECT_EQ(loaded.scene_changes[0].to_scene, "street");
    EXPECT_FLOAT_EQ(loaded.semantic_links[0].overlap, original.semantic_links[0].overlap);
    EXPECT_EQ(loaded.quality.quality_level, original.quality.quality_level);
    EXPECT_FLOAT_EQ(loaded.quality.overall_quality, original.quality.overall_quality);
}

TEST_F(SerializationTest, ReportReadsBack) {
    MultimodalReport report;
    report.video_path = "clip.mp4";
    report.extraction.frames = {frame_};
    report.extraction.evaluated_frames = 30;
    report.extraction.sample_stride = 3;
    report.extraction.fps = 30.0;
    report.extraction.total_frame_count = 90;
    report.audio_events = {{0.0, 1.0, "hi", 0.8f}};
    report.annotation_failures = 1;
    report.transcription_error = "partial transcript";
    report.processing_time = std::chrono::milliseconds(125);

    MultimodalReport loaded = json(report).get<MultimodalReport>();

    EXPECT_EQ(loaded.video_path, "clip.mp4");
    ASSERT_EQ(loaded.extraction.frames.size(), 1u);
    EXPECT_EQ(loaded.extraction.frames[0].content_hash, frame_.content_hash);
    EXPECT_EQ(loaded.extraction.total_frame_count, 90);
    EXPECT_EQ(loaded.extraction.sample_stride, 3);
    EXPECT_EQ(loaded.audio_events[0].text, "hi");
    EXPECT_EQ(loaded.annotation_failures, 1u);
    ASSERT_TRUE(loaded.transcription_error.has_value());
    EXPECT_EQ(*loaded.transcription_error, "partial transcript");
    EXPECT_EQ(loaded.processing_time.count(), 125);
    EXPECT_EQ(json(loaded), json(report));
}

TEST_F(SerializationTest, ReportIncludesTranscriptionError) {
    MultimodalReport report;
    report.video_path = "clip.mp4";
    report.annotation_failures = 2;

    json j = report;
    EXPECT_EQ(j.at("annotation_failures"), 2);
    EXPECT_FALSE(j.contains("transcription_error"));

    report.transcription_error = "no audio track";
    j = report;
    EXPECT_EQ(j.at("transcription_error"), "no audio track");
}

} // namespace vidsync
