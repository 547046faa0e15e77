#include "vidsync/serialization.hpp"
#include "vidsync/frame_metrics.hpp"
#include <set>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace vidsync {

std::string to_string(KeyFrameReason reason) {
    return json(reason).get<std::string>();
}

std::string to_string(SyncType type) {
    return json(type).get<std::string>();
}

std::string to_string(QualityLevel level) {
    return json(level).get<std::string>();
}

std::string to_string(EmotionChangeType type) {
    return json(type).get<std::string>();
}

void to_json(json& j, const FrameInfo& frame) {
    j = json{
        {"frame_number", frame.frame_number},
        {"timestamp", frame.timestamp},
        {"scene_change_score", frame.scene_change_score},
        {"quality_score", frame.quality_score},
        {"is_key_frame", frame.is_key_frame},
        {"key_frame_reason", frame.key_frame_reason},
        {"brightness", frame.brightness},
        {"contrast", frame.contrast},
        {"sharpness", frame.sharpness},
        {"content_hash", to_hex(frame.content_hash)},
    };
    if (frame.frame_path) {
        j["frame_path"] = *frame.frame_path;
    }
}

void from_json(const json& j, FrameInfo& frame) {
    j.at("frame_number").get_to(frame.frame_number);
    j.at("timestamp").get_to(frame.timestamp);
    frame.scene_change_score = j.value("scene_change_score", 0.0f);
    frame.quality_score = j.value("quality_score", 0.0f);
    frame.is_key_frame = j.value("is_key_frame", true);
    frame.key_frame_reason = j.value("key_frame_reason", KeyFrameReason::PeriodicSample);
    frame.brightness = j.value("brightness", 0.0f);
    frame.contrast = j.value("contrast", 0.0f);
    frame.sharpness = j.value("sharpness", 0.0f);
    frame.content_hash = j.contains("content_hash")
        ? hash_from_hex(j.at("content_hash").get<std::string>())
        : ContentHash{};
    if (j.contains("frame_path")) {
        frame.frame_path = j.at("frame_path").get<std::string>();
    } else {
        frame.frame_path.reset();
    }
}

void to_json(json& j, const VisualEvent& event) {
    j = json{
        {"timestamp", event.timestamp},
        {"scene_type", event.scene_type},
        {"themes", event.themes},
        {"objects", event.objects},
        {"confidence", event.confidence},
    };
    if (event.frame_number) {
        j["frame_number"] = *event.frame_number;
    }
}

void from_json(const json& j, VisualEvent& event) {
    j.at("timestamp").get_to(event.timestamp);
    event.scene_type = j.value("scene_type", std::string("unknown"));
    event.themes = j.value("themes", std::set<std::string>{});
    event.objects = j.value("objects", std::set<std::string>{});
    event.confidence = j.value("confidence", 0.0f);
    if (j.contains("frame_number")) {
        event.frame_number = j.at("frame_number").get<int64_t>();
    } else {
        event.frame_number.reset();
    }
}

void to_json(json& j, const AudioEvent& event) {
    j = json{
        {"start", event.start},
        {"end", event.end},
        {"text", event.text},
        {"confidence", event.confidence},
    };
}

void from_json(const json& j, AudioEvent& event) {
    j.at("start").get_to(event.start);
    j.at("end").get_to(event.end);
    event.text = j.value("text", std::string());
    event.confidence = j.value("confidence", 0.0f);
}

void to_json(json& j, const EmotionEvent& event) {
    j = json{
        {"timestamp", event.timestamp},
        {"from_emotion", event.from_emotion},
        {"to_emotion", event.to_emotion},
    };
    if (event.intensity) j["intensity"] = *event.intensity;
    if (event.change_type) j["change_type"] = *event.change_type;
    if (event.confidence) j["confidence"] = *event.confidence;
}

void from_json(const json& j, EmotionEvent& event) {
    j.at("timestamp").get_to(event.timestamp);
    event.from_emotion = j.value("from_emotion", std::string("unknown"));
    event.to_emotion = j.value("to_emotion", std::string("unknown"));
    event.intensity.reset();
    event.change_type.reset();
    event.confidence.reset();
    if (j.contains("intensity")) event.intensity = j.at("intensity").get<float>();
    if (j.contains("change_type")) event.change_type = j.at("change_type").get<EmotionChangeType>();
    if (j.contains("confidence")) event.confidence = j.at("confidence").get<float>();
}

void to_json(json& j, const EmotionSegment& segment) {
    j = json{
        {"start", segment.start},
        {"end", segment.end},
        {"emotion", segment.emotion},
        {"confidence", segment.confidence},
    };
}

void from_json(const json& j, EmotionSegment& segment) {
    j.at("start").get_to(segment.start);
    j.at("end").get_to(segment.end);
    segment.emotion = j.value("emotion", std::string("neutral"));
    segment.confidence = j.value("confidence", 0.0f);
}

void to_json(json& j, const TimeSegment& segment) {
    j = json{
        {"segment_id", segment.segment_id},
        {"start", segment.start},
        {"end", segment.end},
        {"visual_events", segment.visual_events},
        {"audio_events", segment.audio_events},
        {"has_visual", segment.has_visual},
        {"has_audio", segment.has_audio},
        {"modality_overlap", segment.modality_overlap},
    };
}

void from_json(const json& j, TimeSegment& segment) {
    j.at("segment_id").get_to(segment.segment_id);
    j.at("start").get_to(segment.start);
    j.at("end").get_to(segment.end);
    segment.visual_events = j.value("visual_events", std::vector<size_t>{});
    segment.audio_events = j.value("audio_events", std::vector<size_t>{});
    segment.has_visual = j.value("has_visual", !segment.visual_events.empty());
    segment.has_audio = j.value("has_audio", !segment.audio_events.empty());
    segment.modality_overlap = j.value("modality_overlap", segment.has_visual && segment.has_audio);
}

void to_json(json& j, const ModalityCoverage& coverage) {
    j = json{
        {"visual_coverage", coverage.visual_coverage},
        {"audio_coverage", coverage.audio_coverage},
        {"overlap_coverage", coverage.overlap_coverage},
    };
}

void from_json(const json& j, ModalityCoverage& coverage) {
    coverage.visual_coverage = j.value("visual_coverage", 0.0f);
    coverage.audio_coverage = j.value("audio_coverage", 0.0f);
    coverage.overlap_coverage = j.value("overlap_coverage", 0.0f);
}

void to_json(json& j, const UnifiedTimeline& timeline) {
    j = json{
        {"total_duration", timeline.total_duration},
        {"segment_duration", timeline.segment_duration},
        {"total_segments", timeline.segments.size()},
        {"time_segments", timeline.segments},
        {"modality_coverage", timeline.coverage},
    };
}

void from_json(const json& j, UnifiedTimeline& timeline) {
    j.at("total_duration").get_to(timeline.total_duration);
    j.at("segment_duration").get_to(timeline.segment_duration);
    timeline.segments = j.value("time_segments", std::vector<TimeSegment>{});
    timeline.coverage = j.value("modality_coverage", ModalityCoverage{});
}

void to_json(json& j, const TemporalSegment& segment) {
    j = json{
        {"audio_index", segment.audio_index},
        {"start", segment.start},
        {"end", segment.end},
        {"duration", segment.end - segment.start},
        {"text", segment.text},
        {"audio_confidence", segment.audio_confidence},
        {"visual_indices", segment.visual_indices},
        {"themes", segment.themes},
        {"objects", segment.objects},
        {"scene_types", segment.scene_types},
        {"visual_frame_count", segment.visual_frame_count},
    };
}

void from_json(const json& j, TemporalSegment& segment) {
    j.at("audio_index").get_to(segment.audio_index);
    j.at("start").get_to(segment.start);
    j.at("end").get_to(segment.end);
    segment.text = j.value("text", std::string());
    segment.audio_confidence = j.value("audio_confidence", 0.0f);
    segment.visual_indices = j.value("visual_indices", std::vector<size_t>{});
    segment.themes = j.value("themes", std::set<std::string>{});
    segment.objects = j.value("objects", std::set<std::string>{});
    segment.scene_types = j.value("scene_types", std::set<std::string>{});
    segment.visual_frame_count = j.value("visual_frame_count", segment.visual_indices.size());
}

void to_json(json& j, const SceneChange& change) {
    j = json{
        {"timestamp", change.timestamp},
        {"visual_index", change.visual_index},
        {"from_scene", change.from_scene},
        {"to_scene", change.to_scene},
    };
}

void from_json(const json& j, SceneChange& change) {
    j.at("timestamp").get_to(change.timestamp);
    j.at("visual_index").get_to(change.visual_index);
    change.from_scene = j.value("from_scene", std::string());
    change.to_scene = j.value("to_scene", std::string());
}

void to_json(json& j, const SyncEvent& event) {
    j = json{
        {"timestamp", event.timestamp},
        {"sync_type", event.sync_type},
        {"trigger_index", event.trigger_index},
        {"matched_indices", event.matched_indices},
        {"min_distance", event.min_distance},
        {"sync_confidence", event.sync_confidence},
    };
}

void from_json(const json& j, SyncEvent& event) {
    j.at("timestamp").get_to(event.timestamp);
    j.at("sync_type").get_to(event.sync_type);
    j.at("trigger_index").get_to(event.trigger_index);
    event.matched_indices = j.value("matched_indices", std::vector<size_t>{});
    event.min_distance = j.value("min_distance", 0.0);
    event.sync_confidence = j.value("sync_confidence", 0.0f);
}

void to_json(json& j, const SemanticLink& link) {
    j = json{
        {"temporal_index", link.temporal_index},
        {"start", link.start},
        {"end", link.end},
        {"overlap", link.overlap},
    };
}

void from_json(const json& j, SemanticLink& link) {
    j.at("temporal_index").get_to(link.temporal_index);
    j.at("start").get_to(link.start);
    j.at("end").get_to(link.end);
    link.overlap = j.value("overlap", 0.0f);
}

void to_json(json& j, const AlignmentQuality& quality) {
    j = json{
        {"coverage", quality.coverage},
        {"sync_ratio", quality.sync_ratio},
        {"avg_sync_confidence", quality.avg_sync_confidence},
        {"overall_quality", quality.overall_quality},
        {"quality_level", quality.quality_level},
    };
}

void from_json(const json& j, AlignmentQuality& quality) {
    quality.coverage = j.value("coverage", 0.0f);
    quality.sync_ratio = j.value("sync_ratio", 0.0f);
    quality.avg_sync_confidence = j.value("avg_sync_confidence", 0.0f);
    quality.overall_quality = j.value("overall_quality", 0.0f);
    quality.quality_level = j.value("quality_level", QualityLevel::Low);
}

void to_json(json& j, const AlignmentResult& result) {
    j = json{
        {"unified_timeline", result.timeline},
        {"temporal_segments", result.temporal_segments},
        {"scene_changes", result.scene_changes},
        {"sync_events", result.sync_events},
        {"semantic_links", result.semantic_links},
        {"alignment_quality", result.quality},
    };
}

void from_json(const json& j, AlignmentResult& result) {
    j.at("unified_timeline").get_to(result.timeline);
    result.temporal_segments = j.value("temporal_segments", std::vector<TemporalSegment>{});
    result.scene_changes = j.value("scene_changes", std::vector<SceneChange>{});
    result.sync_events = j.value("sync_events", std::vector<SyncEvent>{});
    result.semantic_links = j.value("semantic_links", std::vector<SemanticLink>{});
    j.at("alignment_quality").get_to(result.quality);
}

void to_json(json& j, const VideoInfo& info) {
    j = json{
        {"total_frames", info.total_frames},
        {"fps", info.fps},
        {"duration", info.duration},
        {"frame_size", {info.frame_size.width, info.frame_size.height}},
        {"codec", info.codec},
    };
}

void from_json(const json& j, VideoInfo& info) {
    j.at("total_frames").get_to(info.total_frames);
    j.at("fps").get_to(info.fps);
    info.duration = j.value("duration", 0.0);
    const json& size = j.at("frame_size");
    info.frame_size = cv::Size(size.at(0).get<int>(), size.at(1).get<int>());
    info.codec = j.value("codec", std::string());
}

void to_json(json& j, const ExtractionResult& result) {
    j = json{
        {"frames", result.frames},
        {"evaluated_frames", result.evaluated_frames},
        {"skipped_frames", result.skipped_frames},
        {"sample_stride", result.sample_stride},
        {"fps", result.fps},
        {"total_frame_count", result.total_frame_count},
    };
}

void from_json(const json& j, ExtractionResult& result) {
    j.at("frames").get_to(result.frames);
    result.images.clear();
    result.evaluated_frames = j.value("evaluated_frames", result.frames.size());
    result.skipped_frames = j.value("skipped_frames", size_t{0});
    result.sample_stride = j.value("sample_stride", 1);
    result.fps = j.value("fps", 0.0);
    result.total_frame_count = j.value("total_frame_count", int64_t{-1});
}

void to_json(json& j, const MultimodalReport& report) {
    j = json{
        {"video_path", report.video_path},
        {"extraction", report.extraction},
        {"visual_events", report.visual_events},
        {"audio_events", report.audio_events},
        {"emotion_events", report.emotion_events},
        {"alignment", report.alignment},
        {"annotation_failures", report.annotation_failures},
        {"processing_time_ms", report.processing_time.count()},
    };
    if (report.transcription_error) {
        j["transcription_error"] = *report.transcription_error;
    }
}

void from_json(const json& j, MultimodalReport& report) {
    j.at("video_path").get_to(report.video_path);
    j.at("extraction").get_to(report.extraction);
    report.visual_events = j.value("visual_events", std::vector<VisualEvent>{});
    report.audio_events = j.value("audio_events", std::vector<AudioEvent>{});
    report.emotion_events = j.value("emotion_events", std::vector<EmotionEvent>{});
    j.at("alignment").get_to(report.alignment);
    report.annotation_failures = j.value("annotation_failures", size_t{0});
    if (j.contains("transcription_error")) {
        report.transcription_error = j.at("transcription_error").get<std::string>();
    } else {
        report.transcription_error.reset();
    }
    report.processing_time = std::chrono::milliseconds(j.value("processing_time_ms", int64_t{0}));
}

} // namespace vidsync
