#pragma once

#include "vidsync/frame_extractor.hpp"
#include "vidsync/frame_source.hpp"
#include "vidsync/types.hpp"
#include "vidsync/video_processor.hpp"
#include <nlohmann/json.hpp>

namespace vidsync {

NLOHMANN_JSON_SERIALIZE_ENUM(KeyFrameReason, {
    {KeyFrameReason::VideoStart, "video_start"},
    {KeyFrameReason::VideoEnd, "video_end"},
    {KeyFrameReason::SceneChange, "scene_change"},
    {KeyFrameReason::HighQuality, "high_quality"},
    {KeyFrameReason::PeriodicSample, "periodic_sample"},
    {KeyFrameReason::UniformSample, "uniform_sample"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(SyncType, {
    {SyncType::SceneAudioSync, "scene_audio_sync"},
    {SyncType::EmotionVisualSync, "emotion_visual_sync"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(QualityLevel, {
    {QualityLevel::High, "high"},
    {QualityLevel::Medium, "medium"},
    {QualityLevel::Low, "low"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(EmotionChangeType, {
    {EmotionChangeType::PositiveToNegative, "positive_to_negative"},
    {EmotionChangeType::NegativeToPositive, "negative_to_positive"},
    {EmotionChangeType::NeutralToEmotional, "neutral_to_emotional"},
    {EmotionChangeType::EmotionalToNeutral, "emotional_to_neutral"},
    {EmotionChangeType::EmotionalShift, "emotional_shift"},
})

// Every value type round-trips so results can be stored and reloaded.
// Derived keys (total_segments, duration) are written but not read back.
void to_json(nlohmann::json& j, const FrameInfo& frame);
void from_json(const nlohmann::json& j, FrameInfo& frame);

void to_json(nlohmann::json& j, const VisualEvent& event);
void from_json(const nlohmann::json& j, VisualEvent& event);

void to_json(nlohmann::json& j, const AudioEvent& event);
void from_json(const nlohmann::json& j, AudioEvent& event);

void to_json(nlohmann::json& j, const EmotionEvent& event);
void from_json(const nlohmann::json& j, EmotionEvent& event);

void to_json(nlohmann::json& j, const EmotionSegment& segment);
void from_json(const nlohmann::json& j, EmotionSegment& segment);

void to_json(nlohmann::json& j, const TimeSegment& segment);
void from_json(const nlohmann::json& j, TimeSegment& segment);

void to_json(nlohmann::json& j, const ModalityCoverage& coverage);
void from_json(const nlohmann::json& j, ModalityCoverage& coverage);

void to_json(nlohmann::json& j, const UnifiedTimeline& timeline);
void from_json(const nlohmann::json& j, UnifiedTimeline& timeline);

void to_json(nlohmann::json& j, const TemporalSegment& segment);
void from_json(const nlohmann::json& j, TemporalSegment& segment);

void to_json(nlohmann::json& j, const SceneChange& change);
void from_json(const nlohmann::json& j, SceneChange& change);

void to_json(nlohmann::json& j, const SyncEvent& event);
void from_json(const nlohmann::json& j, SyncEvent& event);

void to_json(nlohmann::json& j, const SemanticLink& link);
void from_json(const nlohmann::json& j, SemanticLink& link);

void to_json(nlohmann::json& j, const AlignmentQuality& quality);
void from_json(const nlohmann::json& j, AlignmentQuality& quality);

void to_json(nlohmann::json& j, const AlignmentResult& result);
void from_json(const nlohmann::json& j, AlignmentResult& result);

void to_json(nlohmann::json& j, const VideoInfo& info);
void from_json(const nlohmann::json& j, VideoInfo& info);

// Key frame pixels are not serialized; images comes back empty.
void to_json(nlohmann::json& j, const ExtractionResult& result);
void from_json(const nlohmann::json& j, ExtractionResult& result);

void to_json(nlohmann::json& j, const MultimodalReport& report);
void from_json(const nlohmann::json& j, MultimodalReport& report);

} // namespace vidsync
