#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace vidsync {

enum class KeyFrameReason {
    VideoStart,
    VideoEnd,
    SceneChange,
    HighQuality,
    PeriodicSample,
    UniformSample
};

// 64-bit block-average fingerprint, row-major, most significant bit first.
using ContentHash = std::array<uint8_t, 8>;

struct FrameInfo {
    int64_t frame_number = 0;
    double timestamp = 0.0;         // seconds
    float scene_change_score = 0.0f;
    float quality_score = 0.0f;
    bool is_key_frame = false;
    KeyFrameReason key_frame_reason = KeyFrameReason::VideoStart;
    float brightness = 0.0f;        // mean gray level, 0..255
    float contrast = 0.0f;          // gray level stddev, 0..127.5
    float sharpness = 0.0f;         // normalized Laplacian variance, 0..1
    ContentHash content_hash{};
    std::optional<std::string> frame_path;
};

struct VisualEvent {
    double timestamp = 0.0;
    std::optional<int64_t> frame_number;
    std::string scene_type;
    std::set<std::string> themes;
    std::set<std::string> objects;
    float confidence = 0.0f;
};

struct AudioEvent {
    double start = 0.0;
    double end = 0.0;
    std::string text;
    float confidence = 0.0f;
};

enum class EmotionChangeType {
    PositiveToNegative,
    NegativeToPositive,
    NeutralToEmotional,
    EmotionalToNeutral,
    EmotionalShift
};

// A detected transition, not a steady-state label.
struct EmotionEvent {
    double timestamp = 0.0;
    std::string from_emotion;
    std::string to_emotion;
    std::optional<float> intensity;
    std::optional<EmotionChangeType> change_type;
    std::optional<float> confidence;
};

struct EmotionSegment {
    double start = 0.0;
    double end = 0.0;
    std::string emotion;
    float confidence = 0.0f;
};

struct TimeSegment {
    uint32_t segment_id = 0;
    double start = 0.0;
    double end = 0.0;
    std::vector<size_t> visual_events;   // indices into the visual input
    std::vector<size_t> audio_events;    // indices into the audio input
    bool has_visual = false;
    bool has_audio = false;
    bool modality_overlap = false;
};

struct ModalityCoverage {
    float visual_coverage = 0.0f;
    float audio_coverage = 0.0f;
    float overlap_coverage = 0.0f;
};

struct UnifiedTimeline {
    double total_duration = 0.0;
    double segment_duration = 1.0;
    std::vector<TimeSegment> segments;
    ModalityCoverage coverage;
};

struct TemporalSegment {
    size_t audio_index = 0;
    double start = 0.0;
    double end = 0.0;
    std::string text;
    float audio_confidence = 0.0f;
    std::vector<size_t> visual_indices;
    std::set<std::string> themes;
    std::set<std::string> objects;
    std::set<std::string> scene_types;
    size_t visual_frame_count = 0;
};

struct SceneChange {
    double timestamp = 0.0;
    size_t visual_index = 0;   // the later event of the pair
    std::string from_scene;
    std::string to_scene;
};

enum class SyncType {
    SceneAudioSync,
    EmotionVisualSync
};

struct SyncEvent {
    double timestamp = 0.0;
    SyncType sync_type = SyncType::SceneAudioSync;
    // SceneAudioSync: index into scene_changes, matches index audio events.
    // EmotionVisualSync: index into emotion events, matches index visual events.
    size_t trigger_index = 0;
    std::vector<size_t> matched_indices;
    double min_distance = 0.0;
    float sync_confidence = 0.0f;
};

struct SemanticLink {
    size_t temporal_index = 0;
    double start = 0.0;
    double end = 0.0;
    float overlap = 0.0f;
};

enum class QualityLevel {
    High,
    Medium,
    Low
};

struct AlignmentQuality {
    float coverage = 0.0f;
    float sync_ratio = 0.0f;
    float avg_sync_confidence = 0.0f;
    float overall_quality = 0.0f;
    QualityLevel quality_level = QualityLevel::Low;
};

struct AlignmentResult {
    UnifiedTimeline timeline;
    std::vector<TemporalSegment> temporal_segments;
    std::vector<SceneChange> scene_changes;
    std::vector<SyncEvent> sync_events;
    std::vector<SemanticLink> semantic_links;
    AlignmentQuality quality;
};

std::string to_string(KeyFrameReason reason);
std::string to_string(SyncType type);
std::string to_string(QualityLevel level);
std::string to_string(EmotionChangeType type);

} // namespace vidsync
