#pragma once

#include "vidsync/types.hpp"
#include <vector>

namespace vidsync {

// Upper bound on a time distance and the confidence it earns.
struct ConfidenceStep {
    double max_distance;
    float confidence;
};

// The step function and the quality weights are tuning choices; they are
// kept here so callers can override them.
struct AlignmentConfig {
    double segment_duration = 1.0;
    double scene_audio_window = 2.0;
    double emotion_visual_window = 1.5;

    std::vector<ConfidenceStep> confidence_steps{{0.5, 0.9f}, {1.0, 0.7f}, {2.0, 0.5f}};
    float fallback_confidence = 0.3f;

    float coverage_weight = 0.4f;
    float sync_ratio_weight = 0.3f;
    float sync_confidence_weight = 0.3f;

    float high_quality_threshold = 0.7f;
    float medium_quality_threshold = 0.4f;

    float semantic_link_threshold = 0.3f;
};

// Pure fusion of visual and audio/emotion events. Identical inputs give
// identical results; the aligner holds no state besides its config.
class TimelineAligner {
public:
    explicit TimelineAligner(const AlignmentConfig& config = {});

    AlignmentResult align(const std::vector<VisualEvent>& visual_events,
                          const std::vector<AudioEvent>& audio_events,
                          const std::vector<EmotionEvent>& emotion_events) const;

    UnifiedTimeline build_unified_timeline(const std::vector<VisualEvent>& visual_events,
                                           const std::vector<AudioEvent>& audio_events) const;

    std::vector<TemporalSegment> match_temporal_segments(
        const std::vector<VisualEvent>& visual_events,
        const std::vector<AudioEvent>& audio_events) const;

    std::vector<SyncEvent> detect_sync_events(const std::vector<VisualEvent>& visual_events,
                                              const std::vector<SceneChange>& scene_changes,
                                              const std::vector<AudioEvent>& audio_events,
                                              const std::vector<EmotionEvent>& emotion_events) const;

    std::vector<SemanticLink> find_semantic_links(
        const std::vector<TemporalSegment>& temporal_segments) const;

    AlignmentQuality assess_quality(const std::vector<TemporalSegment>& temporal_segments,
                                    const std::vector<SyncEvent>& sync_events) const;

    float sync_confidence(double min_distance) const;

    const AlignmentConfig& config() const { return config_; }

private:
    AlignmentConfig config_;
};

// Adjacent visual events whose scene_type differs, placed at the later event.
std::vector<SceneChange> detect_scene_changes(const std::vector<VisualEvent>& visual_events);

// Keyword overlap between visual themes and spoken text, in [0,1].
float semantic_overlap(const std::set<std::string>& themes, const std::string& text);

} // namespace vidsync
