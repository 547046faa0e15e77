#include "vidsync/timeline_aligner.hpp"
#include <algorithm>
#include <cassert>
#include <cctype>
#include <cmath>
#include <limits>
#include <set>
#include <sstream>
#include <stdexcept>

namespace vidsync {

namespace {

inline float clamp01(double x) {
    if (!std::isfinite(x)) return 0.0f;
    return static_cast<float>(std::clamp(x, 0.0, 1.0));
}

inline bool contains_instant(double start, double end, double t) {
    return t >= start && t < end;
}

// Distance from t to the closed interval [start, end]; zero inside it.
inline double distance_to_interval(double t, double start, double end) {
    if (t < start) return start - t;
    if (t > end) return t - end;
    return 0.0;
}

bool intersects_bucket(const AudioEvent& event, double start, double end) {
    if (event.end > event.start) {
        return event.start < end && event.end > start;
    }
    return contains_instant(start, end, event.start);
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string strip_punctuation(const std::string& word) {
    size_t first = 0;
    size_t last = word.size();
    while (first < last && std::ispunct(static_cast<unsigned char>(word[first]))) ++first;
    while (last > first && std::ispunct(static_cast<unsigned char>(word[last - 1]))) --last;
    return word.substr(first, last - first);
}

[[maybe_unused]] bool audio_is_ordered(const std::vector<AudioEvent>& audio_events) {
    for (size_t i = 1; i < audio_events.size(); ++i) {
        if (audio_events[i].start < audio_events[i - 1].end) {
            return false;
        }
    }
    return true;
}

void validate(const AlignmentConfig& config) {
    if (!(config.segment_duration > 0.0) || !std::isfinite(config.segment_duration)) {
        throw std::invalid_argument("segment_duration must be positive");
    }
    if (config.scene_audio_window < 0.0 || config.emotion_visual_window < 0.0) {
        throw std::invalid_argument("sync windows must be non-negative");
    }
    for (size_t i = 1; i < config.confidence_steps.size(); ++i) {
        if (config.confidence_steps[i].max_distance < config.confidence_steps[i - 1].max_distance) {
            throw std::invalid_argument("confidence steps must be ordered by distance");
        }
    }
}

} // namespace

std::vector<SceneChange> detect_scene_changes(const std::vector<VisualEvent>& visual_events) {
    std::vector<SceneChange> changes;
    for (size_t i = 1; i < visual_events.size(); ++i) {
        const VisualEvent& prev = visual_events[i - 1];
        const VisualEvent& curr = visual_events[i];
        if (prev.scene_type != curr.scene_type) {
            changes.push_back({curr.timestamp, i, prev.scene_type, curr.scene_type});
        }
    }
    return changes;
}

float semantic_overlap(const std::set<std::string>& themes, const std::string& text) {
    if (themes.empty() || text.empty()) {
        return 0.0f;
    }

    std::set<std::string> words;
    std::istringstream stream(text);
    std::string word;
    while (stream >> word) {
        word = strip_punctuation(lowercase(word));
        if (!word.empty()) {
            words.insert(word);
        }
    }

    std::set<std::string> theme_words;
    for (const auto& theme : themes) {
        theme_words.insert(lowercase(theme));
    }

    size_t common = 0;
    for (const auto& theme : theme_words) {
        if (words.count(theme) > 0) {
            ++common;
        }
    }
    return clamp01(static_cast<double>(common) / static_cast<double>(theme_words.size()));
}

TimelineAligner::TimelineAligner(const AlignmentConfig& config) : config_(config) {
    validate(config_);
}

AlignmentResult TimelineAligner::align(const std::vector<VisualEvent>& visual_events,
                                       const std::vector<AudioEvent>& audio_events,
                                       const std::vector<EmotionEvent>& emotion_events) const {
    // Transcriber output is non-overlapping and ordered by start.
    assert(audio_is_ordered(audio_events));

    AlignmentResult result;
    result.timeline = build_unified_timeline(visual_events, audio_events);
    result.temporal_segments = match_temporal_segments(visual_events, audio_events);
    result.scene_changes = detect_scene_changes(visual_events);
    result.sync_events = detect_sync_events(visual_events, result.scene_changes,
                                            audio_events, emotion_events);
    result.semantic_links = find_semantic_links(result.temporal_segments);
    result.quality = assess_quality(result.temporal_segments, result.sync_events);
    return result;
}

UnifiedTimeline TimelineAligner::build_unified_timeline(
    const std::vector<VisualEvent>& visual_events,
    const std::vector<AudioEvent>& audio_events) const {
    UnifiedTimeline timeline;
    timeline.segment_duration = config_.segment_duration;
    if (visual_events.empty() && audio_events.empty()) {
        return timeline;
    }

    double total = 0.0;
    // Non-finite times would make the bucket count meaningless.
    for (const auto& event : visual_events) {
        if (std::isfinite(event.timestamp)) total = std::max(total, event.timestamp);
    }
    for (const auto& event : audio_events) {
        if (std::isfinite(event.end)) total = std::max(total, event.end);
    }
    timeline.total_duration = total;

    const size_t bucket_count = static_cast<size_t>(std::floor(total / config_.segment_duration)) + 1;
    timeline.segments.reserve(bucket_count);

    size_t with_visual = 0;
    size_t with_audio = 0;
    size_t with_both = 0;

    for (size_t i = 0; i < bucket_count; ++i) {
        TimeSegment segment;
        segment.segment_id = static_cast<uint32_t>(i);
        segment.start = static_cast<double>(i) * config_.segment_duration;
        segment.end = segment.start + config_.segment_duration;

        for (size_t v = 0; v < visual_events.size(); ++v) {
            if (contains_instant(segment.start, segment.end, visual_events[v].timestamp)) {
                segment.visual_events.push_back(v);
            }
        }
        for (size_t a = 0; a < audio_events.size(); ++a) {
            if (intersects_bucket(audio_events[a], segment.start, segment.end)) {
                segment.audio_events.push_back(a);
            }
        }

        segment.has_visual = !segment.visual_events.empty();
        segment.has_audio = !segment.audio_events.empty();
        segment.modality_overlap = segment.has_visual && segment.has_audio;

        with_visual += segment.has_visual ? 1 : 0;
        with_audio += segment.has_audio ? 1 : 0;
        with_both += segment.modality_overlap ? 1 : 0;

        timeline.segments.push_back(std::move(segment));
    }

    const double n = static_cast<double>(bucket_count);
    timeline.coverage.visual_coverage = static_cast<float>(with_visual / n);
    timeline.coverage.audio_coverage = static_cast<float>(with_audio / n);
    timeline.coverage.overlap_coverage = static_cast<float>(with_both / n);
    return timeline;
}

std::vector<TemporalSegment> TimelineAligner::match_temporal_segments(
    const std::vector<VisualEvent>& visual_events,
    const std::vector<AudioEvent>& audio_events) const {
    std::vector<TemporalSegment> segments;
    segments.reserve(audio_events.size());

    for (size_t a = 0; a < audio_events.size(); ++a) {
        const AudioEvent& audio = audio_events[a];

        TemporalSegment segment;
        segment.audio_index = a;
        segment.start = audio.start;
        segment.end = audio.end;
        segment.text = audio.text;
        segment.audio_confidence = audio.confidence;

        // Segments without visual coverage are kept: the gap is information.
        for (size_t v = 0; v < visual_events.size(); ++v) {
            const VisualEvent& visual = visual_events[v];
            if (!contains_instant(audio.start, audio.end, visual.timestamp)) {
                continue;
            }
            segment.visual_indices.push_back(v);
            segment.themes.insert(visual.themes.begin(), visual.themes.end());
            segment.objects.insert(visual.objects.begin(), visual.objects.end());
            segment.scene_types.insert(visual.scene_type);
        }
        segment.visual_frame_count = segment.visual_indices.size();

        segments.push_back(std::move(segment));
    }
    return segments;
}

std::vector<SyncEvent> TimelineAligner::detect_sync_events(
    const std::vector<VisualEvent>& visual_events,
    const std::vector<SceneChange>& scene_changes,
    const std::vector<AudioEvent>& audio_events,
    const std::vector<EmotionEvent>& emotion_events) const {
    std::vector<SyncEvent> events;

    for (size_t s = 0; s < scene_changes.size(); ++s) {
        const double t = scene_changes[s].timestamp;
        SyncEvent sync;
        sync.timestamp = t;
        sync.sync_type = SyncType::SceneAudioSync;
        sync.trigger_index = s;
        sync.min_distance = std::numeric_limits<double>::infinity();

        for (size_t a = 0; a < audio_events.size(); ++a) {
            const double d = distance_to_interval(t, audio_events[a].start, audio_events[a].end);
            if (d <= config_.scene_audio_window) {
                sync.matched_indices.push_back(a);
                sync.min_distance = std::min(sync.min_distance, d);
            }
        }

        if (!sync.matched_indices.empty()) {
            sync.sync_confidence = sync_confidence(sync.min_distance);
            events.push_back(std::move(sync));
        }
    }

    for (size_t e = 0; e < emotion_events.size(); ++e) {
        const double t = emotion_events[e].timestamp;
        SyncEvent sync;
        sync.timestamp = t;
        sync.sync_type = SyncType::EmotionVisualSync;
        sync.trigger_index = e;
        sync.min_distance = std::numeric_limits<double>::infinity();

        for (size_t v = 0; v < visual_events.size(); ++v) {
            const double d = std::abs(visual_events[v].timestamp - t);
            if (d <= config_.emotion_visual_window) {
                sync.matched_indices.push_back(v);
                sync.min_distance = std::min(sync.min_distance, d);
            }
        }

        if (!sync.matched_indices.empty()) {
            sync.sync_confidence = sync_confidence(sync.min_distance);
            events.push_back(std::move(sync));
        }
    }

    return events;
}

std::vector<SemanticLink> TimelineAligner::find_semantic_links(
    const std::vector<TemporalSegment>& temporal_segments) const {
    std::vector<SemanticLink> links;
    for (size_t i = 0; i < temporal_segments.size(); ++i) {
        const TemporalSegment& segment = temporal_segments[i];
        if (segment.visual_frame_count == 0 || segment.text.empty()) {
            continue;
        }
        const float overlap = semantic_overlap(segment.themes, segment.text);
        if (overlap > config_.semantic_link_threshold) {
            links.push_back({i, segment.start, segment.end, overlap});
        }
    }
    return links;
}

AlignmentQuality TimelineAligner::assess_quality(
    const std::vector<TemporalSegment>& temporal_segments,
    const std::vector<SyncEvent>& sync_events) const {
    AlignmentQuality quality;

    if (!temporal_segments.empty()) {
        const auto covered = std::count_if(
            temporal_segments.begin(), temporal_segments.end(),
            [](const TemporalSegment& s) { return s.visual_frame_count > 0; });
        const double n = static_cast<double>(temporal_segments.size());
        quality.coverage = clamp01(static_cast<double>(covered) / n);
        quality.sync_ratio = clamp01(static_cast<double>(sync_events.size()) / n);
    }

    if (!sync_events.empty()) {
        double sum = 0.0;
        for (const auto& event : sync_events) {
            sum += event.sync_confidence;
        }
        quality.avg_sync_confidence = clamp01(sum / static_cast<double>(sync_events.size()));
    }

    quality.overall_quality = clamp01(
        static_cast<double>(config_.coverage_weight) * quality.coverage +
        static_cast<double>(config_.sync_ratio_weight) * quality.sync_ratio +
        static_cast<double>(config_.sync_confidence_weight) * quality.avg_sync_confidence);

    if (quality.overall_quality > config_.high_quality_threshold) {
        quality.quality_level = QualityLevel::High;
    } else if (quality.overall_quality > config_.medium_quality_threshold) {
        quality.quality_level = QualityLevel::Medium;
    } else {
        quality.quality_level = QualityLevel::Low;
    }
    return quality;
}

float TimelineAligner::sync_confidence(double min_distance) const {
    for (const auto& step : config_.confidence_steps) {
        if (min_distance <= step.max_distance) {
            return step.confidence;
        }
    }
    return config_.fallback_confidence;
}

} // namespace vidsync
