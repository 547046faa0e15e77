#pragma once

#include "vidsync/types.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace vidsync {

// Semantic labelling of a key frame. Implementations wrap an external
// vision model; a failure on one frame throws AnnotationError.
class VisualAnnotator {
public:
    virtual ~VisualAnnotator() = default;
    virtual VisualEvent annotate(const FrameInfo& frame, const cv::Mat& pixels) = 0;
};

struct Transcript {
    std::vector<AudioEvent> audio_events;      // non-overlapping, ordered by start
    std::vector<EmotionEvent> emotion_events;
};

// Speech (and emotion) extraction for a media file. Throws TranscriptionError.
class Transcriber {
public:
    virtual ~Transcriber() = default;
    virtual Transcript transcribe(const std::string& media_path) = 0;
};

// Serves labels produced offline: a JSON array of
// {timestamp, scene_type, themes, objects, confidence} records.
class LabelFileAnnotator : public VisualAnnotator {
public:
    explicit LabelFileAnnotator(const std::string& labels_path, double tolerance = 0.5);
    LabelFileAnnotator(std::vector<VisualEvent> labels, double tolerance);

    VisualEvent annotate(const FrameInfo& frame, const cv::Mat& pixels) override;

    size_t label_count() const { return labels_.size(); }

private:
    std::vector<VisualEvent> labels_;   // sorted by timestamp
    double tolerance_;
};

// Reads a transcript produced offline:
// {"segments": [{start, end, text, confidence, emotion?}], "emotion_changes": [...]}.
// Without explicit emotion_changes, transitions are derived from segment emotions.
class TranscriptFileTranscriber : public Transcriber {
public:
    explicit TranscriptFileTranscriber(std::string transcript_path);

    Transcript transcribe(const std::string& media_path) override;

private:
    std::string transcript_path_;
};

// Sorts by start and rejects overlaps or negative durations.
std::vector<AudioEvent> normalize_audio_events(std::vector<AudioEvent> events);

} // namespace vidsync
