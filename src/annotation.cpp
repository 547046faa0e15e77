#include "vidsync/annotation.hpp"
#include "vidsync/emotion_timeline.hpp"
#include "vidsync/errors.hpp"
#include "vidsync/serialization.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <utility>

using json = nlohmann::json;

namespace vidsync {

namespace {

json read_json_file(const std::string& path, const char* what) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error(std::string("Cannot open ") + what + " file: " + path);
    }
    try {
        return json::parse(file);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Invalid ") + what + " file " + path + ": " + e.what());
    }
}

void sort_labels(std::vector<VisualEvent>& labels) {
    std::stable_sort(labels.begin(), labels.end(),
                     [](const VisualEvent& a, const VisualEvent& b) {
                         return a.timestamp < b.timestamp;
                     });
}

} // namespace

LabelFileAnnotator::LabelFileAnnotator(const std::string& labels_path, double tolerance)
    : tolerance_(tolerance) {
    const json root = read_json_file(labels_path, "labels");
    const json& entries = root.is_object() && root.contains("frames") ? root.at("frames") : root;
    if (!entries.is_array()) {
        throw std::runtime_error("Labels file must hold an array of frame labels: " + labels_path);
    }

    labels_ = entries.get<std::vector<VisualEvent>>();
    sort_labels(labels_);

    std::cout << "[LabelFileAnnotator] Loaded " << labels_.size() << " frame labels from "
              << labels_path << std::endl;
}

LabelFileAnnotator::LabelFileAnnotator(std::vector<VisualEvent> labels, double tolerance)
    : labels_(std::move(labels)), tolerance_(tolerance) {
    sort_labels(labels_);
}

VisualEvent LabelFileAnnotator::annotate(const FrameInfo& frame, const cv::Mat& /*pixels*/) {
    auto it = std::lower_bound(labels_.begin(), labels_.end(), frame.timestamp,
                               [](const VisualEvent& label, double t) {
                                   return label.timestamp < t;
                               });

    const VisualEvent* best = nullptr;
    double best_distance = tolerance_;
    if (it != labels_.end() && std::abs(it->timestamp - frame.timestamp) <= best_distance) {
        best = &*it;
        best_distance = std::abs(it->timestamp - frame.timestamp);
    }
    if (it != labels_.begin()) {
        const VisualEvent& prev = *(it - 1);
        if (std::abs(prev.timestamp - frame.timestamp) <= best_distance) {
            best = &prev;
        }
    }

    if (!best) {
        throw AnnotationError("No label within " + std::to_string(tolerance_) +
                              "s of frame " + std::to_string(frame.frame_number));
    }

    VisualEvent event = *best;
    event.timestamp = frame.timestamp;
    event.frame_number = frame.frame_number;
    return event;
}

TranscriptFileTranscriber::TranscriptFileTranscriber(std::string transcript_path)
    : transcript_path_(std::move(transcript_path)) {}

Transcript TranscriptFileTranscriber::transcribe(const std::string& media_path) {
    json root;
    try {
        root = read_json_file(transcript_path_, "transcript");
    } catch (const std::runtime_error& e) {
        throw TranscriptionError(e.what());
    }

    if (!root.is_object() || !root.contains("segments") || !root.at("segments").is_array()) {
        throw TranscriptionError("Transcript for " + media_path + " has no segments array");
    }

    Transcript transcript;
    try {
        transcript.audio_events = normalize_audio_events(
            root.at("segments").get<std::vector<AudioEvent>>());

        if (root.contains("emotion_changes")) {
            transcript.emotion_events = root.at("emotion_changes").get<std::vector<EmotionEvent>>();
        } else {
            std::vector<EmotionSegment> emotions;
            for (const auto& segment : root.at("segments")) {
                if (segment.contains("emotion")) {
                    emotions.push_back(segment.get<EmotionSegment>());
                }
            }
            std::stable_sort(emotions.begin(), emotions.end(),
                             [](const EmotionSegment& a, const EmotionSegment& b) {
                                 return a.start < b.start;
                             });
            transcript.emotion_events = detect_emotion_transitions(emotions);
        }
    } catch (const json::exception& e) {
        throw TranscriptionError("Malformed transcript " + transcript_path_ + ": " + e.what());
    }

    std::cout << "[TranscriptFileTranscriber] " << transcript.audio_events.size()
              << " speech segments, " << transcript.emotion_events.size()
              << " emotion changes for " << media_path << std::endl;
    return transcript;
}

std::vector<AudioEvent> normalize_audio_events(std::vector<AudioEvent> events) {
    std::stable_sort(events.begin(), events.end(),
                     [](const AudioEvent& a, const AudioEvent& b) { return a.start < b.start; });

    for (size_t i = 0; i < events.size(); ++i) {
        if (events[i].end < events[i].start) {
            throw TranscriptionError("Speech segment " + std::to_string(i) + " ends before it starts");
        }
        if (i > 0 && events[i].start < events[i - 1].end) {
            throw TranscriptionError("Speech segments " + std::to_string(i - 1) + " and " +
                                     std::to_string(i) + " overlap");
        }
    }
    return events;
}

} // namespace vidsync
