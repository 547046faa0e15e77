#include "vidsync/emotion_timeline.hpp"
#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace vidsync {

namespace {

const std::unordered_map<std::string, float>& valence_map() {
    static const std::unordered_map<std::string, float> map = {
        {"positive", 1.0f},
        {"excited", 1.2f},
        {"happy", 0.8f},
        {"neutral", 0.0f},
        {"negative", -1.0f},
        {"sad", -0.8f},
        {"angry", -1.2f},
        {"surprised", 0.5f},
    };
    return map;
}

bool is_positive(const std::string& e) {
    return e == "positive" || e == "excited" || e == "happy";
}

bool is_negative(const std::string& e) {
    return e == "negative" || e == "sad" || e == "angry";
}

bool is_neutral(const std::string& e) {
    return e == "neutral" || e == "surprised";
}

} // namespace

float emotion_valence(const std::string& emotion) {
    const auto& map = valence_map();
    auto it = map.find(emotion);
    return it != map.end() ? it->second : 0.0f;
}

EmotionChangeType classify_emotion_change(const std::string& from_emotion,
                                          const std::string& to_emotion) {
    if (is_positive(from_emotion) && is_negative(to_emotion)) {
        return EmotionChangeType::PositiveToNegative;
    }
    if (is_negative(from_emotion) && is_positive(to_emotion)) {
        return EmotionChangeType::NegativeToPositive;
    }
    if (is_neutral(from_emotion)) {
        return EmotionChangeType::NeutralToEmotional;
    }
    if (is_neutral(to_emotion)) {
        return EmotionChangeType::EmotionalToNeutral;
    }
    return EmotionChangeType::EmotionalShift;
}

std::vector<EmotionEvent> detect_emotion_transitions(const std::vector<EmotionSegment>& segments) {
    std::vector<EmotionEvent> transitions;
    for (size_t i = 1; i < segments.size(); ++i) {
        const EmotionSegment& prev = segments[i - 1];
        const EmotionSegment& curr = segments[i];
        if (prev.emotion == curr.emotion) {
            continue;
        }

        EmotionEvent event;
        event.timestamp = curr.start;
        event.from_emotion = prev.emotion;
        event.to_emotion = curr.emotion;
        event.intensity = std::abs(emotion_valence(curr.emotion) - emotion_valence(prev.emotion));
        event.change_type = classify_emotion_change(prev.emotion, curr.emotion);
        event.confidence = std::min(prev.confidence, curr.confidence);
        transitions.push_back(std::move(event));
    }
    return transitions;
}

} // namespace vidsync
