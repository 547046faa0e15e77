#pragma once

#include "vidsync/types.hpp"
#include <string>
#include <vector>

namespace vidsync {

// Signed valence used to weigh a transition; unknown labels count as 0.
float emotion_valence(const std::string& emotion);

EmotionChangeType classify_emotion_change(const std::string& from_emotion,
                                          const std::string& to_emotion);

// One EmotionEvent per adjacent pair of segments whose labels differ,
// stamped at the later segment's start. Segments are taken in order.
std::vector<EmotionEvent> detect_emotion_transitions(const std::vector<EmotionSegment>& segments);

} // namespace vidsync
