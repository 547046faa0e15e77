#include "vidsync/config.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace vidsync {

namespace {

template <typename T>
T get_value(const json& node, const char* key, const T& def) {
    if (!node.contains(key)) return def;
    try {
        return node.at(key).get<T>();
    } catch (const json::type_error&) {
        throw std::runtime_error(std::string("[Config] wrong type for '") + key + "'");
    }
}

const json& get_section(const json& root, const char* key) {
    static const json empty = json::object();
    if (!root.contains(key)) return empty;
    const json& section = root.at(key);
    if (!section.is_object()) {
        throw std::runtime_error(std::string("[Config] ") + key + " must be an object!");
    }
    return section;
}

ExtractionConfig parse_extraction_config(const json& e, const ExtractionConfig& def) {
    ExtractionConfig c = def;
    c.scene_threshold = get_value(e, "scene_threshold", c.scene_threshold);
    c.min_interval = get_value(e, "min_interval", c.min_interval);
    c.max_frames = get_value(e, "max_frames", c.max_frames);
    c.quality_threshold = get_value(e, "quality_threshold", c.quality_threshold);
    c.output_dir = get_value(e, "output_dir", c.output_dir);
    c.keep_images = get_value(e, "keep_images", c.keep_images);
    return c;
}

std::vector<ConfidenceStep> parse_confidence_steps(const json& a,
                                                   const std::vector<ConfidenceStep>& def) {
    if (!a.contains("confidence_steps")) return def;
    const json& steps = a.at("confidence_steps");
    if (!steps.is_array()) {
        throw std::runtime_error("[Config] confidence_steps must be an array!");
    }
    std::vector<ConfidenceStep> out;
    for (const auto& step : steps) {
        if (!step.is_object()) {
            throw std::runtime_error("[Config] confidence_steps entries must be objects!");
        }
        ConfidenceStep s{};
        s.max_distance = get_value(step, "max_distance", 0.0);
        s.confidence = get_value(step, "confidence", 0.0f);
        out.push_back(s);
    }
    return out;
}

AlignmentConfig parse_alignment_config(const json& a, const AlignmentConfig& def) {
    AlignmentConfig c = def;
    c.segment_duration = get_value(a, "segment_duration", c.segment_duration);
    c.scene_audio_window = get_value(a, "scene_audio_window", c.scene_audio_window);
    c.emotion_visual_window = get_value(a, "emotion_visual_window", c.emotion_visual_window);
    c.confidence_steps = parse_confidence_steps(a, c.confidence_steps);
    c.fallback_confidence = get_value(a, "fallback_confidence", c.fallback_confidence);
    c.coverage_weight = get_value(a, "coverage_weight", c.coverage_weight);
    c.sync_ratio_weight = get_value(a, "sync_ratio_weight", c.sync_ratio_weight);
    c.sync_confidence_weight = get_value(a, "sync_confidence_weight", c.sync_confidence_weight);
    c.high_quality_threshold = get_value(a, "high_quality_threshold", c.high_quality_threshold);
    c.medium_quality_threshold = get_value(a, "medium_quality_threshold", c.medium_quality_threshold);
    c.semantic_link_threshold = get_value(a, "semantic_link_threshold", c.semantic_link_threshold);
    return c;
}

bool in_unit_range(double v) {
    return v >= 0.0 && v <= 1.0;
}

} // namespace

void validate_config(const AnalysisConfig& config) {
    const ExtractionConfig& e = config.extraction;
    if (!in_unit_range(e.scene_threshold)) {
        throw std::runtime_error("[Config] extraction.scene_threshold must be in [0,1]");
    }
    if (!in_unit_range(e.quality_threshold)) {
        throw std::runtime_error("[Config] extraction.quality_threshold must be in [0,1]");
    }
    if (e.min_interval < 0.0) {
        throw std::runtime_error("[Config] extraction.min_interval must be >= 0");
    }
    if (e.max_frames < 1) {
        throw std::runtime_error("[Config] extraction.max_frames must be >= 1");
    }

    const AlignmentConfig& a = config.alignment;
    if (a.segment_duration <= 0.0) {
        throw std::runtime_error("[Config] alignment.segment_duration must be > 0");
    }
    if (a.scene_audio_window < 0.0 || a.emotion_visual_window < 0.0) {
        throw std::runtime_error("[Config] alignment windows must be >= 0");
    }
    double previous = -1.0;
    for (const auto& step : a.confidence_steps) {
        if (step.max_distance <= previous) {
            throw std::runtime_error("[Config] confidence_steps must have increasing max_distance");
        }
        if (!in_unit_range(step.confidence)) {
            throw std::runtime_error("[Config] confidence_steps confidence must be in [0,1]");
        }
        previous = step.max_distance;
    }
    if (!in_unit_range(a.fallback_confidence) || !in_unit_range(a.semantic_link_threshold)) {
        throw std::runtime_error("[Config] alignment confidences must be in [0,1]");
    }
    if (a.medium_quality_threshold > a.high_quality_threshold) {
        throw std::runtime_error("[Config] medium_quality_threshold exceeds high_quality_threshold");
    }

    if (config.num_threads < 1) {
        throw std::runtime_error("[Config] num_threads must be >= 1");
    }
}

AnalysisConfig parse_config(const json& root, const AnalysisConfig& defaults) {
    if (!root.is_object()) {
        throw std::runtime_error("[Config] root must be an object!");
    }
    AnalysisConfig c = defaults;
    c.num_threads = get_value(root, "num_threads", c.num_threads);
    c.extraction = parse_extraction_config(get_section(root, "extraction"), c.extraction);
    c.alignment = parse_alignment_config(get_section(root, "alignment"), c.alignment);
    validate_config(c);
    return c;
}

AnalysisConfig load_config_json(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("[Config] cannot open " + path);
    }

    json root;
    try {
        root = json::parse(file);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("[Config] " + path + ": " + e.what());
    }

    AnalysisConfig config = parse_config(root);
    std::cout << "[Config] Loaded " << path << std::endl;
    return config;
}

} // namespace vidsync
