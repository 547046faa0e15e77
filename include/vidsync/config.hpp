#pragma once

#include "vidsync/video_processor.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace vidsync {

// Reads {"num_threads": N, "extraction": {...}, "alignment": {...}}.
// Missing keys keep their defaults; malformed or out-of-range values throw
// std::runtime_error prefixed with "[Config]".
AnalysisConfig load_config_json(const std::string& path);
AnalysisConfig parse_config(const nlohmann::json& root, const AnalysisConfig& defaults = {});

void validate_config(const AnalysisConfig& config);

} // namespace vidsync
