#pragma once

#include "vidsync/types.hpp"
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace vidsync {

enum class ExtractErrorCode {
    SourceUnreadable,
    Cancelled
};

class ExtractError : public std::runtime_error {
public:
    ExtractError(ExtractErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ExtractErrorCode code() const noexcept { return code_; }

private:
    ExtractErrorCode code_;
};

class SourceUnreadable : public ExtractError {
public:
    explicit SourceUnreadable(const std::string& message)
        : ExtractError(ExtractErrorCode::SourceUnreadable, message) {}
};

// Carries the key frames selected before the cancellation was observed.
class ExtractionCancelled : public ExtractError {
public:
    explicit ExtractionCancelled(std::vector<FrameInfo> partial)
        : ExtractError(ExtractErrorCode::Cancelled,
                       "Key frame extraction cancelled after " +
                       std::to_string(partial.size()) + " frames"),
          partial_(std::move(partial)) {}

    const std::vector<FrameInfo>& partial_frames() const noexcept { return partial_; }

private:
    std::vector<FrameInfo> partial_;
};

class AnnotationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class TranscriptionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace vidsync
