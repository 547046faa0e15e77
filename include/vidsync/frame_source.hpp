#pragma once

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace vidsync {

struct VideoInfo {
    int64_t total_frames = 0;
    double fps = 0.0;
    double duration = 0.0;
    cv::Size frame_size;
    std::string codec;
};

struct FramePacket {
    cv::Mat image;
    int64_t frame_number = 0;
    double timestamp = 0.0;
};

enum class ReadStatus {
    Ok,
    DecodeError,
    EndOfStream
};

// Sequential, forward-only frame stream. Every call to next() or skip()
// advances by exactly one frame.
class FrameSource {
public:
    virtual ~FrameSource() = default;

    virtual const std::string& id() const = 0;
    virtual double fps() const = 0;
    // -1 when the container does not advertise a count.
    virtual int64_t total_frame_count() const = 0;

    virtual ReadStatus next(FramePacket& out) = 0;
    // Advance without decoding pixels. Returns false at end of stream.
    virtual bool skip() = 0;
};

class VideoCaptureSource : public FrameSource {
public:
    explicit VideoCaptureSource(const std::string& video_path);
    ~VideoCaptureSource() override;

    const std::string& id() const override;
    double fps() const override;
    int64_t total_frame_count() const override;

    ReadStatus next(FramePacket& out) override;
    bool skip() override;

private:
    bool grab_frame();

    std::string path_;
    cv::VideoCapture cap_;
    double fps_ = 0.0;
    int64_t total_frames_ = -1;
    int64_t position_ = 0;
    int consecutive_failures_ = 0;
    bool exhausted_ = false;
};

// Frames already held in memory. An empty cv::Mat stands for a frame
// that fails to decode. fps must be positive.
class MatSequenceSource : public FrameSource {
public:
    MatSequenceSource(std::vector<cv::Mat> frames, double fps,
                      std::string id = "memory");

    const std::string& id() const override;
    double fps() const override;
    int64_t total_frame_count() const override;

    ReadStatus next(FramePacket& out) override;
    bool skip() override;

private:
    std::vector<cv::Mat> frames_;
    double fps_;
    std::string id_;
    size_t position_ = 0;
};

VideoInfo probe_video(const std::string& video_path);

} // namespace vidsync
