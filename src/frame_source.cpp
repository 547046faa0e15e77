#include "vidsync/frame_source.hpp"
#include "vidsync/errors.hpp"
#include <cmath>
#include <stdexcept>
#include <utility>

namespace vidsync {

namespace {

// A container that lies about its length would otherwise keep the scan
// spinning on failed grabs.
constexpr int kMaxConsecutiveGrabFailures = 8;

} // namespace

VideoCaptureSource::VideoCaptureSource(const std::string& video_path)
    : path_(video_path), cap_(video_path) {
    if (!cap_.isOpened()) {
        throw SourceUnreadable("Failed to open video: " + video_path);
    }

    fps_ = cap_.get(cv::CAP_PROP_FPS);
    const double count = cap_.get(cv::CAP_PROP_FRAME_COUNT);
    total_frames_ = count > 0 ? static_cast<int64_t>(count) : -1;
}

VideoCaptureSource::~VideoCaptureSource() {
    cap_.release();
}

const std::string& VideoCaptureSource::id() const {
    return path_;
}

double VideoCaptureSource::fps() const {
    return fps_;
}

int64_t VideoCaptureSource::total_frame_count() const {
    return total_frames_;
}

bool VideoCaptureSource::grab_frame() {
    if (exhausted_) {
        return false;
    }
    if (cap_.grab()) {
        consecutive_failures_ = 0;
        return true;
    }
    // Without an advertised length a failed grab is the end of the stream.
    if (total_frames_ < 0 || position_ >= total_frames_ ||
        ++consecutive_failures_ > kMaxConsecutiveGrabFailures) {
        exhausted_ = true;
    }
    return false;
}

ReadStatus VideoCaptureSource::next(FramePacket& out) {
    const int64_t frame_number = position_;
    if (!grab_frame()) {
        if (exhausted_) {
            return ReadStatus::EndOfStream;
        }
        ++position_;
        return ReadStatus::DecodeError;
    }
    ++position_;

    // Decode into a fresh buffer so earlier packets stay valid.
    cv::Mat frame;
    if (!cap_.retrieve(frame) || frame.empty()) {
        return ReadStatus::DecodeError;
    }

    out.image = frame;
    out.frame_number = frame_number;
    out.timestamp = fps_ > 0.0
        ? static_cast<double>(frame_number) / fps_
        : cap_.get(cv::CAP_PROP_POS_MSEC) / 1000.0;
    return ReadStatus::Ok;
}

bool VideoCaptureSource::skip() {
    if (!grab_frame() && exhausted_) {
        return false;
    }
    ++position_;
    return true;
}

MatSequenceSource::MatSequenceSource(std::vector<cv::Mat> frames, double fps, std::string id)
    : frames_(std::move(frames)), fps_(fps), id_(std::move(id)) {
    if (!(fps_ > 0.0) || !std::isfinite(fps_)) {
        throw std::invalid_argument("MatSequenceSource needs a positive frame rate");
    }
}

const std::string& MatSequenceSource::id() const {
    return id_;
}

double MatSequenceSource::fps() const {
    return fps_;
}

int64_t MatSequenceSource::total_frame_count() const {
    return static_cast<int64_t>(frames_.size());
}

ReadStatus MatSequenceSource::next(FramePacket& out) {
    if (position_ >= frames_.size()) {
        return ReadStatus::EndOfStream;
    }
    const size_t index = position_++;
    if (frames_[index].empty()) {
        return ReadStatus::DecodeError;
    }

    out.image = frames_[index];
    out.frame_number = static_cast<int64_t>(index);
    out.timestamp = static_cast<double>(index) / fps_;
    return ReadStatus::Ok;
}

bool MatSequenceSource::skip() {
    if (position_ >= frames_.size()) {
        return false;
    }
    ++position_;
    return true;
}

VideoInfo probe_video(const std::string& video_path) {
    cv::VideoCapture cap(video_path);
    if (!cap.isOpened()) {
        throw SourceUnreadable("Cannot open video file: " + video_path);
    }

    VideoInfo info;
    info.total_frames = static_cast<int64_t>(cap.get(cv::CAP_PROP_FRAME_COUNT));
    info.fps = cap.get(cv::CAP_PROP_FPS);
    info.duration = info.fps > 0.0 ? static_cast<double>(info.total_frames) / info.fps : 0.0;
    info.frame_size = cv::Size(
        static_cast<int>(cap.get(cv::CAP_PROP_FRAME_WIDTH)),
        static_cast<int>(cap.get(cv::CAP_PROP_FRAME_HEIGHT))
    );

    // Get codec information
    int fourcc = static_cast<int>(cap.get(cv::CAP_PROP_FOURCC));
    char codec_chars[5];
    codec_chars[0] = static_cast<char>(fourcc & 0xFF);
    codec_chars[1] = static_cast<char>((fourcc >> 8) & 0xFF);
    codec_chars[2] = static_cast<char>((fourcc >> 16) & 0xFF);
    codec_chars[3] = static_cast<char>((fourcc >> 24) & 0xFF);
    codec_chars[4] = '\0';
    info.codec = std::string(codec_chars);

    return info;
}

} // namespace vidsync
