#include "vidsync/annotation.hpp"
#include "vidsync/frame_extractor.hpp"
#include "vidsync/frame_metrics.hpp"
#include "vidsync/frame_source.hpp"
#include "vidsync/timeline_aligner.hpp"
#include "vidsync/video_processor.hpp"
#include <benchmark/benchmark.h>
#include <chrono>
#include <cmath>
#include <random>
#include <opencv2/imgproc.hpp>
#include <iostream>
#include <thread>

namespace vidsync {

class BenchmarkFixture : public benchmark::Fixture {
public:
    void SetUp(const ::benchmark::State& /*state*/) override {
        config_.extraction.max_frames = 100;
        config_.num_threads = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));

        create_synthetic_frames();
        create_synthetic_events();
    }

    void TearDown(const ::benchmark::State& /*state*/) override {
        frames_.clear();
        visual_.clear();
        audio_.clear();
        emotion_.clear();
    }

protected:
    // 10 seconds at 30fps with a hard cut every 2 seconds.
    void create_synthetic_frames() {
        std::mt19937 gen(42);
        std::uniform_int_distribution<> dis(0, 255);

        cv::Scalar background;
        for (int i = 0; i < 300; ++i) {
            if (i % 60 == 0) {
                background = cv::Scalar(dis(gen), dis(gen), dis(gen));
            }
            cv::Mat frame(360, 640, CV_8UC3, background);

            int circle_x = (i * 5) % frame.cols;
            int circle_y = 180 + static_cast<int>(60 * std::sin(i * 0.1));
            cv::circle(frame, cv::Point(circle_x, circle_y), 40, cv::Scalar(255, 255, 255), -1);

            frames_.push_back(frame);
        }
    }

    void create_synthetic_events() {
        const char* scenes[] = {"office", "street", "kitchen"};
        for (int i = 0; i < 600; ++i) {
            VisualEvent v;
            v.timestamp = i * 0.5;
            v.scene_type = scenes[(i / 7) % 3];
            v.themes = {"meeting", "city", "cooking"};
            v.confidence = 0.8f;
            visual_.push_back(v);
        }
        for (int i = 0; i < 150; ++i) {
            AudioEvent a;
            a.start = i * 2.0;
            a.end = a.start + 1.5;
            a.text = "we discuss the meeting in the city";
            a.confidence = 0.9f;
            audio_.push_back(a);
        }
        for (int i = 0; i < 40; ++i) {
            EmotionEvent e;
            e.timestamp = i * 7.3;
            e.from_emotion = i % 2 ? "happy" : "sad";
            e.to_emotion = i % 2 ? "sad" : "happy";
            emotion_.push_back(e);
        }
    }

    AnalysisConfig config_;
    std::vector<cv::Mat> frames_;
    std::vector<VisualEvent> visual_;
    std::vector<AudioEvent> audio_;
    std::vector<EmotionEvent> emotion_;
};

BENCHMARK_DEFINE_F(BenchmarkFixture, KeyFrameExtraction)(benchmark::State& state) {
    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();

        MatSequenceSource source(frames_, 30.0);
        FrameExtractor extractor(config_.extraction);
        auto result = extractor.extract_key_frames(source);

        auto end = std::chrono::high_resolution_clock::now();
        auto elapsed_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(
            end - start);

        state.SetIterationTime(elapsed_seconds.count());
        state.counters["key_frames"] = static_cast<double>(result.frames.size());
        state.counters["evaluated"] = static_cast<double>(result.evaluated_frames);
        state.counters["frames_per_second"] =
            static_cast<double>(frames_.size()) / elapsed_seconds.count();
    }
}

BENCHMARK_DEFINE_F(BenchmarkFixture, FrameMetrics)(benchmark::State& state) {
    cv::Mat prev = to_grayscale(frames_[0]);
    cv::Mat curr = to_grayscale(frames_[61]);

    for (auto _ : state) {
        auto quality = assess_quality(curr);
        auto score = scene_change_score(prev, curr);
        auto hash = content_hash(curr);
        benchmark::DoNotOptimize(quality);
        benchmark::DoNotOptimize(score);
        benchmark::DoNotOptimize(hash);
    }
}

BENCHMARK_DEFINE_F(BenchmarkFixture, TimelineAlignment)(benchmark::State& state) {
    TimelineAligner aligner(config_.alignment);

    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();

        auto result = aligner.align(visual_, audio_, emotion_);

        auto end = std::chrono::high_resolution_clock::now();
        auto elapsed_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(
            end - start);

        state.SetIterationTime(elapsed_seconds.count());
        state.counters["segments"] = static_cast<double>(result.timeline.segments.size());
        state.counters["sync_events"] = static_cast<double>(result.sync_events.size());
        state.counters["overall_quality"] = result.quality.overall_quality;
    }
}

BENCHMARK_DEFINE_F(BenchmarkFixture, FullAnalysis)(benchmark::State& state) {
    config_.extraction.max_frames = static_cast<int>(state.range(0));
    VideoProcessor processor(config_);
    LabelFileAnnotator annotator(visual_, 0.5);

    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();

        MatSequenceSource source(frames_, 30.0, "synthetic");
        auto report = processor.analyze_source(source, "synthetic", annotator);

        auto end = std::chrono::high_resolution_clock::now();
        auto elapsed_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(
            end - start);

        state.SetIterationTime(elapsed_seconds.count());
        state.counters["max_frames"] = static_cast<double>(config_.extraction.max_frames);
        state.counters["visual_events"] = static_cast<double>(report.visual_events.size());
    }
}

BENCHMARK_REGISTER_F(BenchmarkFixture, KeyFrameExtraction)->UseManualTime()->Unit(benchmark::kMillisecond);
BENCHMARK_REGISTER_F(BenchmarkFixture, FrameMetrics)->Unit(benchmark::kMicrosecond);
BENCHMARK_REGISTER_F(BenchmarkFixture, TimelineAlignment)->UseManualTime()->Unit(benchmark::kMicrosecond);
BENCHMARK_REGISTER_F(BenchmarkFixture, FullAnalysis)->Range(4, 32)->UseManualTime()->Unit(benchmark::kMillisecond);

} // namespace vidsync

int main(int argc, char** argv) {
    std::cout << "vidsync - Performance Benchmarks" << std::endl;
    std::cout << "================================" << std::endl;

    std::cout << "System Information:" << std::endl;
    std::cout << "  CPU Cores: " << std::thread::hardware_concurrency() << std::endl;
    std::cout << "  OpenCV threads: " << cv::getNumThreads() << std::endl;
    std::cout << std::endl;

    ::benchmark::Initialize(&argc, argv);
    if (::benchmark::ReportUnrecognizedArguments(argc, argv)) return 1;
    ::benchmark::RunSpecifiedBenchmarks();

    std::cout << std::endl << "Benchmark completed!" << std::endl;

    return 0;
}
