#include "vidsync/annotation.hpp"
#include "vidsync/config.hpp"
#include "vidsync/console.hpp"
#include "vidsync/frame_extractor.hpp"
#include "vidsync/serialization.hpp"
#include "vidsync/video_processor.hpp"
#include <iostream>
#include <chrono>
#include <nlohmann/json.hpp>
#include <fstream>
#include <memory>
#include <optional>

using json = nlohmann::json;

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS] VIDEO_PATH\n"
              << "Options:\n"
              << "  -c, --config FILE        JSON configuration file\n"
              << "  -f, --frames NUM         Maximum key frames (default: 100)\n"
              << "  --scene-threshold NUM    Scene change threshold in [0,1] (default: 0.3)\n"
              << "  --min-interval SEC       Minimum seconds between key frames (default: 1.0)\n"
              << "  --quality-threshold NUM  High quality threshold in [0,1] (default: 0.5)\n"
              << "  --uniform NUM            Sample NUM evenly spaced frames instead\n"
              << "  --frames-dir DIR         Write key frames as JPEG into DIR\n"
              << "  -t, --threads NUM        Number of threads (default: auto)\n"
              << "  --labels FILE            Frame labels (JSON); enables full analysis\n"
              << "  --transcript FILE        Speech transcript (JSON)\n"
              << "  --output FILE            Output JSON file\n"
              << "  --info                   Show video information only\n"
              << "  -h, --help               Show this help\n";
}

namespace {

struct CliOverrides {
    std::optional<int> max_frames;
    std::optional<float> scene_threshold;
    std::optional<double> min_interval;
    std::optional<float> quality_threshold;
    std::optional<std::string> frames_dir;
    std::optional<int> num_threads;
};

void apply_overrides(vidsync::AnalysisConfig& config, const CliOverrides& cli) {
    if (cli.max_frames) config.extraction.max_frames = *cli.max_frames;
    if (cli.scene_threshold) config.extraction.scene_threshold = *cli.scene_threshold;
    if (cli.min_interval) config.extraction.min_interval = *cli.min_interval;
    if (cli.quality_threshold) config.extraction.quality_threshold = *cli.quality_threshold;
    if (cli.frames_dir) config.extraction.output_dir = *cli.frames_dir;
    if (cli.num_threads) config.num_threads = *cli.num_threads;
}

void write_output(const json& output_json, const std::string& output_file, std::ostream& out) {
    if (output_file.empty()) {
        out << output_json.dump(2) << std::endl;
        return;
    }
    std::ofstream file(output_file);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write output file: " + output_file);
    }
    file << output_json.dump(2);
    std::cout << "Results saved to: " << output_file << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string config_file;
    std::string video_path;
    std::string labels_file;
    std::string transcript_file;
    std::string output_file;
    int uniform_count = 0;
    bool info_only = false;
    CliOverrides cli;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "-c" || arg == "--config") {
                if (++i < argc) config_file = argv[i];
            } else if (arg == "-f" || arg == "--frames") {
                if (++i < argc) cli.max_frames = std::stoi(argv[i]);
            } else if (arg == "--scene-threshold") {
                if (++i < argc) cli.scene_threshold = std::stof(argv[i]);
            } else if (arg == "--min-interval") {
                if (++i < argc) cli.min_interval = std::stod(argv[i]);
            } else if (arg == "--quality-threshold") {
                if (++i < argc) cli.quality_threshold = std::stof(argv[i]);
            } else if (arg == "--uniform") {
                if (++i < argc) uniform_count = std::stoi(argv[i]);
            } else if (arg == "--frames-dir") {
                if (++i < argc) cli.frames_dir = argv[i];
            } else if (arg == "-t" || arg == "--threads") {
                if (++i < argc) cli.num_threads = std::stoi(argv[i]);
            } else if (arg == "--labels") {
                if (++i < argc) labels_file = argv[i];
            } else if (arg == "--transcript") {
                if (++i < argc) transcript_file = argv[i];
            } else if (arg == "--output") {
                if (++i < argc) output_file = argv[i];
            } else if (arg == "--info") {
                info_only = true;
            } else if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else if (video_path.empty()) {
                video_path = arg;
            } else {
                std::cerr << "Error: Unexpected argument " << arg << std::endl;
                return 1;
            }
        }
    } catch (const std::logic_error& e) {
        std::cerr << "Error: Invalid numeric argument (" << e.what() << ")" << std::endl;
        return 1;
    }

    if (video_path.empty()) {
        std::cerr << "Error: No video path provided\n";
        return 1;
    }

    // Progress and log lines must not corrupt JSON written to stdout.
    vidsync::StdoutDiversion diversion(output_file.empty());

    try {
        vidsync::AnalysisConfig config;
        if (!config_file.empty()) {
            config = vidsync::load_config_json(config_file);
        }
        apply_overrides(config, cli);
        vidsync::validate_config(config);

        vidsync::VideoProcessor processor(config);

        if (info_only) {
            json info_json = processor.get_video_info(video_path);
            info_json["video_path"] = video_path;
            write_output(info_json, output_file, diversion.stdout_stream());
            return 0;
        }

        auto start_time = std::chrono::high_resolution_clock::now();
        json output_json;

        if (!labels_file.empty()) {
            vidsync::LabelFileAnnotator annotator(labels_file);
            std::unique_ptr<vidsync::TranscriptFileTranscriber> transcriber;
            if (!transcript_file.empty()) {
                transcriber = std::make_unique<vidsync::TranscriptFileTranscriber>(transcript_file);
            }

            auto report = processor.analyze_video(
                video_path, annotator, transcriber.get(),
                [](const std::string& phase, float percent, const std::string& message) {
                    std::cout << "[" << phase << "] " << static_cast<int>(percent) << "% "
                              << message << std::endl;
                });
            output_json = report;
        } else if (uniform_count > 0) {
            vidsync::FrameExtractor extractor(config.extraction);
            vidsync::VideoCaptureSource source(video_path);
            output_json = extractor.extract_uniform(source, uniform_count);
            output_json["video_path"] = video_path;
        } else {
            output_json = processor.extract_key_frames(video_path);
            output_json["video_path"] = video_path;
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        auto total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            end_time - start_time);
        output_json["total_time_ms"] = total_time.count();

        write_output(output_json, output_file, diversion.stdout_stream());

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
