#include <algorithm>
#include <array>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "persondet/common.hpp"
#include "persondet/config.hpp"
#include "persondet/detector.hpp"
#include "persondet/pipeline.hpp"

namespace {

const std::array<const char*, 5> kVideoExtensions = {".mp4", ".avi", ".mov", ".mkv", ".wmv"};

struct CliOptions {
    std::string input;
    std::string output;
    std::string config_path;

    std::optional<std::string> model;
    std::optional<std::string> labels;
    std::optional<double> conf;
    std::optional<double> iou;
    std::optional<std::string> device;
    std::optional<std::string> codec;
    std::optional<bool> show_fps;
};

void printUsage(const char* executable) {
    std::cout << "Usage: " << executable << " --input <video> --output <video> [options]\n"
              << "Detects people in a video file and writes an annotated copy.\n\n"
              << "Options:\n"
              << "  --config <yaml>    load settings from a YAML file (flags below override it)\n"
              << "  --model <onnx>     detection model (default: yolo26x.onnx)\n"
              << "  --labels <yaml>    class-name file with a 'names' list\n"
              << "  --conf <0..1>      confidence threshold (default: 0.30)\n"
              << "  --iou <0..1>       IoU threshold (default: 0.45)\n"
              << "  --device <d>       auto, cpu or cuda (default: auto)\n"
              << "  --codec <cccc>     output fourcc (default: mp4v)\n"
              << "  --show-fps         draw the FPS overlay (default)\n"
              << "  --no-fps           do not draw the FPS overlay\n"
              << "  -h, --help         show this message" << std::endl;
}

double parseNumber(const std::string& flag, const std::string& value) {
    std::size_t consumed = 0;
    double result = 0.0;
    try {
        result = std::stod(value, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed != value.size() || value.empty()) {
        throw std::invalid_argument("Invalid number for " + flag + ": " + value);
    }
    return result;
}

void progressCallback(double progress, int current, int total, double fps) {
    constexpr int kBarLength = 40;
    int filled = static_cast<int>(kBarLength * progress / 100.0);
    filled = std::clamp(filled, 0, kBarLength);
    std::string bar(static_cast<std::size_t>(filled), '#');
    bar.append(static_cast<std::size_t>(kBarLength - filled), ' ');

    std::cout << "\r[" << bar << "] " << std::fixed << std::setprecision(1) << progress << "% | "
              << "Frame " << current << "/" << total << " | "
              << "FPS: " << fps << std::defaultfloat << std::flush;
}

bool hasVideoExtension(const std::string& path) {
    std::string lowered = persondet::toLower(std::filesystem::path(path).extension().string());
    return std::any_of(kVideoExtensions.begin(), kVideoExtensions.end(),
                       [&](const char* ext) { return lowered == ext; });
}

void printBanner(const CliOptions& options, const persondet::AppConfig& config) {
    const std::string rule(60, '=');
    std::cout << rule << "\n"
              << "PERSON DETECTION\n"
              << rule << "\n"
              << "Input: " << options.input << "\n"
              << "Output: " << options.output << "\n"
              << "Model: " << config.detector.model_path << "\n"
              << "Confidence threshold: " << config.detector.conf_threshold << "\n"
              << "IoU threshold: " << config.detector.iou_threshold << "\n"
              << rule << "\n" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    CliOptions options;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto next = [&]() -> std::string {
                if (i + 1 >= argc) {
                    throw std::invalid_argument("Missing value for " + arg);
                }
                return argv[++i];
            };

            if (arg == "--input") {
                options.input = next();
            } else if (arg == "--output") {
                options.output = next();
            } else if (arg == "--config") {
                options.config_path = next();
            } else if (arg == "--model") {
                options.model = next();
            } else if (arg == "--labels") {
                options.labels = next();
            } else if (arg == "--conf") {
                options.conf = parseNumber(arg, next());
            } else if (arg == "--iou") {
                options.iou = parseNumber(arg, next());
            } else if (arg == "--device") {
                options.device = next();
            } else if (arg == "--codec") {
                options.codec = next();
            } else if (arg == "--show-fps") {
                options.show_fps = true;
            } else if (arg == "--no-fps") {
                options.show_fps = false;
            } else if (arg == "--help" || arg == "-h") {
                printUsage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                printUsage(argv[0]);
                return 1;
            }
        }
    } catch (const std::invalid_argument& ex) {
        std::cerr << ex.what() << "\n";
        printUsage(argv[0]);
        return 1;
    }

    if (options.input.empty() || options.output.empty()) {
        std::cerr << "Both --input and --output are required\n";
        printUsage(argv[0]);
        return 1;
    }

    if (!std::filesystem::exists(options.input)) {
        std::cerr << "ERROR: input file not found: " << options.input << std::endl;
        return 1;
    }

    if (!hasVideoExtension(options.input)) {
        std::cerr << "WARNING: unsupported file extension. Recommended: .mp4, .avi, .mov, .mkv, .wmv"
                  << std::endl;
    }

    try {
        persondet::AppConfig config;
        if (!options.config_path.empty()) {
            config = persondet::loadConfig(options.config_path);
        }

        if (options.model) config.detector.model_path = *options.model;
        if (options.labels) config.detector.labels_path = *options.labels;
        if (options.conf) config.detector.conf_threshold = *options.conf;
        if (options.iou) config.detector.iou_threshold = *options.iou;
        if (options.device) config.detector.device = persondet::toLower(*options.device);
        if (options.codec) config.output.codec = *options.codec;
        if (options.show_fps) config.output.show_fps = *options.show_fps;

        persondet::validateConfig(config);
        persondet::resolveTargetLabel(config.detector);

        printBanner(options, config);

        std::cout << "Initializing detector..." << std::endl;
        std::unique_ptr<persondet::Detector> detector = persondet::create_detector(config.detector);
        if (!detector) {
            std::cerr << "ERROR: no detector available for model " << config.detector.model_path << std::endl;
            return 1;
        }
        persondet::ModelGuard model(*detector);

        persondet::ModelInfo info = detector->info();
        std::cout << "\nModel loaded: " << info.model_name << "\n"
                  << "Device: " << persondet::toLower(info.device) << "\n"
                  << "Task: " << info.task << "\n" << std::endl;

        persondet::VideoProcessor processor(*detector, options.input, options.output, config.output.codec);
        persondet::ProcessingSummary summary = processor.process_video(progressCallback, config.output.show_fps);

        std::cout << "\nProcessing finished: " << summary.total_frames << " frames written to "
                  << summary.output_path << std::endl;
    } catch (const std::exception& ex) {
        std::cerr << "\nERROR: " << ex.what() << std::endl;
        return 1;
    }

    return 0;
}
