#include "persondet/pipeline.hpp"

#include <chrono>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <system_error>
#include <utility>

#include "persondet/common.hpp"
#include "persondet/errors.hpp"
#include "persondet/overlay.hpp"

namespace persondet {
namespace {

using Clock = std::chrono::steady_clock;

double secondsSince(Clock::time_point start)
{
    return std::chrono::duration<double>(Clock::now() - start).count();
}

void ensureOutputDirectory(const std::string& output_path)
{
    std::filesystem::path directory = std::filesystem::path(output_path).parent_path();
    if (directory.empty()) {
        return;
    }

    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        throw OutputPathError("Failed to create output directory " + directory.string() + ": " + ec.message());
    }
}

template <typename Handle>
void releaseQuietly(Handle& handle, const char* what)
{
    try {
        handle.release();
    } catch (const std::exception& ex) {
        std::cerr << "[VideoProcessor] Failed to release " << what << ": " << ex.what() << std::endl;
    }
}

// Owns both handles and releases each exactly once, on the way out of process_video.
struct StreamGuard {
    std::unique_ptr<VideoSource> source;
    std::unique_ptr<VideoSink> sink;

    ~StreamGuard()
    {
        if (source) {
            releaseQuietly(*source, "video source");
        }
        if (sink) {
            releaseQuietly(*sink, "video sink");
        }
    }
};

}  // namespace

VideoProcessor::VideoProcessor(const Detector& detector,
                               std::string input_path,
                               std::string output_path,
                               std::string codec)
    : detector_(detector),
      input_path_(std::move(input_path)),
      output_path_(std::move(output_path)),
      codec_(std::move(codec))
{
    if (!std::filesystem::exists(input_path_)) {
        throw InputNotFoundError(input_path_);
    }
    ensureOutputDirectory(output_path_);
}

std::unique_ptr<VideoSource> VideoProcessor::open_source() const
{
    return std::make_unique<CvVideoSource>(input_path_);
}

std::unique_ptr<VideoSink> VideoProcessor::open_sink(const StreamInfo& info) const
{
    return std::make_unique<CvVideoSink>(output_path_, codec_, info.fps, cv::Size(info.width, info.height));
}

ProcessingSummary VideoProcessor::process_video(const ProgressCallback& progress_callback, bool show_fps)
{
    const auto start_time = Clock::now();

    StreamGuard streams;
    streams.source = open_source();
    VideoSource& source = *streams.source;

    const StreamInfo info = source.info();
    printStreamInfo(std::cout, info);

    streams.sink = open_sink(info);
    VideoSink& sink = *streams.sink;

    ProcessingStats stats;

    std::cout << "[VideoProcessor] Processing started" << std::endl;

    cv::Mat frame;
    while (source.read(frame)) {
        const auto frame_start = Clock::now();

        std::vector<Detection> detections = detector_.detect(frame);
        stats.recordPersons(detections.size());

        cv::Mat output = detector_.annotate(frame, detections);

        if (show_fps && stats.hasTiming()) {
            drawFpsOverlay(output, stats.rollingFps(), detections.size());
        }

        sink.write(output);

        const double frame_time = secondsSince(frame_start);
        stats.recordDuration(frame_time);
        stats.nextFrame();

        if (progress_callback && stats.frameCount() % kProgressInterval == 0) {
            const int current = stats.frameCount();
            double progress = info.total_frames > 0 ? 100.0 * current / info.total_frames : 0.0;
            double current_fps = frame_time > 0.0 ? 1.0 / frame_time : 0.0;
            progress_callback(progress, current, info.total_frames, current_fps);
        }
    }

    ProcessingSummary summary = stats.finalize(secondsSince(start_time),
                                               resolutionString(info.width, info.height),
                                               output_path_);
    printSummary(std::cout, summary);
    return summary;
}

void printStreamInfo(std::ostream& out, const StreamInfo& info)
{
    std::ios::fmtflags flags = out.flags();
    std::streamsize precision = out.precision();

    out << "\n=== Video parameters ===\n"
        << "Resolution: " << resolutionString(info.width, info.height) << "\n"
        << "FPS: " << info.fps << "\n"
        << "Total frames: " << info.total_frames << "\n";
    if (info.fps > 0.0) {
        out << "Duration: " << std::fixed << std::setprecision(2)
            << info.total_frames / info.fps << " s\n";
    }
    out << std::endl;

    out.flags(flags);
    out.precision(precision);
}

void printSummary(std::ostream& out, const ProcessingSummary& summary)
{
    const std::string rule(50, '=');
    std::ios::fmtflags flags = out.flags();
    std::streamsize precision = out.precision();

    out << "\n" << rule << "\n"
        << "PROCESSING COMPLETE\n"
        << rule << "\n"
        << std::fixed << std::setprecision(2)
        << "Frames processed: " << summary.total_frames << "\n"
        << "Processing time: " << summary.total_time << " s\n"
        << "Average FPS: " << summary.avg_fps << "\n"
        << "Resolution: " << summary.video_resolution << "\n"
        << "\nDetection statistics:\n"
        << "  Average persons: " << summary.avg_persons << "\n"
        << "  Minimum: " << summary.min_persons << "\n"
        << "  Maximum: " << summary.max_persons << "\n"
        << "\nResult saved to: " << summary.output_path << "\n"
        << rule << "\n"
        << std::endl;

    out.flags(flags);
    out.precision(precision);
}

}  // namespace persondet
