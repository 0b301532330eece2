#pragma once

#include <functional>
#include <memory>
#include <ostream>
#include <string>

#include "persondet/detector.hpp"
#include "persondet/stats.hpp"
#include "persondet/stream.hpp"

namespace persondet {

// percent, current frame, total frames (from metadata), instantaneous fps
using ProgressCallback = std::function<void(double, int, int, double)>;

class VideoProcessor {
public:
    static constexpr int kProgressInterval = 30;

    VideoProcessor(const Detector& detector,
                   std::string input_path,
                   std::string output_path,
                   std::string codec = "mp4v");
    virtual ~VideoProcessor() = default;

    ProcessingSummary process_video(const ProgressCallback& progress_callback = {},
                                    bool show_fps = true);

    const std::string& input_path() const { return input_path_; }
    const std::string& output_path() const { return output_path_; }
    const std::string& codec() const { return codec_; }

protected:
    virtual std::unique_ptr<VideoSource> open_source() const;
    virtual std::unique_ptr<VideoSink> open_sink(const StreamInfo& info) const;

private:
    const Detector& detector_;
    std::string input_path_;
    std::string output_path_;
    std::string codec_;
};

void printStreamInfo(std::ostream& out, const StreamInfo& info);
void printSummary(std::ostream& out, const ProcessingSummary& summary);

}  // namespace persondet
