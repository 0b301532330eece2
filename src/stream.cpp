#include "persondet/stream.hpp"
#include "persondet/common.hpp"
#include "persondet/errors.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace persondet {

int fourccFromString(const std::string& codec)
{
    if (codec.size() != 4) {
        throw std::invalid_argument("Codec tag must have exactly four characters: " + codec);
    }
    return cv::VideoWriter::fourcc(codec[0], codec[1], codec[2], codec[3]);
}

CvVideoSource::CvVideoSource(std::string path) : path_(std::move(path))
{
    if (!capture_.open(path_)) {
        throw StreamOpenError("Failed to open video file: " + path_);
    }
}

CvVideoSource::~CvVideoSource()
{
    release();
}

StreamInfo CvVideoSource::info() const
{
    StreamInfo info;
    info.fps = capture_.get(cv::CAP_PROP_FPS);
    info.width = static_cast<int>(capture_.get(cv::CAP_PROP_FRAME_WIDTH));
    info.height = static_cast<int>(capture_.get(cv::CAP_PROP_FRAME_HEIGHT));

    double count = capture_.get(cv::CAP_PROP_FRAME_COUNT);
    info.total_frames = std::isfinite(count) && count > 0 ? static_cast<int>(count) : 0;
    return info;
}

bool CvVideoSource::read(cv::Mat& frame)
{
    if (!capture_.isOpened()) {
        return false;
    }
    return capture_.read(frame) && !frame.empty();
}

void CvVideoSource::release()
{
    if (capture_.isOpened()) {
        capture_.release();
    }
}

CvVideoSink::CvVideoSink(std::string path, const std::string& codec, double fps, cv::Size size)
    : path_(std::move(path)), size_(size)
{
    if (!writer_.open(path_, fourccFromString(codec), fps, size_)) {
        throw StreamOpenError("Failed to create output file: " + path_);
    }
}

CvVideoSink::~CvVideoSink()
{
    release();
}

void CvVideoSink::write(const cv::Mat& frame)
{
    if (frame.size() != size_) {
        throw std::runtime_error("Frame size " + resolutionString(frame.cols, frame.rows) +
                                 " does not match output stream " +
                                 resolutionString(size_.width, size_.height));
    }
    writer_.write(frame);
    ++frames_written_;
}

void CvVideoSink::release()
{
    if (writer_.isOpened()) {
        writer_.release();
    }
}

}  // namespace persondet
