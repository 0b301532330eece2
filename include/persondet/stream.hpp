#pragma once

#include <string>

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

namespace persondet {

struct StreamInfo {
    double fps{0.0};
    int width{0};
    int height{0};
    int total_frames{0}; // as reported by the container, may be inaccurate
};

class VideoSource {
public:
    virtual ~VideoSource() = default;

    virtual StreamInfo info() const = 0;
    // Returns false at end of stream.
    virtual bool read(cv::Mat& frame) = 0;
    virtual void release() = 0;
};

class VideoSink {
public:
    virtual ~VideoSink() = default;

    virtual void write(const cv::Mat& frame) = 0;
    virtual void release() = 0;
};

class CvVideoSource : public VideoSource {
public:
    explicit CvVideoSource(std::string path);
    ~CvVideoSource() override;

    StreamInfo info() const override;
    bool read(cv::Mat& frame) override;
    void release() override;

private:
    std::string path_;
    cv::VideoCapture capture_;
};

class CvVideoSink : public VideoSink {
public:
    CvVideoSink(std::string path, const std::string& codec, double fps, cv::Size size);
    ~CvVideoSink() override;

    void write(const cv::Mat& frame) override;
    void release() override;

    int framesWritten() const noexcept { return frames_written_; }

private:
    std::string path_;
    cv::Size size_;
    cv::VideoWriter writer_;
    int frames_written_{0};
};

int fourccFromString(const std::string& codec);

}  // namespace persondet
