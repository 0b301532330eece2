#pragma once

#include "persondet/config.hpp"

#include <array>
#include <memory>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace persondet {

struct Detection {
    std::array<int, 4> bbox{0, 0, 0, 0}; // x1, y1, x2, y2
    double confidence{0.0};
    std::string label;
    int class_id{0};
};

struct ModelInfo {
    std::string model_name;
    std::string device;
    double conf_threshold{0.0};
    double iou_threshold{0.0};
    std::string task;
};

class Detector {
public:
    explicit Detector(DetectorConfig config);
    virtual ~Detector() = default;

    virtual bool load() = 0;
    virtual bool release() = 0;
    virtual std::vector<Detection> detect(const cv::Mat& frame) const = 0;

    virtual ModelInfo info() const;

    // Returns a copy of frame with every detection drawn; frame is untouched.
    cv::Mat annotate(const cv::Mat& frame, const std::vector<Detection>& detections) const;

    const DetectorConfig& config() const { return config_; }

protected:
    DetectorConfig config_;
};

// Loads a detector for the lifetime of a scope and releases it on every exit.
class ModelGuard {
public:
    explicit ModelGuard(Detector& detector);
    ~ModelGuard();

    ModelGuard(const ModelGuard&) = delete;
    ModelGuard& operator=(const ModelGuard&) = delete;

private:
    Detector& detector_;
};

std::unique_ptr<Detector> create_detector(const DetectorConfig& config);

}  // namespace persondet
