#pragma once

#include <memory>
#include <string>
#include <vector>

#include "persondet/detector.hpp"

namespace persondet {

class YoloDetector : public Detector {
public:
    explicit YoloDetector(const DetectorConfig& config);
    ~YoloDetector();

    bool load() override;
    bool release() override;

    bool isLoaded() const noexcept { return loaded_; }
    const std::string& path() const noexcept { return config_.model_path; }
    const std::string& device() const noexcept { return device_; }

    std::vector<Detection> detect(const cv::Mat& frame) const override;
    ModelInfo info() const override;

private:
    struct Impl;

    bool loaded_ = false;
    std::string device_;
    std::unique_ptr<Impl> impl_;
};

}  // namespace persondet
