#include "persondet/detector.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <utility>

#include "persondet/common.hpp"
#include "persondet/errors.hpp"
#include "persondet/overlay.hpp"
#include "persondet/yolo.hpp"

namespace persondet {

Detector::Detector(DetectorConfig config) : config_(std::move(config)) {}

ModelInfo Detector::info() const
{
    ModelInfo info;
    info.model_name = std::filesystem::path(config_.model_path).filename().string();
    info.device = config_.device;
    info.conf_threshold = config_.conf_threshold;
    info.iou_threshold = config_.iou_threshold;
    info.task = "detect";
    return info;
}

cv::Mat Detector::annotate(const cv::Mat& frame, const std::vector<Detection>& detections) const
{
    cv::Mat output = frame.clone();
    drawDetections(output, detections);
    return output;
}

ModelGuard::ModelGuard(Detector& detector) : detector_(detector)
{
    if (!detector_.load()) {
        throw ModelLoadError("Detector failed to load: " + detector_.config().model_path);
    }
}

ModelGuard::~ModelGuard()
{
    try {
        detector_.release();
    } catch (const std::exception& ex) {
        std::cerr << "[Detector] Failed to release model: " << ex.what() << std::endl;
    }
}

std::unique_ptr<Detector> create_detector(const DetectorConfig& config)
{
    std::string extension = toLower(std::filesystem::path(config.model_path).extension().string());
    if (extension == ".onnx") {
        return std::make_unique<YoloDetector>(config);
    }
    std::cerr << "Unsupported model format for " << config.model_path << " (expected .onnx)\n";
    return nullptr;
}

}  // namespace persondet
