#pragma once

#include <cstdint>
#include <vector>

#include <opencv2/core.hpp>

#include "persondet/common.hpp"
#include "persondet/config.hpp"
#include "persondet/detector.hpp"

namespace persondet {

// Turns a YOLO output tensor into detections of config.target_class, in
// image_size coordinates.
//
//   [1, N, 6]          end-to-end rows x1, y1, x2, y2, score, class (no NMS)
//   [1, 4 + classes, N] cx, cy, w, h then one score row per class; a box is
//                       kept only when its best class is the target, then
//                       suppressed with NMS at config.iou_threshold
//
// Boxes are clamped to the image and dropped unless x2 > x1 and y2 > y1.
// Throws std::runtime_error for any other tensor shape.
std::vector<Detection> decodeDetections(const float* data,
                                        const std::vector<int64_t>& shape,
                                        const PreprocessInfo& prep,
                                        cv::Size image_size,
                                        const DetectorConfig& config);

}  // namespace persondet
