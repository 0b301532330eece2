#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "persondet/detector.hpp"

namespace persondet {

struct OverlayStyle {
    cv::Scalar bbox_color{0, 255, 0};
    cv::Scalar text_bg_color{0, 255, 0};
    cv::Scalar text_color{0, 0, 0};
    int line_thickness = 2;
    double font_scale = 0.6;
};

// "person: 0.87"
std::string formatLabel(const Detection& detection);

// Baseline y of a label for a box whose top edge is box_top. The label goes
// above the box when there is room for it, else just inside the box.
int labelBaseline(int box_top, int text_height);

void drawDetections(cv::Mat& image, const std::vector<Detection>& detections,
                    const OverlayStyle& style = OverlayStyle());

// "FPS: 24.3 | Persons: 2"
std::string formatFpsText(double fps, std::size_t persons);

void drawFpsOverlay(cv::Mat& image, double fps, std::size_t persons);

}  // namespace persondet
