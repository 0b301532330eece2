#pragma once

#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace persondet {

struct PreprocessInfo {
    std::vector<float> input_tensor;
    float scale;
    int pad_x;
    int pad_y;
    cv::Mat letterbox_image;
};

// Letterboxes img into input_w x input_h and packs it as RGB NCHW floats in [0, 1].
PreprocessInfo preprocess_letterbox(const cv::Mat& img, int input_w, int input_h);

// Maps a letterboxed x1, y1, x2, y2 box back to img_w x img_h and clamps it.
cv::Rect2f unletterboxBox(float x1, float y1, float x2, float y2,
                          const PreprocessInfo& prep, int img_w, int img_h);

std::string toLower(std::string value);
std::string resolutionString(int width, int height);

}  // namespace persondet
