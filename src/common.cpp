#include "persondet/common.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

#include <opencv2/imgproc.hpp>

namespace persondet {

PreprocessInfo preprocess_letterbox(const cv::Mat& img, int input_w, int input_h)
{
    int img_w = img.cols;
    int img_h = img.rows;

    float scale = std::min((float)input_w / img_w, (float)input_h / img_h);

    int new_w = static_cast<int>(std::round(img_w * scale));
    int new_h = static_cast<int>(std::round(img_h * scale));
    new_w = std::clamp(new_w, 1, input_w);
    new_h = std::clamp(new_h, 1, input_h);

    cv::Mat resized;
    cv::resize(img, resized, cv::Size(new_w, new_h), 0, 0, cv::INTER_LINEAR);

    int pad_x = (input_w - new_w) / 2;
    int pad_y = (input_h - new_h) / 2;

    cv::Mat letterbox(input_h, input_w, img.type(), cv::Scalar(114, 114, 114));
    resized.copyTo(letterbox(cv::Rect(pad_x, pad_y, new_w, new_h)));

    cv::Mat float_img;
    letterbox.convertTo(float_img, CV_32F, 1.0 / 255.0);
    // YOLO exports expect RGB
    cv::cvtColor(float_img, float_img, cv::COLOR_BGR2RGB);

    std::vector<cv::Mat> chw(3);
    cv::split(float_img, chw);

    std::vector<float> input_tensor;
    input_tensor.reserve(static_cast<std::size_t>(input_w) * input_h * 3);
    for (int c = 0; c < 3; ++c) {
        const float* begin = reinterpret_cast<const float*>(chw[c].datastart);
        const float* end   = reinterpret_cast<const float*>(chw[c].dataend);
        input_tensor.insert(input_tensor.end(), begin, end);
    }

    return {input_tensor, scale, pad_x, pad_y, letterbox};
}

cv::Rect2f unletterboxBox(float x1, float y1, float x2, float y2,
                          const PreprocessInfo& prep, int img_w, int img_h)
{
    float rx1 = (x1 - prep.pad_x) / prep.scale;
    float ry1 = (y1 - prep.pad_y) / prep.scale;
    float rx2 = (x2 - prep.pad_x) / prep.scale;
    float ry2 = (y2 - prep.pad_y) / prep.scale;

    rx1 = std::clamp(rx1, 0.f, (float)img_w - 1);
    ry1 = std::clamp(ry1, 0.f, (float)img_h - 1);
    rx2 = std::clamp(rx2, 0.f, (float)img_w - 1);
    ry2 = std::clamp(ry2, 0.f, (float)img_h - 1);

    // width/height stay negative for inverted boxes so callers can drop them
    return cv::Rect2f(rx1, ry1, rx2 - rx1, ry2 - ry1);
}

std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string resolutionString(int width, int height)
{
    return std::to_string(width) + "x" + std::to_string(height);
}

}  // namespace persondet
