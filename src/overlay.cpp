#include "persondet/overlay.hpp"

#include <cstdio>

#include <opencv2/imgproc.hpp>

namespace persondet {

namespace {

constexpr int kLabelMargin = 10;
constexpr int kFontFace = cv::FONT_HERSHEY_SIMPLEX;

}  // namespace

std::string formatLabel(const Detection& detection)
{
    char buf[128];
    std::snprintf(buf, sizeof(buf), "%s: %.2f", detection.label.c_str(), detection.confidence);
    return buf;
}

int labelBaseline(int box_top, int text_height)
{
    if (box_top - kLabelMargin > text_height) {
        return box_top - kLabelMargin;
    }
    return box_top + text_height + kLabelMargin;
}

void drawDetections(cv::Mat& image, const std::vector<Detection>& detections, const OverlayStyle& style)
{
    for (const auto& det : detections) {
        const int x1 = det.bbox[0];
        const int y1 = det.bbox[1];
        const int x2 = det.bbox[2];
        const int y2 = det.bbox[3];

        cv::rectangle(image, cv::Point(x1, y1), cv::Point(x2, y2), style.bbox_color, style.line_thickness);

        std::string label = formatLabel(det);
        int baseline = 0;
        cv::Size text = cv::getTextSize(label, kFontFace, style.font_scale, style.line_thickness, &baseline);

        int text_y = labelBaseline(y1, text.height);

        cv::rectangle(image,
                      cv::Point(x1, text_y - text.height - baseline),
                      cv::Point(x1 + text.width + 4, text_y + baseline),
                      style.text_bg_color,
                      cv::FILLED);

        cv::putText(image, label, cv::Point(x1 + 2, text_y - 2), kFontFace, style.font_scale,
                    style.text_color, style.line_thickness, cv::LINE_AA);
    }
}

std::string formatFpsText(double fps, std::size_t persons)
{
    char buf[96];
    std::snprintf(buf, sizeof(buf), "FPS: %.1f | Persons: %zu", fps, persons);
    return buf;
}

void drawFpsOverlay(cv::Mat& image, double fps, std::size_t persons)
{
    cv::putText(image, formatFpsText(fps, persons), cv::Point(10, 30), kFontFace, 0.7,
                cv::Scalar(255, 255, 255), 2, cv::LINE_AA);
}

}  // namespace persondet
