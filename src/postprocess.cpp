#include "persondet/postprocess.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#include <opencv2/dnn.hpp>

namespace persondet {
namespace {

struct Candidate {
    cv::Rect2d box;
    float score;
    int cls;
};

std::vector<Candidate> decodeRaw(const float* data, int C, int N, const PreprocessInfo& prep,
                                 cv::Size image_size, int target_class, float conf_threshold)
{
    std::vector<Candidate> cands;
    const int num_classes = C - 4;
    if (target_class < 0 || target_class >= num_classes) {
        return cands;
    }

    auto get_at = [&](int attr_idx, int i_box) -> float {
        return data[static_cast<std::size_t>(attr_idx) * N + i_box];
    };

    for (int i = 0; i < N; ++i) {
        int best_cls = -1;
        float best_prob = -1.0f;
        for (int c = 0; c < num_classes; ++c) {
            float p = get_at(4 + c, i);
            if (p > best_prob) {
                best_prob = p;
                best_cls = c;
            }
        }
        if (best_cls != target_class || best_prob < conf_threshold)
            continue;

        float cx = get_at(0, i);
        float cy = get_at(1, i);
        float w  = get_at(2, i);
        float h  = get_at(3, i);

        cv::Rect2f r = unletterboxBox(cx - w * 0.5f, cy - h * 0.5f, cx + w * 0.5f, cy + h * 0.5f,
                                      prep, image_size.width, image_size.height);
        if (r.width <= 0.f || r.height <= 0.f)
            continue;

        cands.push_back({cv::Rect2d(r.x, r.y, r.width, r.height), best_prob, best_cls});
    }
    return cands;
}

std::vector<Candidate> decodeEndToEnd(const float* data, int N, const PreprocessInfo& prep,
                                      cv::Size image_size, int target_class, float conf_threshold)
{
    std::vector<Candidate> cands;
    for (int i = 0; i < N; ++i) {
        const float* row = data + static_cast<std::size_t>(i) * 6;
        float score = row[4];
        int cls = static_cast<int>(std::lround(row[5]));
        if (cls != target_class || score < conf_threshold)
            continue;

        cv::Rect2f r = unletterboxBox(row[0], row[1], row[2], row[3], prep,
                                      image_size.width, image_size.height);
        if (r.width <= 0.f || r.height <= 0.f)
            continue;

        cands.push_back({cv::Rect2d(r.x, r.y, r.width, r.height), score, cls});
    }
    return cands;
}

}  // namespace

std::vector<Detection> decodeDetections(const float* data,
                                        const std::vector<int64_t>& shape,
                                        const PreprocessInfo& prep,
                                        cv::Size image_size,
                                        const DetectorConfig& config)
{
    if (shape.size() != 3 || shape[0] != 1) {
        throw std::runtime_error("Unexpected YOLO output rank " + std::to_string(shape.size()));
    }

    const float conf_threshold = static_cast<float>(config.conf_threshold);

    std::vector<Candidate> cands;
    std::vector<int> keep;
    if (shape[2] == 6) {
        cands = decodeEndToEnd(data, static_cast<int>(shape[1]), prep, image_size,
                               config.target_class, conf_threshold);
        keep.resize(cands.size());
        for (std::size_t i = 0; i < cands.size(); ++i) {
            keep[i] = static_cast<int>(i);
        }
    } else {
        if (shape[1] <= 4) {
            throw std::runtime_error("YOLO output has no class rows: " + std::to_string(shape[1]));
        }
        cands = decodeRaw(data, static_cast<int>(shape[1]), static_cast<int>(shape[2]), prep, image_size,
                          config.target_class, conf_threshold);
        std::vector<cv::Rect2d> boxes;
        std::vector<float> scores;
        boxes.reserve(cands.size());
        scores.reserve(cands.size());
        for (const auto& c : cands) {
            boxes.push_back(c.box);
            scores.push_back(c.score);
        }
        if (!boxes.empty()) {
            cv::dnn::NMSBoxes(boxes, scores, conf_threshold,
                              static_cast<float>(config.iou_threshold), keep);
        }
    }

    std::vector<Detection> detections;
    detections.reserve(keep.size());
    for (int idx : keep) {
        const auto& c = cands[idx];
        Detection det;
        det.bbox = {static_cast<int>(c.box.x),
                    static_cast<int>(c.box.y),
                    static_cast<int>(c.box.x + c.box.width),
                    static_cast<int>(c.box.y + c.box.height)};
        if (det.bbox[2] <= det.bbox[0] || det.bbox[3] <= det.bbox[1])
            continue;
        det.confidence = c.score;
        det.label = config.target_label;
        det.class_id = c.cls;
        detections.push_back(std::move(det));
    }

    return detections;
}

}  // namespace persondet
