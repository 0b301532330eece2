#pragma once

#include <string>
#include <vector>

namespace persondet {

struct DetectorConfig {
    std::string model_path = "yolo26x.onnx";
    std::string labels_path;

    double conf_threshold{0.30};
    double iou_threshold{0.45};
    std::string device = "auto"; // "auto", "cpu" or "cuda"

    int target_class{0};
    std::string target_label = "person";
};

struct OutputConfig {
    std::string codec = "mp4v";
    bool show_fps = true;
};

struct AppConfig {
    std::string source_path;

    DetectorConfig detector;
    OutputConfig output;
};

// Reads a YAML configuration file. Keys that are absent keep their defaults.
AppConfig loadConfig(const std::string& path);

// Throws ConfigError when a value is out of range.
void validateConfig(const AppConfig& config);

// Reads the `names` list of a YOLO data file (sequence or id -> name map).
std::vector<std::string> loadClassNames(const std::string& yaml_path);

// Fills target_label from labels_path when the file names the target class.
void resolveTargetLabel(DetectorConfig& config);

}  // namespace persondet
