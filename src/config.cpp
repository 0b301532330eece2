#include "persondet/config.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>

#include <yaml-cpp/yaml.h>

#include "persondet/common.hpp"
#include "persondet/errors.hpp"

namespace persondet {
namespace {

std::string resolve_path(const std::filesystem::path& base_dir, const std::string& path)
{
    if (path.empty()) {
        return path;
    }
    std::filesystem::path p(path);
    if (p.is_absolute()) {
        return p.string();
    }
    return (base_dir / p).lexically_normal().string();
}

template <typename T>
void readValue(const YAML::Node& node, const char* key, T& target)
{
    if (!node[key]) {
        return;
    }
    try {
        target = node[key].as<T>();
    } catch (const YAML::Exception& ex) {
        throw ConfigError(std::string("Invalid value for '") + key + "': " + ex.what());
    }
}

DetectorConfig parse_detector_config(const YAML::Node& node, const std::filesystem::path& base_dir)
{
    DetectorConfig config;
    if (!node) {
        return config;
    }
    if (!node.IsMap()) {
        throw ConfigError("'detector' section must be a mapping");
    }

    readValue(node, "model", config.model_path);
    readValue(node, "labels", config.labels_path);
    readValue(node, "conf_threshold", config.conf_threshold);
    readValue(node, "iou_threshold", config.iou_threshold);
    readValue(node, "device", config.device);
    readValue(node, "target_class", config.target_class);
    readValue(node, "target_label", config.target_label);

    if (node["model"]) {
        config.model_path = resolve_path(base_dir, config.model_path);
    }
    config.labels_path = resolve_path(base_dir, config.labels_path);
    config.device = toLower(config.device);
    return config;
}

OutputConfig parse_output_config(const YAML::Node& node)
{
    OutputConfig config;
    if (!node) {
        return config;
    }
    if (!node.IsMap()) {
        throw ConfigError("'output' section must be a mapping");
    }

    readValue(node, "codec", config.codec);
    readValue(node, "show_fps", config.show_fps);
    return config;
}

}  // namespace

AppConfig loadConfig(const std::string& path)
{
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        throw ConfigError("Failed to open configuration file: " + path);
    } catch (const YAML::Exception& ex) {
        throw ConfigError("Failed to parse configuration file " + path + ": " + ex.what());
    }

    std::filesystem::path absolute_path = std::filesystem::absolute(path).lexically_normal();
    std::filesystem::path base_dir = absolute_path.has_parent_path() ? absolute_path.parent_path()
                                                                    : std::filesystem::path(".");

    AppConfig config;
    config.source_path = absolute_path.generic_string();

    if (root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw ConfigError("Configuration root must be a mapping: " + path);
    }

    config.detector = parse_detector_config(root["detector"], base_dir);
    config.output = parse_output_config(root["output"]);

    validateConfig(config);
    return config;
}

void validateConfig(const AppConfig& config)
{
    const auto& det = config.detector;
    if (det.model_path.empty()) {
        throw ConfigError("Model path must not be empty");
    }
    if (det.conf_threshold < 0.0 || det.conf_threshold > 1.0) {
        throw ConfigError("Confidence threshold must be within [0, 1]: " + std::to_string(det.conf_threshold));
    }
    if (det.iou_threshold < 0.0 || det.iou_threshold > 1.0) {
        throw ConfigError("IoU threshold must be within [0, 1]: " + std::to_string(det.iou_threshold));
    }
    std::string device = toLower(det.device);
    if (device != "auto" && device != "cpu" && device != "cuda") {
        throw ConfigError("Device must be one of auto, cpu, cuda: " + det.device);
    }
    if (det.target_class < 0) {
        throw ConfigError("Target class id must not be negative");
    }
    if (config.output.codec.size() != 4) {
        throw ConfigError("Output codec must be a four-character code: " + config.output.codec);
    }
}

std::vector<std::string> loadClassNames(const std::string& yaml_path)
{
    std::vector<std::string> names;
    try {
        YAML::Node data = YAML::LoadFile(yaml_path);
        const YAML::Node node = data["names"];
        if (!node) {
            std::cerr << "[Config] Warning: 'names' not found in " << yaml_path << "\n";
        } else if (node.IsSequence()) {
            for (const auto& name : node)
                names.push_back(name.as<std::string>());
        } else if (node.IsMap()) {
            for (const auto& entry : node) {
                int id = entry.first.as<int>();
                if (id < 0) {
                    continue;
                }
                if (static_cast<std::size_t>(id) >= names.size()) {
                    names.resize(static_cast<std::size_t>(id) + 1);
                }
                names[static_cast<std::size_t>(id)] = entry.second.as<std::string>();
            }
        }
    } catch (const YAML::Exception& e) {
        std::cerr << "[Config] Failed to parse class names from " << yaml_path << ": " << e.what() << std::endl;
        names.clear();
    }
    return names;
}

void resolveTargetLabel(DetectorConfig& config)
{
    if (config.labels_path.empty()) {
        return;
    }
    std::vector<std::string> names = loadClassNames(config.labels_path);
    if (config.target_class < static_cast<int>(names.size()) &&
        !names[static_cast<std::size_t>(config.target_class)].empty()) {
        config.target_label = names[static_cast<std::size_t>(config.target_class)];
    } else {
        std::cerr << "[Config] Warning: class " << config.target_class << " not named in "
                  << config.labels_path << ", keeping label '" << config.target_label << "'\n";
    }
}

}  // namespace persondet
