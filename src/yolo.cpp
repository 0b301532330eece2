#include <algorithm>
#include <array>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <onnxruntime_cxx_api.h>

#include "persondet/yolo.hpp"
#include "persondet/common.hpp"
#include "persondet/errors.hpp"
#include "persondet/postprocess.hpp"

namespace persondet {

struct YoloDetector::Impl {
    Impl() : env(ORT_LOGGING_LEVEL_WARNING, "persondet") {
        session_options.SetGraphOptimizationLevel(ORT_ENABLE_EXTENDED);
    }
    Ort::Env env;
    Ort::SessionOptions session_options;
    std::unique_ptr<Ort::Session> session;
    std::vector<std::string> input_names;
    std::vector<const char*> input_name_ptrs;
    std::vector<std::string> output_names;
    std::vector<const char*> output_name_ptrs;
    std::vector<int64_t> input_shape{1, 3, 640, 640};
};

namespace {

constexpr int64_t kDefaultInputSize = 640;
constexpr const char* kCudaProvider = "CUDAExecutionProvider";

bool cudaAvailable()
{
    std::vector<std::string> providers = Ort::GetAvailableProviders();
    return std::find(providers.begin(), providers.end(), kCudaProvider) != providers.end();
}

std::string selectDevice(const std::string& requested)
{
    std::string device = toLower(requested);
    if (device == "cpu") {
        return device;
    }
    bool has_cuda = cudaAvailable();
    if (device == "cuda") {
        if (!has_cuda) {
            throw ModelLoadError("CUDA device requested but ONNX Runtime has no CUDA execution provider");
        }
        return device;
    }
    if (device == "auto") {
        return has_cuda ? "cuda" : "cpu";
    }
    throw ModelLoadError("Unknown device: " + requested);
}

}  // namespace

YoloDetector::YoloDetector(const DetectorConfig& config)
    : Detector(config)
{
}

YoloDetector::~YoloDetector() = default;

bool YoloDetector::load()
{
    std::string model_path = config_.model_path;

    if (!model_path.empty() && model_path[0] != '/') {
        std::filesystem::path full_path = std::filesystem::current_path() / model_path;
        model_path = full_path.string();
    }

    if (!std::filesystem::exists(model_path)) {
        throw ModelLoadError("YOLO model file not found: " + model_path);
    }

    device_ = selectDevice(config_.device);
    std::cout << "[YoloDetector] Loading " << model_path << " on " << device_ << std::endl;

    impl_ = std::make_unique<Impl>();

    try {
        if (device_ == "cuda") {
            OrtCUDAProviderOptions cuda_options{};
            cuda_options.device_id = 0;
            impl_->session_options.AppendExecutionProvider_CUDA(cuda_options);
        }

        impl_->session = std::make_unique<Ort::Session>(impl_->env, model_path.c_str(), impl_->session_options);

        Ort::AllocatorWithDefaultOptions allocator;

        std::size_t input_count = impl_->session->GetInputCount();
        impl_->input_names.reserve(input_count);
        for (std::size_t i = 0; i < input_count; ++i) {
            impl_->input_names.push_back(impl_->session->GetInputNameAllocated(i, allocator).get());
        }
        for (const auto& name : impl_->input_names) {
            impl_->input_name_ptrs.push_back(name.c_str());
        }

        std::size_t output_count = impl_->session->GetOutputCount();
        impl_->output_names.reserve(output_count);
        for (std::size_t i = 0; i < output_count; ++i) {
            impl_->output_names.push_back(impl_->session->GetOutputNameAllocated(i, allocator).get());
        }
        for (const auto& name : impl_->output_names) {
            impl_->output_name_ptrs.push_back(name.c_str());
        }

        if (input_count > 0) {
            Ort::TypeInfo type_info = impl_->session->GetInputTypeInfo(0);
            auto tensor_info = type_info.GetTensorTypeAndShapeInfo();
            std::vector<int64_t> shape = tensor_info.GetShape();
            if (shape.size() == 4) {
                impl_->input_shape = {1,
                                      shape[1] > 0 ? shape[1] : 3,
                                      shape[2] > 0 ? shape[2] : kDefaultInputSize,
                                      shape[3] > 0 ? shape[3] : kDefaultInputSize};
            } else {
                std::cerr << "[YoloDetector] Warning: input rank " << shape.size()
                          << " != 4, assuming 1x3x640x640\n";
            }
        }
    } catch (const Ort::Exception& ex) {
        impl_.reset();
        throw ModelLoadError(std::string("Failed to load YOLO model: ") + ex.what());
    }

    if (impl_->input_names.empty() || impl_->output_names.empty()) {
        impl_.reset();
        throw ModelLoadError("YOLO model has no inputs or outputs: " + model_path);
    }

    std::cout << "[YoloDetector] Model ready, input " << impl_->input_shape[3] << "x"
              << impl_->input_shape[2] << std::endl;
    loaded_ = true;
    return loaded_;
}

bool YoloDetector::release()
{
    impl_.reset();
    loaded_ = false;
    std::cout << "[YoloDetector] Model resources released" << std::endl;
    return true;
}

ModelInfo YoloDetector::info() const
{
    ModelInfo info = Detector::info();
    if (!device_.empty()) {
        info.device = device_;
    }
    return info;
}

std::vector<Detection> YoloDetector::detect(const cv::Mat& frame) const
{
    if (!loaded_ || !impl_) {
        throw std::runtime_error("YOLO model is not loaded");
    }
    if (frame.empty()) {
        throw std::invalid_argument("Cannot run detection on an empty frame");
    }

    const int real_height = static_cast<int>(impl_->input_shape[2]);
    const int real_width  = static_cast<int>(impl_->input_shape[3]);

    auto prep = preprocess_letterbox(frame, real_width, real_height);

    std::array<int64_t, 4> input_shape{1, 3, real_height, real_width};
    Ort::MemoryInfo mem_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeCPU);

    Ort::Value input_tensor_val = Ort::Value::CreateTensor<float>(
        mem_info, prep.input_tensor.data(), prep.input_tensor.size(),
        input_shape.data(), input_shape.size()
    );

    auto outputs = impl_->session->Run(
        Ort::RunOptions{nullptr},
        impl_->input_name_ptrs.data(), &input_tensor_val, 1,
        impl_->output_name_ptrs.data(), impl_->output_name_ptrs.size()
    );

    if (outputs.empty() || !outputs.front().IsTensor()) {
        throw std::runtime_error("YOLO model produced no tensor output");
    }

    auto& output = outputs.front();
    std::vector<int64_t> shape = output.GetTensorTypeAndShapeInfo().GetShape();
    return decodeDetections(output.GetTensorData<float>(), shape, prep, frame.size(), config_);
}

}  // namespace persondet
