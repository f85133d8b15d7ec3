#include "gAI/ONNXInferenceEngine.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>

namespace gAI {

namespace {

const char* kCudaProvider = "CUDAExecutionProvider";

// Providers compiled into the loaded runtime library
bool runtimeHasProvider(const std::string& provider) {
    std::vector<std::string> providers = Ort::GetAvailableProviders();
    return std::find(providers.begin(), providers.end(), provider) != providers.end();
}

} // namespace

std::string formatShape(const std::vector<int64_t>& shape) {
    std::ostringstream out;
    for (size_t i = 0; i < shape.size(); i++) {
        if (i > 0) out << "x";
        if (shape[i] < 0) {
            out << "?";
        } else {
            out << shape[i];
        }
    }
    return out.str();
}

ONNXInferenceEngine::ONNXInferenceEngine(const char* logId)
    : env_(std::make_shared<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, logId)),
      memory_info_(Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault)),
      logId_(logId)
{
}

ONNXInferenceEngine::~ONNXInferenceEngine() = default;

bool ONNXInferenceEngine::loadModel(const std::string& modelPath) {
    try {
        session_ = std::make_unique<Ort::Session>(*env_, modelPath.c_str(), sessionOptions());
        readModelInfo();

        if (input_names_.empty() || output_names_.empty()) {
            std::cerr << "[" << logId_ << "] Model has no inputs or outputs: " << modelPath << std::endl;
            session_.reset();
            return false;
        }
        return true;
    }
    catch (const Ort::Exception& e) {
        std::cerr << "[" << logId_ << "] ONNX Runtime error during model loading: " << e.what() << std::endl;
        session_.reset();
        return false;
    }
    catch (const std::exception& e) {
        std::cerr << "[" << logId_ << "] Error loading ONNX model: " << e.what() << std::endl;
        session_.reset();
        return false;
    }
}

// Inference requests already run on a worker pool, so each session keeps to
// one intra-op thread
Ort::SessionOptions ONNXInferenceEngine::sessionOptions() {
    Ort::SessionOptions options;
    options.SetIntraOpNumThreads(1);
    options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

    using_cuda_ = false;
    try {
        if (runtimeHasProvider(kCudaProvider)) {
            OrtCUDAProviderOptions cuda;
            options.AppendExecutionProvider_CUDA(cuda);
            using_cuda_ = true;
        }
    }
    catch (const Ort::Exception& e) {
        std::cerr << "[" << logId_ << "] CUDA provider unavailable, staying on CPU: " << e.what() << std::endl;
    }
    return options;
}

std::string ONNXInferenceEngine::describeOutputs() const {
    std::string description;
    for (size_t i = 0; i < output_names_.size(); i++) {
        if (i > 0) description += " ";
        description += output_names_[i];
        if (i < output_shapes_.size()) {
            description += "[" + formatShape(output_shapes_[i]) + "]";
        }
    }
    return description;
}

std::vector<Ort::Value> ONNXInferenceEngine::run(std::vector<float>& input, const std::vector<int64_t>& shape) {
    if (!session_) {
        throw std::runtime_error("Model not loaded");
    }

    Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
        memory_info_,
        input.data(),
        input.size(),
        shape.data(),
        shape.size()
    );

    std::lock_guard<std::mutex> lock(runMutex_);
    return session_->Run(
        Ort::RunOptions{nullptr},
        inputNamePtrs_.data(),
        &input_tensor,
        1,
        outputNamePtrs_.data(),
        outputNamePtrs_.size()
    );
}

int ONNXInferenceEngine::outputIndex(const std::string& name) const {
    auto it = std::find(output_names_.begin(), output_names_.end(), name);
    return it == output_names_.end() ? -1 : static_cast<int>(it - output_names_.begin());
}

void ONNXInferenceEngine::readModelInfo() {
    Ort::AllocatorWithDefaultOptions allocator;

    input_names_.clear();
    input_shapes_.clear();
    output_names_.clear();
    output_shapes_.clear();

    // Exports with an optional pixel_mask input still run on pixel_values alone
    if (session_->GetInputCount() > 0) {
        input_names_.emplace_back(session_->GetInputNameAllocated(0, allocator).get());
        input_shapes_.push_back(session_->GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape());
    }

    for (size_t i = 0; i < session_->GetOutputCount(); i++) {
        output_names_.emplace_back(session_->GetOutputNameAllocated(i, allocator).get());
        output_shapes_.push_back(session_->GetOutputTypeInfo(i).GetTensorTypeAndShapeInfo().GetShape());
    }

    inputNamePtrs_.clear();
    for (const auto& name : input_names_) inputNamePtrs_.push_back(name.c_str());
    outputNamePtrs_.clear();
    for (const auto& name : output_names_) outputNamePtrs_.push_back(name.c_str());
}

} // namespace gAI
