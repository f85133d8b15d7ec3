#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <onnxruntime_cxx_api.h>

namespace gAI {

// Tensor shape as "1x3x?x?", with dynamic dimensions shown as '?'
std::string formatShape(const std::vector<int64_t>& shape);

// Base class for the ONNX-backed models of the bundle. Owns one session and
// the tensor names it is fed with.
class ONNXInferenceEngine {
public:
    explicit ONNXInferenceEngine(const char* logId);
    virtual ~ONNXInferenceEngine();

    // Creates the session, on CUDA when the runtime offers it
    virtual bool loadModel(const std::string& modelPath);

    bool isLoaded() const { return session_ != nullptr; }
    bool usingCuda() const { return using_cuda_; }

    // "name[shape]" for every output, for load logs
    std::string describeOutputs() const;

protected:
    // Runs the session on one float input tensor. Calls on the same session
    // are serialized. Throws Ort::Exception on failure.
    std::vector<Ort::Value> run(std::vector<float>& input, const std::vector<int64_t>& shape);

    // Index of the named output, or -1
    int outputIndex(const std::string& name) const;

    std::shared_ptr<Ort::Env> env_;
    std::unique_ptr<Ort::Session> session_;
    Ort::MemoryInfo memory_info_{nullptr};

    // Only the first model input is fed
    std::vector<std::string> input_names_;
    std::vector<std::string> output_names_;
    std::vector<std::vector<int64_t>> input_shapes_;
    std::vector<std::vector<int64_t>> output_shapes_;

private:
    Ort::SessionOptions sessionOptions();
    void readModelInfo();

    // Point into input_names_ and output_names_; rebuilt by readModelInfo
    std::vector<const char*> inputNamePtrs_;
    std::vector<const char*> outputNamePtrs_;

    bool using_cuda_ = false;
    std::mutex runMutex_;
    std::string logId_;
};

} // namespace gAI
