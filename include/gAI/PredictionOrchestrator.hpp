#pragma once

#include <chrono>
#include <memory>
#include <vector>
#include <opencv2/core.hpp>
#include "gAI/Config.hpp"
#include "gAI/InferencePool.hpp"
#include "gAI/ModelLoader.hpp"
#include "gAI/PersonDetector.hpp"
#include "gAI/Types.hpp"

namespace gAI {

// Composes loading, person gating and classification into prediction calls.
// Thread-safe; every call re-evaluates from the raw bytes.
class PredictionOrchestrator {
public:
    PredictionOrchestrator(std::shared_ptr<ModelLoader> loader,
                           std::shared_ptr<InferencePool> pool,
                           DetectorConfig detector,
                           ClassifierConfig classifier,
                           std::chrono::milliseconds requestTimeout);

    PredictionOutcome predict(const std::vector<unsigned char>& imageBytes,
                              std::shared_ptr<CancellationToken> token = nullptr);

    // One outcome per input, in input order; items never affect each other
    std::vector<PredictionOutcome> predictBatch(const std::vector<std::vector<unsigned char>>& images,
                                                std::shared_ptr<CancellationToken> token = nullptr);

    HealthSnapshot health() const;

    const ModelLoader& loader() const { return *loader_; }

private:
    std::shared_ptr<ModelLoader> loader_;
    std::shared_ptr<InferencePool> pool_;
    PersonDetectorGate gate_;
    ClassifierConfig classifier_;
    std::chrono::milliseconds requestTimeout_;
};

// Decodes uploaded bytes into a BGR image; empty on failure
cv::Mat decodeImage(const std::vector<unsigned char>& imageBytes);

} // namespace gAI
