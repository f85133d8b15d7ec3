#include "gAI/PredictionOrchestrator.hpp"
#include <chrono>
#include <cmath>
#include <iostream>
#include <sstream>
#include <opencv2/imgcodecs.hpp>
#include <onnxruntime_cxx_api.h>

namespace gAI {

namespace {

PredictionFailure failure(FailureKind kind, std::string message,
                          std::optional<double> retryAfter = std::nullopt) {
    return PredictionFailure{kind, std::move(message), retryAfter};
}

void checkpoint(const CancellationToken& token) {
    if (token.isCancelled()) {
        throw CancelledError();
    }
}

// Runs on a pool worker. Expected rejections come back as values; only
// unexpected failures are logged.
PredictionOutcome runInference(const ModelBundle& bundle,
                               const PersonDetectorGate& gate,
                               float lowConfidenceThreshold,
                               const cv::Mat& image,
                               const CancellationToken& token) {
    try {
        checkpoint(token);
        DetectionOutcome detection = gate.count(*bundle.detector, image);

        if (auto rejected = PersonDetectorGate::decide(detection)) {
            return *rejected;
        }

        checkpoint(token);
        ClassificationOutcome classification = bundle.classifier->classify(image);

        PredictionSuccess success;
        success.label = classification.label;
        success.confidence = classification.confidence;
        success.personCount = detection.personCount;
        success.probabilities = classification.probabilities;
        success.lowConfidence = classification.confidence < lowConfidenceThreshold;
        return success;
    }
    catch (const CancelledError&) {
        return failure(FailureKind::Cancelled, "Request cancelled");
    }
    catch (const Ort::Exception& e) {
        std::cerr << "[PredictionOrchestrator] ONNX Runtime error during prediction: " << e.what() << std::endl;
        return failure(FailureKind::InferenceError, std::string("Prediction failed: ") + e.what());
    }
    catch (const cv::Exception& e) {
        std::cerr << "[PredictionOrchestrator] OpenCV error during prediction: " << e.what() << std::endl;
        return failure(FailureKind::InferenceError, std::string("Prediction failed: ") + e.what());
    }
    catch (const std::exception& e) {
        std::cerr << "[PredictionOrchestrator] Error during prediction: " << e.what() << std::endl;
        return failure(FailureKind::InferenceError, std::string("Prediction failed: ") + e.what());
    }
}

} // namespace

cv::Mat decodeImage(const std::vector<unsigned char>& imageBytes) {
    if (imageBytes.empty()) {
        return cv::Mat();
    }
    try {
        return cv::imdecode(imageBytes, cv::IMREAD_COLOR);
    }
    catch (const cv::Exception& e) {
        std::cerr << "[PredictionOrchestrator] Failed to decode image data: " << e.what() << std::endl;
        return cv::Mat();
    }
}

PredictionOrchestrator::PredictionOrchestrator(std::shared_ptr<ModelLoader> loader,
                                               std::shared_ptr<InferencePool> pool,
                                               DetectorConfig detector,
                                               ClassifierConfig classifier,
                                               std::chrono::milliseconds requestTimeout)
    : loader_(std::move(loader)),
      pool_(std::move(pool)),
      gate_(std::move(detector)),
      classifier_(classifier),
      requestTimeout_(requestTimeout) {}

PredictionOutcome PredictionOrchestrator::predict(const std::vector<unsigned char>& imageBytes,
                                                  std::shared_ptr<CancellationToken> token) {
    // Timing out cancels only this prediction; the caller's token is watched
    // for disconnects but never cancelled here
    auto request = std::make_shared<CancellationToken>(std::move(token));

    const auto deadline = std::chrono::steady_clock::now() + requestTimeout_;

    cv::Mat image = decodeImage(imageBytes);
    if (image.empty()) {
        return failure(FailureKind::InvalidImage, "Invalid image data");
    }

    auto loaded = loader_->ensureReady(requestTimeout_);
    if (!loaded) {
        const LoadError& error = *loaded.error;
        double retryAfter = std::ceil(error.retryAfter.count() / 1000.0);
        std::ostringstream msg;
        msg << "Model unavailable (" << toString(error.kind) << "), retry in "
            << static_cast<long>(retryAfter) << " s";
        return failure(FailureKind::ModelUnavailable, msg.str(), retryAfter);
    }

    if (request->isCancelled()) {
        return failure(FailureKind::Cancelled, "Request cancelled");
    }

    std::shared_ptr<const ModelBundle> bundle = loaded.bundle;
    auto future = pool_->tryEnqueue([bundle, gate = gate_,
                                     threshold = classifier_.lowConfidenceThreshold, image, request]() {
        return runInference(*bundle, gate, threshold, image, *request);
    });
    if (!future) {
        std::cerr << "[PredictionOrchestrator] Inference queue full, rejecting request" << std::endl;
        return failure(FailureKind::Busy, "Server busy, please retry", 1.0);
    }

    if (future->wait_until(deadline) != std::future_status::ready) {
        request->cancel();
        std::cerr << "[PredictionOrchestrator] Prediction timed out after "
                  << requestTimeout_.count() << " ms" << std::endl;
        return failure(FailureKind::Timeout, "Prediction timed out");
    }
    return future->get();
}

std::vector<PredictionOutcome> PredictionOrchestrator::predictBatch(
    const std::vector<std::vector<unsigned char>>& images,
    std::shared_ptr<CancellationToken> token) {
    std::vector<PredictionOutcome> outcomes;
    outcomes.reserve(images.size());
    for (const auto& bytes : images) {
        outcomes.push_back(predict(bytes, token));
    }
    return outcomes;
}

HealthSnapshot PredictionOrchestrator::health() const {
    return loader_->health();
}

} // namespace gAI
