#pragma once

#include <memory>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "gAI/Config.hpp"
#include "gAI/ONNXInferenceEngine.hpp"
#include "gAI/Types.hpp"

namespace gAI {

class PersonDetector {
public:
    virtual ~PersonDetector() = default;

    // Detections in original image coordinates, labelled with class names.
    // Throws on inference failure.
    virtual std::vector<Detection> detect(const cv::Mat& image) = 0;
};

// DETR-style set-prediction detector exported to ONNX. Reads its
// preprocessing parameters and id2label from detector_config.json.
class DETRPersonDetector : public PersonDetector, public ONNXInferenceEngine {
public:
    DETRPersonDetector();
    ~DETRPersonDetector() override;

    bool loadModel(const std::string& modelPath, const std::string& configPath);
    std::vector<Detection> detect(const cv::Mat& image) override;
    std::vector<std::string> getClassNames() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;

    std::vector<Detection> processDetections(const std::vector<Ort::Value>& output_tensors,
                                             const cv::Size& original_image_size);
};

// Counts the persons in an image and decides whether classification may run
class PersonDetectorGate {
public:
    explicit PersonDetectorGate(DetectorConfig config);

    DetectionOutcome count(PersonDetector& detector, const cv::Mat& image) const;

    // Keeps person detections above the score threshold that are large enough
    // for a close-up portrait, then applies NMS when enabled
    std::vector<Detection> filterPersons(const std::vector<Detection>& detections,
                                         const cv::Size& imageSize) const;

    // Rejection for the given count, or nothing when exactly one person is present
    static std::optional<PredictionRejected> decide(const DetectionOutcome& outcome);

    const DetectorConfig& config() const { return config_; }

private:
    DetectorConfig config_;
};

float calculateIoU(const cv::Rect& box1, const cv::Rect& box2);

void nmsBoxes(const std::vector<cv::Rect>& boxes,
              const std::vector<float>& scores,
              float score_threshold,
              float nms_threshold,
              std::vector<int>& indices);

} // namespace gAI
