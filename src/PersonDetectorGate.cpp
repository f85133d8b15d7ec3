#include "gAI/PersonDetector.hpp"
#include <algorithm>
#include <cctype>
#include <numeric>

namespace gAI {

namespace {

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
           });
}

} // namespace

float calculateIoU(const cv::Rect& box1, const cv::Rect& box2) {
    int x1 = std::max(box1.x, box2.x);
    int y1 = std::max(box1.y, box2.y);
    int x2 = std::min(box1.x + box1.width, box2.x + box2.width);
    int y2 = std::min(box1.y + box1.height, box2.y + box2.height);

    if (x2 <= x1 || y2 <= y1) {
        return 0.0f;
    }

    float intersection_area = static_cast<float>((x2 - x1) * (y2 - y1));
    float box1_area = static_cast<float>(box1.width * box1.height);
    float box2_area = static_cast<float>(box2.width * box2.height);

    return intersection_area / (box1_area + box2_area - intersection_area);
}

void nmsBoxes(const std::vector<cv::Rect>& boxes,
              const std::vector<float>& scores,
              float score_threshold,
              float nms_threshold,
              std::vector<int>& indices) {
    std::vector<size_t> sortedIndices(scores.size());
    std::iota(sortedIndices.begin(), sortedIndices.end(), 0);

    // Highest score first
    std::sort(sortedIndices.begin(), sortedIndices.end(),
              [&scores](size_t i1, size_t i2) { return scores[i1] > scores[i2]; });

    std::vector<bool> suppressed(scores.size(), false);
    indices.clear();

    for (size_t i = 0; i < sortedIndices.size(); ++i) {
        size_t idx = sortedIndices[i];

        if (suppressed[idx] || scores[idx] < score_threshold) {
            continue;
        }

        indices.push_back(static_cast<int>(idx));

        for (size_t j = i + 1; j < sortedIndices.size(); ++j) {
            size_t idx2 = sortedIndices[j];
            if (!suppressed[idx2] && calculateIoU(boxes[idx], boxes[idx2]) > nms_threshold) {
                suppressed[idx2] = true;
            }
        }
    }
}

PersonDetectorGate::PersonDetectorGate(DetectorConfig config) : config_(std::move(config)) {}

std::vector<Detection> PersonDetectorGate::filterPersons(const std::vector<Detection>& detections,
                                                         const cv::Size& imageSize) const {
    std::vector<Detection> candidates;
    if (imageSize.width <= 0 || imageSize.height <= 0) {
        return candidates;
    }

    const float imageArea = static_cast<float>(imageSize.width) * static_cast<float>(imageSize.height);

    for (const auto& det : detections) {
        if (!equalsIgnoreCase(det.className, config_.personLabel)) {
            continue;
        }
        if (det.confidence <= config_.scoreThreshold) {
            continue;
        }

        float relativeArea = static_cast<float>(det.bbox.area()) / imageArea;
        float relativeHeight = static_cast<float>(det.bbox.height) / static_cast<float>(imageSize.height);
        if (relativeArea <= config_.minRelativeArea || relativeHeight <= config_.minRelativeHeight) {
            continue;
        }
        candidates.push_back(det);
    }

    if (!config_.nmsEnabled || candidates.size() < 2) {
        return candidates;
    }

    std::vector<cv::Rect> boxes;
    std::vector<float> scores;
    for (const auto& det : candidates) {
        boxes.push_back(det.bbox);
        scores.push_back(det.confidence);
    }

    std::vector<int> indices;
    nmsBoxes(boxes, scores, 0.0f, config_.nmsIouThreshold, indices);

    std::vector<Detection> kept;
    kept.reserve(indices.size());
    for (int idx : indices) {
        kept.push_back(candidates[idx]);
    }
    return kept;
}

DetectionOutcome PersonDetectorGate::count(PersonDetector& detector, const cv::Mat& image) const {
    auto persons = filterPersons(detector.detect(image), image.size());

    DetectionOutcome outcome;
    outcome.personCount = static_cast<int>(persons.size());
    for (const auto& det : persons) {
        outcome.confidences.push_back(det.confidence);
    }
    return outcome;
}

std::optional<PredictionRejected> PersonDetectorGate::decide(const DetectionOutcome& outcome) {
    if (outcome.personCount == 0) {
        return PredictionRejected{RejectionReason::NoPerson, 0};
    }
    if (outcome.personCount > 1) {
        return PredictionRejected{RejectionReason::MultiplePeople, outcome.personCount};
    }
    return std::nullopt;
}

} // namespace gAI
