#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <opencv2/core.hpp>

namespace gAI {

// A single raw detection produced by the detector model
struct Detection {
    cv::Rect bbox;
    float confidence;
    int classId;
    std::string className;
};

// Persons kept by the detector gate for one image
struct DetectionOutcome {
    int personCount = 0;
    std::vector<float> confidences;
};

struct Probabilities {
    float male = 0.0f;
    float female = 0.0f;
};

struct ClassificationOutcome {
    Probabilities probabilities;
    std::string label;     // "male" or "female"
    float confidence = 0.0f;
};

struct PredictionSuccess {
    std::string label;
    float confidence;
    int personCount;
    Probabilities probabilities;
    bool lowConfidence;
};

enum class RejectionReason {
    NoPerson,
    MultiplePeople
};

struct PredictionRejected {
    RejectionReason reason;
    int personCount;
};

enum class FailureKind {
    InvalidImage,
    ModelUnavailable,
    InferenceError,
    Busy,
    Timeout,
    Cancelled
};

struct PredictionFailure {
    FailureKind kind;
    std::string message;
    // Seconds the caller should wait before retrying, when known
    std::optional<double> retryAfterSeconds;
};

using PredictionOutcome = std::variant<PredictionSuccess, PredictionRejected, PredictionFailure>;

struct HealthSnapshot {
    bool classifierLoaded = false;
    bool preprocessorLoaded = false;
    bool detectorLoaded = false;

    bool healthy() const {
        return classifierLoaded && preprocessorLoaded && detectorLoaded;
    }
};

const char* toString(RejectionReason reason);
const char* toString(FailureKind kind);

// Human readable message for a rejection, as returned in the API "error" field
std::string rejectionMessage(const PredictionRejected& rejected);

} // namespace gAI
