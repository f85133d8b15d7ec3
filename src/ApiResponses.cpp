#include "gAI/ApiResponses.hpp"

using json = nlohmann::json;

namespace gAI {

namespace {

json errorBody(const std::string& message, int personCount) {
    json body;
    body["prediction"] = nullptr;
    body["confidence"] = 0.0;
    body["person_count"] = personCount;
    body["probabilities"] = nullptr;
    body["error"] = message;
    return body;
}

struct OutcomeVisitor {
    json operator()(const PredictionSuccess& success) const {
        json body;
        body["prediction"] = success.label;
        body["confidence"] = success.confidence;
        body["person_count"] = success.personCount;
        body["probabilities"] = {
            {"male", success.probabilities.male},
            {"female", success.probabilities.female}
        };
        body["error"] = nullptr;
        body["low_confidence"] = success.lowConfidence;
        return body;
    }

    json operator()(const PredictionRejected& rejected) const {
        json body = errorBody(rejectionMessage(rejected), rejected.personCount);
        body["reason"] = toString(rejected.reason);
        return body;
    }

    json operator()(const PredictionFailure& failure) const {
        json body = errorBody(failure.message, 0);
        body["reason"] = toString(failure.kind);
        if (failure.retryAfterSeconds) {
            body["retry_after"] = *failure.retryAfterSeconds;
        }
        return body;
    }
};

} // namespace

json toJson(const PredictionOutcome& outcome) {
    return std::visit(OutcomeVisitor{}, outcome);
}

json toJson(const HealthSnapshot& health, LoadState state) {
    json body;
    body["status"] = health.healthy() ? "healthy" : "unhealthy";
    body["model_loaded"] = health.classifierLoaded;
    body["processor_loaded"] = health.preprocessorLoaded;
    body["detector_loaded"] = health.detectorLoaded;
    body["load_state"] = toString(state);
    return body;
}

json itemError(const std::string& filename, const std::string& message) {
    json body = errorBody(message, 0);
    body["filename"] = filename;
    body["reason"] = "validation_error";
    return body;
}

} // namespace gAI
