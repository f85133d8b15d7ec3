#include "gAI/Types.hpp"

namespace gAI {

const char* toString(RejectionReason reason) {
    switch (reason) {
        case RejectionReason::NoPerson:
            return "no_person";
        case RejectionReason::MultiplePeople:
            return "multiple_people";
    }
    return "unknown";
}

const char* toString(FailureKind kind) {
    switch (kind) {
        case FailureKind::InvalidImage:
            return "invalid_image";
        case FailureKind::ModelUnavailable:
            return "model_unavailable";
        case FailureKind::InferenceError:
            return "inference_error";
        case FailureKind::Busy:
            return "busy";
        case FailureKind::Timeout:
            return "timeout";
        case FailureKind::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

std::string rejectionMessage(const PredictionRejected& rejected) {
    if (rejected.reason == RejectionReason::NoPerson) {
        return "No person detected";
    }
    return "Multiple people detected (" + std::to_string(rejected.personCount) +
           " people). Please use single-person images.";
}

} // namespace gAI
