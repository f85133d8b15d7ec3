#pragma once

#include <memory>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "gAI/ONNXInferenceEngine.hpp"
#include "gAI/Preprocessing.hpp"
#include "gAI/Types.hpp"

namespace gAI {

class GenderClassifier {
public:
    virtual ~GenderClassifier() = default;

    // Two-class distribution for an image holding exactly one person.
    // Throws on inference failure.
    virtual ClassificationOutcome classify(const cv::Mat& image) = 0;
};

// Numerically stable softmax
std::vector<float> softmax(const std::vector<float>& logits);

// Assembles the outcome from a distribution whose entries are named by labels.
// Throws std::invalid_argument when "male" or "female" is missing.
ClassificationOutcome makeClassification(const std::vector<float>& probabilities,
                                         const std::vector<std::string>& labels);

// Vision transformer classifier exported to ONNX, with its id2label taken from
// the model config.json
class ViTGenderClassifier : public GenderClassifier, public ONNXInferenceEngine {
public:
    ViTGenderClassifier();
    ~ViTGenderClassifier() override;

    bool loadModel(const std::string& modelPath,
                   const std::string& configPath,
                   const PreprocessorConfig& preprocessor);
    ClassificationOutcome classify(const cv::Mat& image) override;
    std::vector<std::string> getClassNames() const { return labels_; }

private:
    std::vector<std::string> labels_;
    PreprocessorConfig preprocessor_;
};

} // namespace gAI
