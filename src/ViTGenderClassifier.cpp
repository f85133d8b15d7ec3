#include "gAI/GenderClassifier.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace gAI {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

std::vector<float> softmax(const std::vector<float>& logits) {
    std::vector<float> result(logits.size());
    if (logits.empty()) {
        return result;
    }

    float maxLogit = *std::max_element(logits.begin(), logits.end());
    double sum = 0.0;
    for (size_t i = 0; i < logits.size(); i++) {
        double e = std::exp(static_cast<double>(logits[i]) - maxLogit);
        result[i] = static_cast<float>(e);
        sum += e;
    }
    for (auto& p : result) {
        p = static_cast<float>(p / sum);
    }
    return result;
}

ClassificationOutcome makeClassification(const std::vector<float>& probabilities,
                                         const std::vector<std::string>& labels) {
    if (probabilities.size() != labels.size()) {
        throw std::invalid_argument("Probability count does not match label count");
    }

    int male = -1;
    int female = -1;
    for (size_t i = 0; i < labels.size(); i++) {
        std::string label = toLower(labels[i]);
        if (label == "male") male = static_cast<int>(i);
        if (label == "female") female = static_cast<int>(i);
    }
    if (male < 0 || female < 0) {
        throw std::invalid_argument("Classifier labels must include male and female");
    }

    for (float p : probabilities) {
        if (!std::isfinite(p)) {
            throw std::runtime_error("Classifier produced a non-finite probability");
        }
    }

    ClassificationOutcome outcome;
    outcome.probabilities.male = probabilities[male];
    outcome.probabilities.female = probabilities[female];
    if (outcome.probabilities.male >= outcome.probabilities.female) {
        outcome.label = "male";
        outcome.confidence = outcome.probabilities.male;
    } else {
        outcome.label = "female";
        outcome.confidence = outcome.probabilities.female;
    }
    return outcome;
}

ViTGenderClassifier::ViTGenderClassifier() : ONNXInferenceEngine("ViTGenderClassifier") {}

ViTGenderClassifier::~ViTGenderClassifier() = default;

bool ViTGenderClassifier::loadModel(const std::string& modelPath,
                                    const std::string& configPath,
                                    const PreprocessorConfig& preprocessor) {
    try {
        std::ifstream ifs(configPath);
        if (!ifs.is_open()) {
            std::cerr << "[ViTGenderClassifier] Failed to open model config: " << configPath << std::endl;
            return false;
        }
        json config = json::parse(ifs);

        const json& id2label = config.at("id2label");
        if (id2label.size() != 2) {
            std::cerr << "[ViTGenderClassifier] Expected 2 labels, config has " << id2label.size() << std::endl;
            return false;
        }
        labels_.assign(id2label.size(), "");
        for (auto it = id2label.begin(); it != id2label.end(); ++it) {
            size_t index = static_cast<size_t>(std::stoul(it.key()));
            if (index >= labels_.size()) {
                std::cerr << "[ViTGenderClassifier] id2label index out of range: " << it.key() << std::endl;
                return false;
            }
            labels_[index] = it.value().get<std::string>();
        }

        // Validates that both genders are named
        makeClassification(std::vector<float>(labels_.size(), 0.0f), labels_);
    }
    catch (const std::exception& e) {
        std::cerr << "[ViTGenderClassifier] Invalid model config " << configPath << ": " << e.what() << std::endl;
        return false;
    }

    preprocessor_ = preprocessor;

    if (!ONNXInferenceEngine::loadModel(modelPath)) {
        return false;
    }

    std::cout << "[ViTGenderClassifier] Loaded classifier with labels";
    for (const auto& label : labels_) {
        std::cout << " " << label;
    }
    std::cout << " on " << (usingCuda() ? "CUDA" : "CPU") << std::endl;
    return true;
}

ClassificationOutcome ViTGenderClassifier::classify(const cv::Mat& image) {
    if (!session_) {
        throw std::runtime_error("Classifier model not loaded");
    }

    std::vector<int64_t> input_shape;
    std::vector<float> input_tensor_values = toPixelValues(image, preprocessor_, input_shape);

    auto output_tensors = run(input_tensor_values, input_shape);

    int logitsIndex = outputIndex("logits");
    const auto& logits = output_tensors.at(logitsIndex >= 0 ? logitsIndex : 0);
    size_t count = logits.GetTensorTypeAndShapeInfo().GetElementCount();
    if (count != labels_.size()) {
        throw std::runtime_error("Classifier returned " + std::to_string(count) +
                                 " logits for " + std::to_string(labels_.size()) + " labels");
    }

    const float* data = logits.GetTensorData<float>();
    return makeClassification(softmax(std::vector<float>(data, data + count)), labels_);
}

} // namespace gAI
