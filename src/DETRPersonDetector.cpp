#include "gAI/PersonDetector.hpp"
#include "gAI/Preprocessing.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <map>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace gAI {

class DETRPersonDetector::Impl {
public:
    std::vector<std::string> classNames;
    PreprocessorConfig preprocessor;
    int logitsOutput = 0;
    int boxesOutput = 1;
};

DETRPersonDetector::DETRPersonDetector()
    : ONNXInferenceEngine("DETRPersonDetector"), pImpl_(std::make_unique<Impl>()) {
    // DetrImageProcessor defaults
    pImpl_->preprocessor.shortestEdge = 800;
    pImpl_->preprocessor.longestEdge = 1333;
    pImpl_->preprocessor.imageMean = {{0.485f, 0.456f, 0.406f}};
    pImpl_->preprocessor.imageStd = {{0.229f, 0.224f, 0.225f}};
}

DETRPersonDetector::~DETRPersonDetector() = default;

bool DETRPersonDetector::loadModel(const std::string& modelPath, const std::string& configPath) {
    try {
        std::ifstream ifs(configPath);
        if (!ifs.is_open()) {
            std::cerr << "[DETRPersonDetector] Failed to open detector config: " << configPath << std::endl;
            return false;
        }
        json config = json::parse(ifs);

        if (!config.contains("id2label") || !config["id2label"].is_object()) {
            std::cerr << "[DETRPersonDetector] Detector config has no id2label map: " << configPath << std::endl;
            return false;
        }

        // id2label keys are stringified class indices
        std::map<int, std::string> labels;
        for (auto it = config["id2label"].begin(); it != config["id2label"].end(); ++it) {
            labels[std::stoi(it.key())] = it.value().get<std::string>();
        }
        int numClasses = labels.empty() ? 0 : labels.rbegin()->first + 1;
        pImpl_->classNames.assign(numClasses, "N/A");
        for (const auto& entry : labels) {
            pImpl_->classNames[entry.first] = entry.second;
        }

        // Preprocessing keys are optional and default to the DETR processor settings
        PreprocessorConfig defaults = pImpl_->preprocessor;
        json merged = config;
        if (!merged.contains("size")) {
            merged["size"] = {{"shortest_edge", defaults.shortestEdge}, {"longest_edge", defaults.longestEdge}};
        }
        if (!merged.contains("image_mean")) merged["image_mean"] = defaults.imageMean;
        if (!merged.contains("image_std")) merged["image_std"] = defaults.imageStd;
        pImpl_->preprocessor = parsePreprocessorConfig(merged);
    }
    catch (const json::exception& e) {
        std::cerr << "[DETRPersonDetector] Invalid detector config " << configPath << ": " << e.what() << std::endl;
        return false;
    }
    catch (const std::exception& e) {
        std::cerr << "[DETRPersonDetector] Error reading detector config " << configPath << ": " << e.what() << std::endl;
        return false;
    }

    if (!ONNXInferenceEngine::loadModel(modelPath)) {
        return false;
    }

    if (output_names_.size() < 2) {
        std::cerr << "[DETRPersonDetector] Expected logits and pred_boxes outputs, model has "
                  << output_names_.size() << std::endl;
        return false;
    }
    int logits = outputIndex("logits");
    int boxes = outputIndex("pred_boxes");
    pImpl_->logitsOutput = logits >= 0 ? logits : 0;
    pImpl_->boxesOutput = boxes >= 0 ? boxes : 1;

    // Exports with a static spatial size take precedence over the config
    if (!input_shapes_.empty() && input_shapes_[0].size() == 4 &&
        input_shapes_[0][2] > 0 && input_shapes_[0][3] > 0) {
        pImpl_->preprocessor.shortestEdge = 0;
        pImpl_->preprocessor.height = static_cast<int>(input_shapes_[0][2]);
        pImpl_->preprocessor.width = static_cast<int>(input_shapes_[0][3]);
    }

    std::cout << "[DETRPersonDetector] Loaded detector with " << pImpl_->classNames.size() << " classes on "
              << (usingCuda() ? "CUDA" : "CPU") << ", outputs " << describeOutputs() << std::endl;
    return true;
}

std::vector<Detection> DETRPersonDetector::detect(const cv::Mat& image) {
    if (!session_) {
        throw std::runtime_error("Detector model not loaded");
    }

    std::vector<int64_t> input_shape;
    std::vector<float> input_tensor_values = toPixelValues(image, pImpl_->preprocessor, input_shape);

    auto output_tensors = run(input_tensor_values, input_shape);
    return processDetections(output_tensors, image.size());
}

std::vector<Detection> DETRPersonDetector::processDetections(
    const std::vector<Ort::Value>& output_tensors,
    const cv::Size& original_image_size)
{
    std::vector<Detection> detections;

    const auto& logitsTensor = output_tensors.at(pImpl_->logitsOutput);
    const auto& boxesTensor = output_tensors.at(pImpl_->boxesOutput);

    auto logitsShape = logitsTensor.GetTensorTypeAndShapeInfo().GetShape();
    auto boxesShape = boxesTensor.GetTensorTypeAndShapeInfo().GetShape();

    // logits: [batch, queries, classes + 1], pred_boxes: [batch, queries, 4]
    if (logitsShape.size() != 3 || boxesShape.size() != 3 || boxesShape[2] != 4 ||
        logitsShape[1] != boxesShape[1]) {
        throw std::runtime_error("Unexpected detector output shapes");
    }

    const int64_t numQueries = logitsShape[1];
    const int64_t numLogits = logitsShape[2];
    const float* logits = logitsTensor.GetTensorData<float>();
    const float* boxes = boxesTensor.GetTensorData<float>();

    for (int64_t q = 0; q < numQueries; q++) {
        const float* row = logits + q * numLogits;

        // Softmax over all classes including the trailing "no object" class
        float maxLogit = *std::max_element(row, row + numLogits);
        double sum = 0.0;
        for (int64_t c = 0; c < numLogits; c++) {
            sum += std::exp(row[c] - maxLogit);
        }

        int classId = 0;
        float bestScore = -1.0f;
        for (int64_t c = 0; c < numLogits - 1; c++) {
            float score = static_cast<float>(std::exp(row[c] - maxLogit) / sum);
            if (score > bestScore) {
                bestScore = score;
                classId = static_cast<int>(c);
            }
        }

        // Normalized centre/size to pixel corners
        const float* box = boxes + q * 4;
        float cx = box[0] * original_image_size.width;
        float cy = box[1] * original_image_size.height;
        float w = box[2] * original_image_size.width;
        float h = box[3] * original_image_size.height;

        int left = std::max(0, static_cast<int>(std::round(cx - w / 2)));
        int top = std::max(0, static_cast<int>(std::round(cy - h / 2)));
        int right = std::min(original_image_size.width, static_cast<int>(std::round(cx + w / 2)));
        int bottom = std::min(original_image_size.height, static_cast<int>(std::round(cy + h / 2)));
        if (right <= left || bottom <= top) {
            continue;
        }

        Detection det;
        det.bbox = cv::Rect(left, top, right - left, bottom - top);
        det.confidence = bestScore;
        det.classId = classId;
        det.className = classId < static_cast<int>(pImpl_->classNames.size())
                            ? pImpl_->classNames[classId] : "unknown";
        detections.push_back(det);
    }

    return detections;
}

std::vector<std::string> DETRPersonDetector::getClassNames() const {
    return pImpl_->classNames;
}

} // namespace gAI
