#include "gAI/ModelBundle.hpp"
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace gAI {

std::shared_ptr<ModelBundle> loadOnnxBundle(const std::string& cachePath) {
    fs::path dir(cachePath);
    auto bundle = std::make_shared<ModelBundle>();
    bundle->cachePath = cachePath;

    std::cout << "[ModelBundle] Loading preprocessing config..." << std::endl;
    try {
        bundle->preprocessor = std::make_shared<const PreprocessorConfig>(
            loadPreprocessorConfig((dir / "preprocessor_config.json").string()));
    }
    catch (const std::exception& e) {
        throw ArtifactError(std::string("preprocessor_config.json: ") + e.what());
    }

    std::cout << "[ModelBundle] Loading gender classification model..." << std::endl;
    auto classifier = std::make_shared<ViTGenderClassifier>();
    if (!classifier->loadModel((dir / "model.onnx").string(),
                               (dir / "config.json").string(),
                               *bundle->preprocessor)) {
        throw ArtifactError("Failed to load classifier from " + (dir / "model.onnx").string());
    }
    bundle->classifier = classifier;

    std::cout << "[ModelBundle] Loading person detection model..." << std::endl;
    auto detector = std::make_shared<DETRPersonDetector>();
    if (!detector->loadModel((dir / "detector.onnx").string(),
                             (dir / "detector_config.json").string())) {
        throw ArtifactError("Failed to load detector from " + (dir / "detector.onnx").string());
    }
    bundle->detector = detector;

    std::cout << "[ModelBundle] All models loaded successfully" << std::endl;
    return bundle;
}

} // namespace gAI
