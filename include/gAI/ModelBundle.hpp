#pragma once

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include "gAI/GenderClassifier.hpp"
#include "gAI/PersonDetector.hpp"
#include "gAI/Preprocessing.hpp"

namespace gAI {

// The detector, the classifier and its preprocessing configuration, loaded
// from one cache directory. Immutable once handed out by the loader.
struct ModelBundle {
    std::string bucket;
    std::string prefix;
    std::string cachePath;

    std::shared_ptr<PersonDetector> detector;
    std::shared_ptr<GenderClassifier> classifier;
    std::shared_ptr<const PreprocessorConfig> preprocessor;
};

// Raised when cached artifacts cannot be deserialized
class ArtifactError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Builds a bundle from a complete cache directory. Throws on failure.
using BundleFactory = std::function<std::shared_ptr<ModelBundle>(const std::string& cachePath)>;

// Default factory: ONNX detector and classifier plus preprocessor_config.json
std::shared_ptr<ModelBundle> loadOnnxBundle(const std::string& cachePath);

} // namespace gAI
