#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>

namespace gAI {

// Image preprocessing parameters in the layout of a Hugging Face
// preprocessor_config.json
struct PreprocessorConfig {
    bool doResize = true;
    // Fixed output size, used when shortestEdge is 0
    int height = 224;
    int width = 224;
    // Aspect-preserving resize; longestEdge caps the long side when non-zero
    int shortestEdge = 0;
    int longestEdge = 0;
    // PIL resampling filter id: 0 nearest, 2 bilinear, 3 bicubic
    int resample = 2;
    bool doRescale = true;
    double rescaleFactor = 1.0 / 255.0;
    bool doNormalize = true;
    std::array<float, 3> imageMean{{0.5f, 0.5f, 0.5f}};
    std::array<float, 3> imageStd{{0.5f, 0.5f, 0.5f}};
};

// Throws std::invalid_argument when a present key has an unusable value
PreprocessorConfig parsePreprocessorConfig(const nlohmann::json& doc);

PreprocessorConfig loadPreprocessorConfig(const std::string& path);

// Output size for an input image of the given size
cv::Size resizedSize(const PreprocessorConfig& config, const cv::Size& input);

// Converts a BGR image into a normalized RGB float tensor in NCHW layout.
// shape receives {1, 3, H, W}.
std::vector<float> toPixelValues(const cv::Mat& image,
                                 const PreprocessorConfig& config,
                                 std::vector<int64_t>& shape);

} // namespace gAI
