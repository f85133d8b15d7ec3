#include "gAI/Preprocessing.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <stdexcept>
#include <opencv2/imgproc.hpp>

using json = nlohmann::json;

namespace gAI {

namespace {

int interpolationFor(int resample) {
    switch (resample) {
        case 0:
            return cv::INTER_NEAREST;
        case 2:
            return cv::INTER_LINEAR;
        case 3:
            return cv::INTER_CUBIC;
        case 1:
            return cv::INTER_LANCZOS4;
        default:
            throw std::invalid_argument("Unsupported resample filter: " + std::to_string(resample));
    }
}

std::array<float, 3> readTriple(const json& value, const char* key) {
    std::array<float, 3> triple{};
    if (value.is_number()) {
        triple.fill(value.get<float>());
        return triple;
    }
    if (!value.is_array() || value.size() != 3) {
        throw std::invalid_argument(std::string(key) + " must be a number or a list of 3 numbers");
    }
    for (size_t i = 0; i < 3; i++) {
        triple[i] = value[i].get<float>();
    }
    return triple;
}

} // namespace

PreprocessorConfig parsePreprocessorConfig(const json& doc) {
    PreprocessorConfig config;

    try {
        if (doc.contains("do_resize")) config.doResize = doc["do_resize"].get<bool>();
        if (doc.contains("do_rescale")) config.doRescale = doc["do_rescale"].get<bool>();
        if (doc.contains("do_normalize")) config.doNormalize = doc["do_normalize"].get<bool>();
        if (doc.contains("rescale_factor")) config.rescaleFactor = doc["rescale_factor"].get<double>();
        if (doc.contains("resample")) config.resample = doc["resample"].get<int>();
        if (doc.contains("image_mean")) config.imageMean = readTriple(doc["image_mean"], "image_mean");
        if (doc.contains("image_std")) config.imageStd = readTriple(doc["image_std"], "image_std");

        if (doc.contains("size")) {
            const json& size = doc["size"];
            if (size.is_number_integer()) {
                config.height = config.width = size.get<int>();
            } else if (size.is_object()) {
                if (size.contains("shortest_edge")) {
                    config.shortestEdge = size["shortest_edge"].get<int>();
                    if (size.contains("longest_edge")) {
                        config.longestEdge = size["longest_edge"].get<int>();
                    }
                } else {
                    config.height = size.at("height").get<int>();
                    config.width = size.at("width").get<int>();
                }
            } else {
                throw std::invalid_argument("size must be an integer or an object");
            }
        }
    }
    catch (const json::exception& e) {
        throw std::invalid_argument(std::string("Invalid preprocessor config: ") + e.what());
    }

    interpolationFor(config.resample);
    if (config.shortestEdge < 0 || config.longestEdge < 0 ||
        (config.shortestEdge == 0 && (config.height <= 0 || config.width <= 0))) {
        throw std::invalid_argument("Invalid preprocessor output size");
    }
    for (float s : config.imageStd) {
        if (s == 0.0f) {
            throw std::invalid_argument("image_std must not contain zeros");
        }
    }
    return config;
}

PreprocessorConfig loadPreprocessorConfig(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open preprocessor config: " + path);
    }
    try {
        return parsePreprocessorConfig(json::parse(ifs));
    }
    catch (const json::parse_error& e) {
        throw std::invalid_argument("Failed to parse " + path + ": " + e.what());
    }
}

cv::Size resizedSize(const PreprocessorConfig& config, const cv::Size& input) {
    if (!config.doResize) {
        return input;
    }
    if (config.shortestEdge == 0) {
        return cv::Size(config.width, config.height);
    }

    int h = input.height;
    int w = input.width;
    double size = config.shortestEdge;

    if (config.longestEdge > 0) {
        double minOriginal = std::min(h, w);
        double maxOriginal = std::max(h, w);
        if (maxOriginal / minOriginal * size > config.longestEdge) {
            size = std::round(config.longestEdge * minOriginal / maxOriginal);
        }
    }

    int target = static_cast<int>(size);
    if ((h <= w && h == target) || (w <= h && w == target)) {
        return input;
    }
    if (w < h) {
        return cv::Size(target, static_cast<int>(size * h / w));
    }
    return cv::Size(static_cast<int>(size * w / h), target);
}

std::vector<float> toPixelValues(const cv::Mat& image,
                                 const PreprocessorConfig& config,
                                 std::vector<int64_t>& shape) {
    if (image.empty() || image.channels() != 3) {
        throw std::invalid_argument("Expected a non-empty 3-channel image");
    }

    cv::Mat rgb;
    cv::cvtColor(image, rgb, cv::COLOR_BGR2RGB);

    cv::Size target = resizedSize(config, rgb.size());
    if (target != rgb.size()) {
        cv::resize(rgb, rgb, target, 0, 0, interpolationFor(config.resample));
    }

    cv::Mat floatImage;
    rgb.convertTo(floatImage, CV_32F, config.doRescale ? config.rescaleFactor : 1.0);

    std::vector<cv::Mat> channels(3);
    cv::split(floatImage, channels);

    const size_t planeSize = static_cast<size_t>(target.width) * static_cast<size_t>(target.height);
    std::vector<float> values;
    values.reserve(planeSize * 3);

    // HWC to CHW conversion
    for (int c = 0; c < 3; c++) {
        cv::Mat plane = channels[c];
        if (config.doNormalize) {
            plane = (plane - cv::Scalar(config.imageMean[c])) / static_cast<double>(config.imageStd[c]);
        }
        if (!plane.isContinuous()) {
            plane = plane.clone();
        }
        const float* data = plane.ptr<float>();
        values.insert(values.end(), data, data + planeSize);
    }

    shape = {1, 3, target.height, target.width};
    return values;
}

} // namespace gAI
