#pragma once

#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

namespace gAI {

// Where the model artifacts live and where they are cached locally
struct ArtifactConfig {
    std::string store = "http";            // "http", "s3" or "local"
    std::string endpointHost = "s3.amazonaws.com";
    int endpointPort = 80;
    std::string region;                    // s3 only; empty uses the SDK default chain
    long requestTimeoutMs = 30000;         // per network operation
    std::string localRoot = "./object-store";
    std::string bucket = "your-bucket-name";
    std::string prefix = "models/gender-classification-final/";
    std::string cacheDir = "./model";
};

struct DetectorConfig {
    float scoreThreshold = 0.7f;
    float minRelativeArea = 0.05f;
    float minRelativeHeight = 0.2f;
    bool nmsEnabled = true;
    float nmsIouThreshold = 0.7f;
    std::string personLabel = "person";
};

struct ClassifierConfig {
    float lowConfidenceThreshold = 0.6f;
};

struct LoaderConfig {
    bool eagerLoad = true;
    long initialBackoffMs = 1000;
    long maxBackoffMs = 60000;
    long loadTimeoutMs = 300000;
};

struct InferenceConfig {
    std::size_t workers = 2;
    std::size_t queueDepth = 16;
    long requestTimeoutMs = 30000;
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8000;
    std::size_t threads = 4;
    std::size_t maxUploadBytes = 10 * 1024 * 1024;
    std::size_t maxBatchSize = 10;
};

struct AppConfig {
    ArtifactConfig artifacts;
    DetectorConfig detector;
    ClassifierConfig classifier;
    LoaderConfig loader;
    InferenceConfig inference;
    ServerConfig server;
};

// Build a configuration from a parsed JSON document. Missing keys keep their
// defaults. Throws std::invalid_argument on out-of-range values.
AppConfig parseConfig(const nlohmann::json& doc);

// Read and parse a JSON configuration file
AppConfig loadConfig(const std::string& path);

// Apply MODEL_BUCKET, MODEL_PREFIX, MODEL_CACHE_DIR, ARTIFACT_ENDPOINT,
// API_HOST and API_PORT on top of the given configuration
void applyEnvironment(AppConfig& config);

void validateConfig(const AppConfig& config);

} // namespace gAI
