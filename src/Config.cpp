#include "gAI/Config.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace gAI {

namespace {

template<typename T>
void readValue(const json& section, const char* key, T& target) {
    if (section.contains(key) && !section[key].is_null()) {
        target = section[key].get<T>();
    }
}

const json& section(const json& doc, const char* name) {
    static const json empty = json::object();
    if (doc.contains(name) && doc[name].is_object()) {
        return doc[name];
    }
    return empty;
}

void checkUnit(float value, const char* name) {
    if (value < 0.0f || value > 1.0f) {
        throw std::invalid_argument(std::string(name) + " must be within [0, 1]");
    }
}

void checkPositive(long value, const char* name) {
    if (value <= 0) {
        throw std::invalid_argument(std::string(name) + " must be positive");
    }
}

// Splits "host[:port]" into its parts; the port is left unchanged when absent
void parseEndpoint(const std::string& endpoint, std::string& host, int& port) {
    auto colon = endpoint.rfind(':');
    if (colon == std::string::npos) {
        host = endpoint;
        return;
    }
    host = endpoint.substr(0, colon);
    try {
        port = std::stoi(endpoint.substr(colon + 1));
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid artifact endpoint: " + endpoint);
    }
}

} // namespace

AppConfig parseConfig(const json& doc) {
    AppConfig config;

    try {
        const json& artifacts = section(doc, "artifacts");
        readValue(artifacts, "store", config.artifacts.store);
        if (artifacts.contains("endpoint") && artifacts["endpoint"].is_string()) {
            parseEndpoint(artifacts["endpoint"].get<std::string>(),
                          config.artifacts.endpointHost, config.artifacts.endpointPort);
        }
        readValue(artifacts, "region", config.artifacts.region);
        readValue(artifacts, "request_timeout_ms", config.artifacts.requestTimeoutMs);
        readValue(artifacts, "local_root", config.artifacts.localRoot);
        readValue(artifacts, "bucket", config.artifacts.bucket);
        readValue(artifacts, "prefix", config.artifacts.prefix);
        readValue(artifacts, "cache_dir", config.artifacts.cacheDir);

        const json& detector = section(doc, "detector");
        readValue(detector, "score_threshold", config.detector.scoreThreshold);
        readValue(detector, "min_relative_area", config.detector.minRelativeArea);
        readValue(detector, "min_relative_height", config.detector.minRelativeHeight);
        readValue(detector, "nms_enabled", config.detector.nmsEnabled);
        readValue(detector, "nms_iou_threshold", config.detector.nmsIouThreshold);
        readValue(detector, "person_label", config.detector.personLabel);

        const json& classifier = section(doc, "classifier");
        readValue(classifier, "low_confidence_threshold", config.classifier.lowConfidenceThreshold);

        const json& loader = section(doc, "loader");
        readValue(loader, "eager_load", config.loader.eagerLoad);
        readValue(loader, "initial_backoff_ms", config.loader.initialBackoffMs);
        readValue(loader, "max_backoff_ms", config.loader.maxBackoffMs);
        readValue(loader, "load_timeout_ms", config.loader.loadTimeoutMs);

        const json& inference = section(doc, "inference");
        readValue(inference, "workers", config.inference.workers);
        readValue(inference, "queue_depth", config.inference.queueDepth);
        readValue(inference, "request_timeout_ms", config.inference.requestTimeoutMs);

        const json& server = section(doc, "server");
        readValue(server, "host", config.server.host);
        readValue(server, "port", config.server.port);
        readValue(server, "threads", config.server.threads);
        readValue(server, "max_upload_bytes", config.server.maxUploadBytes);
        readValue(server, "max_batch_size", config.server.maxBatchSize);
    }
    catch (const json::exception& e) {
        throw std::invalid_argument(std::string("Invalid configuration value: ") + e.what());
    }

    validateConfig(config);
    return config;
}

AppConfig loadConfig(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json doc;
    try {
        doc = json::parse(ifs);
    }
    catch (const json::parse_error& e) {
        throw std::invalid_argument("Failed to parse config file " + path + ": " + e.what());
    }

    std::cout << "Loaded configuration from " << path << std::endl;
    return parseConfig(doc);
}

void applyEnvironment(AppConfig& config) {
    if (const char* bucket = std::getenv("MODEL_BUCKET")) {
        config.artifacts.bucket = bucket;
    }
    if (const char* prefix = std::getenv("MODEL_PREFIX")) {
        config.artifacts.prefix = prefix;
    }
    if (const char* cacheDir = std::getenv("MODEL_CACHE_DIR")) {
        config.artifacts.cacheDir = cacheDir;
    }
    if (const char* endpoint = std::getenv("ARTIFACT_ENDPOINT")) {
        parseEndpoint(endpoint, config.artifacts.endpointHost, config.artifacts.endpointPort);
    }
    if (const char* host = std::getenv("API_HOST")) {
        config.server.host = host;
    }
    if (const char* port = std::getenv("API_PORT")) {
        try {
            config.server.port = std::stoi(port);
        } catch (const std::exception&) {
            throw std::invalid_argument(std::string("Invalid API_PORT: ") + port);
        }
    }
    validateConfig(config);
}

void validateConfig(const AppConfig& config) {
    if (config.artifacts.store != "http" && config.artifacts.store != "s3" &&
        config.artifacts.store != "local") {
        throw std::invalid_argument("Unknown artifact store: " + config.artifacts.store);
    }
    if (config.artifacts.bucket.empty()) {
        throw std::invalid_argument("Artifact bucket must not be empty");
    }
    if (config.artifacts.cacheDir.empty()) {
        throw std::invalid_argument("Model cache directory must not be empty");
    }
    if (config.artifacts.endpointPort <= 0 || config.artifacts.endpointPort > 65535) {
        throw std::invalid_argument("Artifact endpoint port out of range");
    }
    checkPositive(config.artifacts.requestTimeoutMs, "artifacts.request_timeout_ms");

    checkUnit(config.detector.scoreThreshold, "detector.score_threshold");
    checkUnit(config.detector.minRelativeArea, "detector.min_relative_area");
    checkUnit(config.detector.minRelativeHeight, "detector.min_relative_height");
    checkUnit(config.detector.nmsIouThreshold, "detector.nms_iou_threshold");
    checkUnit(config.classifier.lowConfidenceThreshold, "classifier.low_confidence_threshold");

    checkPositive(config.loader.initialBackoffMs, "loader.initial_backoff_ms");
    checkPositive(config.loader.maxBackoffMs, "loader.max_backoff_ms");
    checkPositive(config.loader.loadTimeoutMs, "loader.load_timeout_ms");
    if (config.loader.maxBackoffMs < config.loader.initialBackoffMs) {
        throw std::invalid_argument("loader.max_backoff_ms must not be below loader.initial_backoff_ms");
    }

    checkPositive(static_cast<long>(config.inference.workers), "inference.workers");
    checkPositive(static_cast<long>(config.inference.queueDepth), "inference.queue_depth");
    checkPositive(config.inference.requestTimeoutMs, "inference.request_timeout_ms");

    if (config.server.port <= 0 || config.server.port > 65535) {
        throw std::invalid_argument("server.port out of range");
    }
    checkPositive(static_cast<long>(config.server.threads), "server.threads");
    checkPositive(static_cast<long>(config.server.maxUploadBytes), "server.max_upload_bytes");
    checkPositive(static_cast<long>(config.server.maxBatchSize), "server.max_batch_size");
}

} // namespace gAI
