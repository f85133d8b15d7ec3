#include "gAI/ArtifactStore.hpp"
#include "gAI/Config.hpp"
#include "gAI/InferencePool.hpp"
#include "gAI/ModelLoader.hpp"
#include "gAI/PredictionOrchestrator.hpp"
#include "gAI/RESTServer.hpp"
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <opencv2/core.hpp>

namespace {

std::shared_ptr<gAI::ArtifactStore> makeStore(const gAI::ArtifactConfig& config) {
    const std::chrono::milliseconds timeout(config.requestTimeoutMs);
    if (config.store == "local") {
        std::cout << "Using local artifact store at " << config.localRoot << std::endl;
        return std::make_shared<gAI::LocalArtifactStore>(config.localRoot);
    }
    if (config.store == "s3") {
#ifdef GENDERAI_WITH_S3
        std::cout << "Using Amazon S3 artifact store" << std::endl;
        return std::make_shared<gAI::S3ArtifactStore>(config.region, timeout);
#else
        throw std::runtime_error("Artifact store \"s3\" requires a build with aws-sdk-cpp");
#endif
    }
    std::cout << "Using artifact endpoint " << config.endpointHost << ":" << config.endpointPort << std::endl;
    return std::make_shared<gAI::HttpArtifactStore>(config.endpointHost, config.endpointPort, timeout);
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        std::cout << "OpenCV Version: " << CV_VERSION << std::endl;

        gAI::AppConfig config;
        if (argc > 1) {
            std::cout << "Loading configuration from " << argv[1] << std::endl;
            config = gAI::loadConfig(argv[1]);
        }
        gAI::applyEnvironment(config);

        std::cout << "Model source: " << config.artifacts.bucket << "/" << config.artifacts.prefix
                  << " (cache " << config.artifacts.cacheDir << ")" << std::endl;

        auto loader = std::make_shared<gAI::ModelLoader>(config.artifacts, config.loader,
                                                         makeStore(config.artifacts));
        auto pool = std::make_shared<gAI::InferencePool>(config.inference.workers, config.inference.queueDepth);
        auto orchestrator = std::make_shared<gAI::PredictionOrchestrator>(
            loader, pool, config.detector, config.classifier,
            std::chrono::milliseconds(config.inference.requestTimeoutMs));

        if (config.loader.eagerLoad) {
            std::cout << "Loading models in the background" << std::endl;
            loader->startBackgroundLoad();
        }

        gAI::RESTServer server(config.server, orchestrator);
        server.start();
        std::cout << "Server stopped" << std::endl;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
