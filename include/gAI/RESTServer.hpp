#pragma once

#include <memory>
#include <string>
#include "gAI/Config.hpp"
#include "gAI/PredictionOrchestrator.hpp"

namespace gAI {

class RESTServer {
public:
    RESTServer(ServerConfig config, std::shared_ptr<PredictionOrchestrator> orchestrator);
    ~RESTServer();

    // Serves until stop() is called or SIGINT/SIGTERM arrives
    void start();
    void stop();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace gAI
