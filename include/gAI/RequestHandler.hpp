#pragma once

#include <memory>
#include <string>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include "gAI/Config.hpp"
#include "gAI/InferencePool.hpp"
#include "gAI/PredictionOrchestrator.hpp"

namespace gAI {

using Request = boost::beast::http::request<boost::beast::http::string_body>;
using Response = boost::beast::http::response<boost::beast::http::string_body>;

// Maps HTTP requests onto the orchestrator. Boundary validation (content
// type, upload size, batch size) happens here, before any prediction runs.
class RequestHandler {
public:
    RequestHandler(ServerConfig config, std::shared_ptr<PredictionOrchestrator> orchestrator);

    Response handle(const Request& request, std::shared_ptr<CancellationToken> token) const;

private:
    Response handleRoot(const Request& request) const;
    Response handleHealth(const Request& request) const;
    Response handlePredict(const Request& request, std::shared_ptr<CancellationToken> token) const;
    Response handlePredictBatch(const Request& request, std::shared_ptr<CancellationToken> token) const;

    ServerConfig config_;
    std::shared_ptr<PredictionOrchestrator> orchestrator_;
};

Response jsonResponse(const Request& request, boost::beast::http::status status, const nlohmann::json& body);

} // namespace gAI
