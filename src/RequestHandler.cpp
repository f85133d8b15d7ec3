#include "gAI/RequestHandler.hpp"
#include "gAI/ApiResponses.hpp"
#include "gAI/Multipart.hpp"
#include <cmath>
#include <iostream>

namespace http = boost::beast::http;
using json = nlohmann::json;

namespace gAI {

namespace {

constexpr const char* kVersion = "1.0.0";

bool isImage(const MultipartPart& part) {
    return part.contentType.rfind("image/", 0) == 0;
}

std::vector<unsigned char> bytesOf(const MultipartPart& part) {
    return std::vector<unsigned char>(part.data.begin(), part.data.end());
}

json detail(const std::string& message) {
    return json{{"detail", message}};
}

std::string pathOf(const Request& request) {
    std::string target(request.target());
    auto query = target.find('?');
    return query == std::string::npos ? target : target.substr(0, query);
}

std::optional<double> retryAfterOf(const PredictionOutcome& outcome) {
    if (auto failure = std::get_if<PredictionFailure>(&outcome)) {
        return failure->retryAfterSeconds;
    }
    return std::nullopt;
}

} // namespace

Response jsonResponse(const Request& request, http::status status, const json& body) {
    Response response{status, request.version()};
    response.set(http::field::server, "genderAI");
    response.set(http::field::content_type, "application/json");
    response.set(http::field::access_control_allow_origin, "*");
    response.keep_alive(false);
    if (request.method() != http::verb::head) {
        response.body() = body.dump();
    }
    response.prepare_payload();
    return response;
}

RequestHandler::RequestHandler(ServerConfig config, std::shared_ptr<PredictionOrchestrator> orchestrator)
    : config_(std::move(config)), orchestrator_(std::move(orchestrator)) {}

Response RequestHandler::handle(const Request& request, std::shared_ptr<CancellationToken> token) const {
    const std::string path = pathOf(request);

    if (request.method() == http::verb::options) {
        Response response{http::status::no_content, request.version()};
        response.set(http::field::access_control_allow_origin, "*");
        response.set(http::field::access_control_allow_methods, "GET, HEAD, POST, OPTIONS");
        response.set(http::field::access_control_allow_headers, "*");
        response.keep_alive(false);
        response.prepare_payload();
        return response;
    }

    try {
        if (path == "/") {
            return handleRoot(request);
        }
        if (path == "/health") {
            return handleHealth(request);
        }
        if (path == "/predict") {
            return handlePredict(request, std::move(token));
        }
        if (path == "/predict-batch") {
            return handlePredictBatch(request, std::move(token));
        }
        return jsonResponse(request, http::status::not_found, detail("Not Found"));
    }
    catch (const std::invalid_argument& e) {
        std::cerr << "[RequestHandler] Rejected malformed request to " << path << ": " << e.what() << std::endl;
        return jsonResponse(request, http::status::bad_request, detail(e.what()));
    }
    catch (const std::exception& e) {
        std::cerr << "[RequestHandler] Error processing request to " << path << ": " << e.what() << std::endl;
        return jsonResponse(request, http::status::internal_server_error,
                            detail(std::string("Prediction failed: ") + e.what()));
    }
}

Response RequestHandler::handleRoot(const Request& request) const {
    if (request.method() != http::verb::get && request.method() != http::verb::head) {
        return jsonResponse(request, http::status::method_not_allowed, detail("Method Not Allowed"));
    }
    json body;
    body["message"] = "Gender Classification API";
    body["status"] = "healthy";
    body["version"] = kVersion;
    return jsonResponse(request, http::status::ok, body);
}

Response RequestHandler::handleHealth(const Request& request) const {
    if (request.method() != http::verb::get && request.method() != http::verb::head) {
        return jsonResponse(request, http::status::method_not_allowed, detail("Method Not Allowed"));
    }
    return jsonResponse(request, http::status::ok,
                        toJson(orchestrator_->health(), orchestrator_->loader().state()));
}

Response RequestHandler::handlePredict(const Request& request, std::shared_ptr<CancellationToken> token) const {
    if (request.method() != http::verb::post) {
        return jsonResponse(request, http::status::method_not_allowed, detail("Method Not Allowed"));
    }

    auto parts = parseMultipart(std::string(request[http::field::content_type]), request.body());

    const MultipartPart* file = nullptr;
    for (const auto& part : parts) {
        if (part.name == "file") {
            file = &part;
            break;
        }
    }
    if (!file) {
        return jsonResponse(request, http::status::bad_request, detail("No file uploaded"));
    }
    if (!isImage(*file)) {
        return jsonResponse(request, http::status::bad_request, detail("File must be an image"));
    }
    if (file->data.size() > config_.maxUploadBytes) {
        return jsonResponse(request, http::status::payload_too_large, detail("File too large"));
    }

    PredictionOutcome outcome = orchestrator_->predict(bytesOf(*file), std::move(token));

    Response response = jsonResponse(request, http::status::ok, toJson(outcome));
    if (auto retryAfter = retryAfterOf(outcome)) {
        response.set(http::field::retry_after, std::to_string(static_cast<long>(std::ceil(*retryAfter))));
    }
    return response;
}

Response RequestHandler::handlePredictBatch(const Request& request,
                                            std::shared_ptr<CancellationToken> token) const {
    if (request.method() != http::verb::post) {
        return jsonResponse(request, http::status::method_not_allowed, detail("Method Not Allowed"));
    }

    auto parts = parseMultipart(std::string(request[http::field::content_type]), request.body());

    std::vector<const MultipartPart*> files;
    for (const auto& part : parts) {
        if (part.name == "files") {
            files.push_back(&part);
        }
    }
    if (files.empty()) {
        return jsonResponse(request, http::status::bad_request, detail("No files uploaded"));
    }
    if (files.size() > config_.maxBatchSize) {
        return jsonResponse(request, http::status::bad_request,
                            detail("Maximum " + std::to_string(config_.maxBatchSize) + " images per batch"));
    }

    // Items that pass validation are predicted together; the rest keep their slot
    std::vector<json> results(files.size());
    std::vector<size_t> accepted;
    std::vector<std::vector<unsigned char>> images;
    for (size_t i = 0; i < files.size(); i++) {
        if (!isImage(*files[i])) {
            results[i] = itemError(files[i]->filename, "File must be an image");
        } else if (files[i]->data.size() > config_.maxUploadBytes) {
            results[i] = itemError(files[i]->filename, "File too large");
        } else {
            accepted.push_back(i);
            images.push_back(bytesOf(*files[i]));
        }
    }

    auto outcomes = orchestrator_->predictBatch(images, std::move(token));
    for (size_t k = 0; k < accepted.size(); k++) {
        json entry = toJson(outcomes[k]);
        entry["filename"] = files[accepted[k]]->filename;
        results[accepted[k]] = entry;
    }

    return jsonResponse(request, http::status::ok, json{{"results", results}});
}

} // namespace gAI
