#include <gtest/gtest.h>
#include "TestSupport.hpp"
#include "gAI/RequestHandler.hpp"

using namespace gAI;
using namespace std::chrono_literals;
using gAI::test::FakeBundleFactory;
using gAI::test::FakeClassifier;
using gAI::test::FakeDetector;
using gAI::test::MemoryArtifactStore;
using gAI::test::TempDir;
using gAI::test::encodeImage;
using gAI::test::person;

namespace http = boost::beast::http;
using json = nlohmann::json;

namespace {

const std::string kBoundary = "gAITestBoundary";

struct Upload {
    std::string field;
    std::string filename;
    std::string contentType;
    std::string data;
};

std::string asString(const std::vector<unsigned char>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

Request multipartRequest(const std::string& target, const std::vector<Upload>& uploads) {
    std::string body;
    for (const auto& upload : uploads) {
        body += "--" + kBoundary + "\r\n";
        body += "Content-Disposition: form-data; name=\"" + upload.field + "\"; filename=\"" +
                upload.filename + "\"\r\n";
        body += "Content-Type: " + upload.contentType + "\r\n\r\n";
        body += upload.data + "\r\n";
    }
    body += "--" + kBoundary + "--\r\n";

    Request request{http::verb::post, target, 11};
    request.set(http::field::content_type, "multipart/form-data; boundary=" + kBoundary);
    request.body() = body;
    request.prepare_payload();
    return request;
}

class RequestHandlerTest : public ::testing::Test {
protected:
    RequestHandlerTest() {
        ArtifactConfig artifacts;
        artifacts.bucket = "models";
        artifacts.prefix = "gender/";
        artifacts.cacheDir = tmp_.str("cache");

        auto store = std::make_shared<MemoryArtifactStore>();
        store->putBundle(artifacts.bucket, artifacts.prefix);

        FakeBundleFactory factory;
        factory.detector = std::make_shared<FakeDetector>([](const cv::Mat& image) {
            if (image.cols == 600) {
                return std::vector<Detection>{person(0, 10, 150, 180, 0.95f), person(300, 10, 150, 180, 0.9f)};
            }
            return std::vector<Detection>{person(20, 20, 200, 200, 0.97f)};
        });
        factory.classifier = std::make_shared<FakeClassifier>(0.12f, 0.88f);

        server_.maxUploadBytes = 256 * 1024;
        server_.maxBatchSize = 3;

        loader_ = std::make_shared<ModelLoader>(artifacts, LoaderConfig{}, store, factory);
        auto pool = std::make_shared<InferencePool>(2, 8);
        auto orchestrator = std::make_shared<PredictionOrchestrator>(loader_, pool, DetectorConfig{},
                                                                     ClassifierConfig{}, 5000ms);
        handler_ = std::make_unique<RequestHandler>(server_, orchestrator);
    }

    Response handle(const Request& request) {
        return handler_->handle(request, std::make_shared<CancellationToken>());
    }

    static json bodyOf(const Response& response) {
        return json::parse(response.body());
    }

    TempDir tmp_;
    ServerConfig server_;
    std::shared_ptr<ModelLoader> loader_;
    std::unique_ptr<RequestHandler> handler_;
};

} // namespace

TEST_F(RequestHandlerTest, RootReportsService) {
    auto response = handle(Request{http::verb::get, "/", 11});

    EXPECT_EQ(response.result(), http::status::ok);
    EXPECT_EQ(std::string(response[http::field::content_type]), "application/json");
    EXPECT_EQ(std::string(response[http::field::access_control_allow_origin]), "*");
    auto body = bodyOf(response);
    EXPECT_EQ(body["message"], "Gender Classification API");
    EXPECT_EQ(body["status"], "healthy");
}

TEST_F(RequestHandlerTest, HealthReflectsLoaderState) {
    auto before = bodyOf(handle(Request{http::verb::get, "/health", 11}));
    EXPECT_EQ(before["status"], "unhealthy");
    EXPECT_EQ(before["model_loaded"], false);
    EXPECT_EQ(before["load_state"], "not_loaded");

    ASSERT_TRUE(loader_->ensureReady());

    auto after = bodyOf(handle(Request{http::verb::get, "/health?verbose=1", 11}));
    EXPECT_EQ(after["status"], "healthy");
    EXPECT_EQ(after["detector_loaded"], true);
    EXPECT_EQ(after["load_state"], "ready");
}

TEST_F(RequestHandlerTest, PredictReturnsClassification) {
    auto response = handle(multipartRequest("/predict",
                                            {{"file", "me.jpg", "image/jpeg", asString(encodeImage(320, 240, ".jpg"))}}));

    ASSERT_EQ(response.result(), http::status::ok);
    auto body = bodyOf(response);
    EXPECT_EQ(body["prediction"], "female");
    EXPECT_NEAR(body["confidence"].get<double>(), 0.88, 1e-6);
    EXPECT_EQ(body["person_count"], 1);
    EXPECT_TRUE(body["error"].is_null());
}

TEST_F(RequestHandlerTest, PredictRejectsNonImages) {
    auto response = handle(multipartRequest("/predict", {{"file", "notes.txt", "text/plain", "hello"}}));

    EXPECT_EQ(response.result(), http::status::bad_request);
    EXPECT_EQ(bodyOf(response)["detail"], "File must be an image");
    EXPECT_EQ(loader_->state(), LoadState::NotLoaded);
}

TEST_F(RequestHandlerTest, PredictRejectsOversizedUploads) {
    std::string big(server_.maxUploadBytes + 1, 'x');
    auto response = handle(multipartRequest("/predict", {{"file", "big.png", "image/png", big}}));

    EXPECT_EQ(response.result(), http::status::payload_too_large);
    EXPECT_EQ(bodyOf(response)["detail"], "File too large");
}

TEST_F(RequestHandlerTest, PredictRequiresMultipart) {
    Request request{http::verb::post, "/predict", 11};
    request.set(http::field::content_type, "application/json");
    request.body() = "{}";
    request.prepare_payload();

    EXPECT_EQ(handle(request).result(), http::status::bad_request);
}

TEST_F(RequestHandlerTest, GroupPhotoIsAnErrorBodyNotAnHttpError) {
    auto response = handle(multipartRequest("/predict",
                                            {{"file", "team.png", "image/png", asString(encodeImage(600, 200))}}));

    ASSERT_EQ(response.result(), http::status::ok);
    auto body = bodyOf(response);
    EXPECT_TRUE(body["prediction"].is_null());
    EXPECT_EQ(body["person_count"], 2);
    EXPECT_EQ(body["error"], "Multiple people detected (2 people). Please use single-person images.");
}

TEST_F(RequestHandlerTest, BatchReturnsOneEntryPerFile) {
    auto response = handle(multipartRequest("/predict-batch", {
        {"files", "a.png", "image/png", asString(encodeImage(320, 240))},
        {"files", "b.txt", "text/plain", "not an image"},
        {"files", "c.png", "image/png", asString(encodeImage(600, 200))},
    }));

    ASSERT_EQ(response.result(), http::status::ok);
    auto results = bodyOf(response)["results"];
    ASSERT_EQ(results.size(), 3u);

    EXPECT_EQ(results[0]["filename"], "a.png");
    EXPECT_EQ(results[0]["prediction"], "female");

    EXPECT_EQ(results[1]["filename"], "b.txt");
    EXPECT_EQ(results[1]["error"], "File must be an image");
    EXPECT_TRUE(results[1]["prediction"].is_null());

    EXPECT_EQ(results[2]["filename"], "c.png");
    EXPECT_EQ(results[2]["person_count"], 2);
}

TEST_F(RequestHandlerTest, BatchRejectsTooManyFiles) {
    std::vector<Upload> uploads;
    for (int i = 0; i < 4; i++) {
        uploads.push_back({"files", "img" + std::to_string(i) + ".png", "image/png", asString(encodeImage(320, 240))});
    }

    auto response = handle(multipartRequest("/predict-batch", uploads));
    EXPECT_EQ(response.result(), http::status::bad_request);
    EXPECT_EQ(bodyOf(response)["detail"], "Maximum 3 images per batch");
    EXPECT_EQ(loader_->state(), LoadState::NotLoaded);
}

TEST_F(RequestHandlerTest, UnknownRoutesAndMethods) {
    EXPECT_EQ(handle(Request{http::verb::get, "/nope", 11}).result(), http::status::not_found);
    EXPECT_EQ(handle(Request{http::verb::get, "/predict", 11}).result(), http::status::method_not_allowed);
    EXPECT_EQ(handle(Request{http::verb::post, "/health", 11}).result(), http::status::method_not_allowed);
}

TEST_F(RequestHandlerTest, PreflightAllowsAnyOrigin) {
    auto response = handle(Request{http::verb::options, "/predict", 11});

    EXPECT_EQ(response.result(), http::status::no_content);
    EXPECT_EQ(std::string(response[http::field::access_control_allow_origin]), "*");
    EXPECT_TRUE(response.body().empty());
}
