#include "gAI/ArtifactStore.hpp"
#include <aws/core/Aws.h>
#include <aws/core/utils/memory/stl/AWSStreamFwd.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/S3ClientConfiguration.h>
#include <aws/s3/S3Errors.h>
#include <aws/s3/model/GetObjectRequest.h>
#include <fstream>
#include <iostream>
#include <mutex>

namespace gAI {

namespace {

const char* kAllocationTag = "S3ArtifactStore";

// Aws::InitAPI and Aws::ShutdownAPI bracket every client in the process
class AwsApi {
public:
    static std::shared_ptr<AwsApi> acquire() {
        static std::mutex mutex;
        static std::weak_ptr<AwsApi> current;

        std::lock_guard<std::mutex> lock(mutex);
        auto api = current.lock();
        if (!api) {
            api = std::shared_ptr<AwsApi>(new AwsApi());
            current = api;
        }
        return api;
    }

    ~AwsApi() {
        Aws::ShutdownAPI(options_);
    }

private:
    AwsApi() {
        Aws::InitAPI(options_);
    }

    Aws::SDKOptions options_;
};

FetchErrorKind classify(const Aws::S3::S3Error& error) {
    switch (error.GetErrorType()) {
        case Aws::S3::S3Errors::NO_SUCH_KEY:
        case Aws::S3::S3Errors::NO_SUCH_BUCKET:
            return FetchErrorKind::MissingFile;
        case Aws::S3::S3Errors::ACCESS_DENIED:
        case Aws::S3::S3Errors::INVALID_ACCESS_KEY_ID:
        case Aws::S3::S3Errors::SIGNATURE_DOES_NOT_MATCH:
            return FetchErrorKind::PermissionError;
        default:
            return fetchErrorKindForStatus(static_cast<int>(error.GetResponseCode()));
    }
}

} // namespace

class S3ArtifactStore::Impl {
public:
    Impl(const std::string& region, std::chrono::milliseconds requestTimeout)
        : api_(AwsApi::acquire()) {
        Aws::S3::S3ClientConfiguration config;
        if (!region.empty()) {
            config.region = region;
        }
        config.connectTimeoutMs = static_cast<long>(requestTimeout.count());
        config.requestTimeoutMs = static_cast<long>(requestTimeout.count());
        client_ = std::make_unique<Aws::S3::S3Client>(config);

        std::cout << "[S3ArtifactStore] Client ready (region "
                  << (region.empty() ? std::string("default") : region) << ")" << std::endl;
    }

    std::optional<FetchError> download(const std::string& bucket,
                                       const std::string& key,
                                       const std::string& localPath) {
        Aws::S3::Model::GetObjectRequest request;
        request.SetBucket(bucket.c_str());
        request.SetKey(key.c_str());
        // Stream the body straight to disk instead of buffering model weights
        request.SetResponseStreamFactory([localPath]() {
            return Aws::New<Aws::FStream>(kAllocationTag, localPath.c_str(),
                                          std::ios_base::out | std::ios_base::binary | std::ios_base::trunc);
        });

        auto outcome = client_->GetObject(request);
        if (outcome.IsSuccess()) {
            return std::nullopt;
        }

        const auto& error = outcome.GetError();
        std::string message = std::string(error.GetExceptionName().c_str()) + ": " +
                              error.GetMessage().c_str() + " (s3://" + bucket + "/" + key + ")";
        return FetchError{classify(error), key, message};
    }

private:
    // Declared first so the SDK outlives the client
    std::shared_ptr<AwsApi> api_;
    std::unique_ptr<Aws::S3::S3Client> client_;
};

S3ArtifactStore::S3ArtifactStore(const std::string& region, std::chrono::milliseconds requestTimeout)
    : pImpl_(std::make_unique<Impl>(region, requestTimeout)) {}

S3ArtifactStore::~S3ArtifactStore() = default;

std::optional<FetchError> S3ArtifactStore::download(const std::string& bucket,
                                                    const std::string& key,
                                                    const std::string& localPath) {
    return pImpl_->download(bucket, key, localPath);
}

} // namespace gAI
