#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gAI {

enum class FetchErrorKind {
    MissingFile,
    NetworkError,
    PermissionError
};

struct FetchError {
    FetchErrorKind kind;
    std::string file;     // first offending file
    std::string message;
};

const char* toString(FetchErrorKind kind);

// Failure kind for a non-success HTTP status returned by an object store
FetchErrorKind fetchErrorKindForStatus(int status);

// The fixed set of files that make up a model bundle
const std::vector<std::string>& requiredArtifacts();

// Object storage backend. Implementations copy one object to a local file and
// report failures as FetchError values.
class ArtifactStore {
public:
    virtual ~ArtifactStore() = default;

    virtual std::optional<FetchError> download(const std::string& bucket,
                                               const std::string& key,
                                               const std::string& localPath) = 0;
};

// Objects stored as plain files under <root>/<bucket>/<key>
class LocalArtifactStore : public ArtifactStore {
public:
    explicit LocalArtifactStore(std::string root);

    std::optional<FetchError> download(const std::string& bucket,
                                       const std::string& key,
                                       const std::string& localPath) override;

private:
    std::string root_;
};

// S3-compatible endpoint accessed with unsigned path-style GET requests over
// HTTP. Serves public buckets and mirrors. A connection that stays silent for
// idleTimeout fails with NetworkError.
class HttpArtifactStore : public ArtifactStore {
public:
    HttpArtifactStore(std::string host, int port,
                      std::chrono::milliseconds idleTimeout = std::chrono::milliseconds(30000));
    ~HttpArtifactStore() override;

    std::optional<FetchError> download(const std::string& bucket,
                                       const std::string& key,
                                       const std::string& localPath) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

// Amazon S3 accessed through aws-sdk-cpp with signed requests and the SDK's
// default credential chain, for private buckets. Only available when the
// project is built against the SDK.
class S3ArtifactStore : public ArtifactStore {
public:
    S3ArtifactStore(const std::string& region, std::chrono::milliseconds requestTimeout);
    ~S3ArtifactStore() override;

    std::optional<FetchError> download(const std::string& bucket,
                                       const std::string& key,
                                       const std::string& localPath) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

// Downloads the complete artifact set into a local cache directory
class ArtifactStoreClient {
public:
    explicit ArtifactStoreClient(std::shared_ptr<ArtifactStore> store);

    // Fetches every required artifact under bucket/prefix into destination.
    // Files land in a temporary sibling directory that is renamed into place
    // only once all of them arrived. Returns the first failure, if any.
    // When cancelled is set between two files the fetch stops and nothing is
    // moved into place.
    std::optional<FetchError> fetch(const std::string& bucket,
                                    const std::string& prefix,
                                    const std::string& destination,
                                    const std::atomic<bool>* cancelled = nullptr);

    // True when destination already holds every required artifact
    static bool isComplete(const std::string& destination);

private:
    std::shared_ptr<ArtifactStore> store_;
};

} // namespace gAI
