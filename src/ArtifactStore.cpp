#include "gAI/ArtifactStore.hpp"
#include <atomic>
#include <filesystem>
#include <iostream>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace gAI {

namespace {

std::string objectKey(const std::string& prefix, const std::string& file) {
    if (prefix.empty() || prefix.back() == '/') {
        return prefix + file;
    }
    return prefix + "/" + file;
}

std::string partialDirectory(const std::string& destination) {
    static std::atomic<unsigned> counter{0};
    fs::path dest(destination);
    std::string name = dest.filename().string();
    if (name.empty()) {
        name = dest.parent_path().filename().string();
        dest = dest.parent_path();
    }
    return (dest.parent_path() / (name + ".partial-" + std::to_string(::getpid()) + "-" +
                                  std::to_string(counter++))).string();
}

void removeQuietly(const fs::path& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        std::cerr << "[ArtifactStore] Failed to remove " << path << ": " << ec.message() << std::endl;
    }
}

} // namespace

const char* toString(FetchErrorKind kind) {
    switch (kind) {
        case FetchErrorKind::MissingFile:
            return "missing_file";
        case FetchErrorKind::NetworkError:
            return "network_error";
        case FetchErrorKind::PermissionError:
            return "permission_error";
    }
    return "unknown";
}

FetchErrorKind fetchErrorKindForStatus(int status) {
    switch (status) {
        case 404:
            return FetchErrorKind::MissingFile;
        case 401:
        case 403:
            return FetchErrorKind::PermissionError;
        default:
            return FetchErrorKind::NetworkError;
    }
}

const std::vector<std::string>& requiredArtifacts() {
    static const std::vector<std::string> files = {
        "model.onnx",
        "config.json",
        "preprocessor_config.json",
        "detector.onnx",
        "detector_config.json"
    };
    return files;
}

LocalArtifactStore::LocalArtifactStore(std::string root) : root_(std::move(root)) {}

std::optional<FetchError> LocalArtifactStore::download(const std::string& bucket,
                                                       const std::string& key,
                                                       const std::string& localPath) {
    fs::path source = fs::path(root_) / bucket / key;
    std::error_code ec;

    auto status = fs::status(source, ec);
    if (ec || !fs::exists(status)) {
        if (ec == std::errc::permission_denied) {
            return FetchError{FetchErrorKind::PermissionError, key, "Permission denied: " + source.string()};
        }
        return FetchError{FetchErrorKind::MissingFile, key, "Object not found: " + source.string()};
    }
    if (!fs::is_regular_file(status)) {
        return FetchError{FetchErrorKind::MissingFile, key, "Not a regular file: " + source.string()};
    }
    if ((status.permissions() & (fs::perms::owner_read | fs::perms::group_read | fs::perms::others_read)) ==
        fs::perms::none) {
        return FetchError{FetchErrorKind::PermissionError, key, "Object is not readable: " + source.string()};
    }

    fs::copy_file(source, localPath, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        if (ec == std::errc::permission_denied) {
            return FetchError{FetchErrorKind::PermissionError, key, ec.message()};
        }
        return FetchError{FetchErrorKind::NetworkError, key, ec.message()};
    }
    return std::nullopt;
}

ArtifactStoreClient::ArtifactStoreClient(std::shared_ptr<ArtifactStore> store)
    : store_(std::move(store)) {}

bool ArtifactStoreClient::isComplete(const std::string& destination) {
    std::error_code ec;
    for (const auto& file : requiredArtifacts()) {
        if (!fs::is_regular_file(fs::path(destination) / file, ec)) {
            return false;
        }
    }
    return true;
}

std::optional<FetchError> ArtifactStoreClient::fetch(const std::string& bucket,
                                                     const std::string& prefix,
                                                     const std::string& destination,
                                                     const std::atomic<bool>* cancelled) {
    auto isCancelled = [cancelled] { return cancelled && cancelled->load(); };
    fs::path partial = partialDirectory(destination);
    std::error_code ec;

    fs::create_directories(partial, ec);
    if (ec) {
        return FetchError{FetchErrorKind::PermissionError, partial.string(),
                          "Cannot create cache directory: " + ec.message()};
    }

    for (const auto& file : requiredArtifacts()) {
        std::string key = objectKey(prefix, file);
        if (isCancelled()) {
            std::cerr << "[ArtifactStore] Download of " << bucket << "/" << prefix << " cancelled" << std::endl;
            removeQuietly(partial);
            return FetchError{FetchErrorKind::NetworkError, key, "Download cancelled"};
        }
        auto error = store_->download(bucket, key, (partial / file).string());
        if (error) {
            std::cerr << "[ArtifactStore] Failed to download " << bucket << "/" << key
                      << " (" << toString(error->kind) << "): " << error->message << std::endl;
            removeQuietly(partial);
            return error;
        }
        std::cout << "[ArtifactStore] Downloaded " << key << " to " << (partial / file).string() << std::endl;
    }

    if (isCancelled()) {
        removeQuietly(partial);
        return FetchError{FetchErrorKind::NetworkError, destination, "Download cancelled"};
    }

    // A leftover incomplete cache is replaced; rename cannot overwrite a non-empty directory
    if (fs::exists(destination, ec)) {
        removeQuietly(destination);
    }

    fs::rename(partial, destination, ec);
    if (ec) {
        removeQuietly(partial);
        return FetchError{FetchErrorKind::PermissionError, destination,
                          "Cannot move artifacts into place: " + ec.message()};
    }

    std::cout << "[ArtifactStore] Model download completed into " << destination << std::endl;
    return std::nullopt;
}

} // namespace gAI
