#include "gAI/ModelLoader.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace gAI {

const char* toString(LoadState state) {
    switch (state) {
        case LoadState::NotLoaded:
            return "not_loaded";
        case LoadState::Loading:
            return "loading";
        case LoadState::Ready:
            return "ready";
        case LoadState::Failed:
            return "failed";
    }
    return "unknown";
}

const char* toString(LoadErrorKind kind) {
    switch (kind) {
        case LoadErrorKind::ArtifactUnavailable:
            return "artifact_unavailable";
        case LoadErrorKind::CorruptArtifact:
            return "corrupt_artifact";
        case LoadErrorKind::Timeout:
            return "timeout";
    }
    return "unknown";
}

ModelLoader::ModelLoader(ArtifactConfig artifacts,
                         LoaderConfig config,
                         std::shared_ptr<ArtifactStore> store,
                         BundleFactory factory,
                         Clock clock)
    : artifacts_(std::move(artifacts)),
      config_(config),
      client_(std::move(store)),
      factory_(std::move(factory)),
      clock_(std::move(clock)) {}

ModelLoader::~ModelLoader() {
    std::vector<std::unique_ptr<LoadAttempt>> attempts;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& attempt : attempts_) {
            attempt->cancelled = true;
        }
        attempts.swap(attempts_);
    }
    for (auto& attempt : attempts) {
        if (attempt->thread.joinable()) attempt->thread.join();
    }
}

LoadResult ModelLoader::ensureReady(std::optional<std::chrono::milliseconds> maxWait) {
    if (auto ready = std::atomic_load(&readyBundle_)) {
        return LoadResult{ready, std::nullopt};
    }

    std::unique_lock<std::mutex> lock(mutex_);
    refreshLocked();

    if (state_ == LoadState::NotLoaded) {
        beginLoad();
    }

    if (state_ == LoadState::Loading) {
        const std::uint64_t attempt = attempt_;
        auto waitUntil = deadline_;
        if (maxWait) {
            waitUntil = std::min(waitUntil, std::chrono::steady_clock::now() + *maxWait);
        }
        bool finished = cv_.wait_until(lock, waitUntil, [this, attempt] {
            return state_ != LoadState::Loading || attempt_ != attempt;
        });

        if (!finished) {
            if (waitUntil < deadline_) {
                // The caller gave up; the load itself carries on
                return LoadResult{nullptr, LoadError{LoadErrorKind::Timeout, "Models are still loading",
                                                     std::chrono::milliseconds(1000)}};
            }
            cancelCurrentLocked();
            failLocked(LoadErrorKind::Timeout,
                       "Model loading did not finish within " +
                       std::to_string(config_.loadTimeoutMs) + " ms");
            cv_.notify_all();
        }
    }

    return resultLocked();
}

void ModelLoader::startBackgroundLoad() {
    std::lock_guard<std::mutex> lock(mutex_);
    refreshLocked();
    if (state_ == LoadState::NotLoaded) {
        beginLoad();
    }
}

std::optional<LoadError> ModelLoader::lastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

HealthSnapshot ModelLoader::health() const {
    bool ready = state_.load() == LoadState::Ready;
    return HealthSnapshot{ready, ready, ready};
}

std::size_t ModelLoader::trackedLoads() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempts_.size();
}

// Caller holds mutex_ and has observed NotLoaded
void ModelLoader::beginLoad() {
    reapLocked();

    state_ = LoadState::Loading;
    ++attempt_;
    deadline_ = std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.loadTimeoutMs);

    std::cout << "[ModelLoader] Loading models (attempt " << attempt_ << ")" << std::endl;
    auto attempt = std::make_unique<LoadAttempt>();
    attempt->id = attempt_;
    LoadAttempt& started = *attempt;
    attempts_.push_back(std::move(attempt));
    started.thread = std::thread(&ModelLoader::runLoad, this, std::ref(started));
}

// Caller holds mutex_. A finished attempt only has to return, so joining it
// here never waits on the lock.
void ModelLoader::reapLocked() {
    for (auto it = attempts_.begin(); it != attempts_.end();) {
        if ((*it)->finished) {
            if ((*it)->thread.joinable()) (*it)->thread.join();
            it = attempts_.erase(it);
        } else {
            ++it;
        }
    }
}

// Caller holds mutex_
void ModelLoader::cancelCurrentLocked() {
    for (auto& attempt : attempts_) {
        if (attempt->id == attempt_) {
            attempt->cancelled = true;
        }
    }
}

void ModelLoader::runLoad(LoadAttempt& attempt) {
    std::shared_ptr<ModelBundle> bundle;
    std::optional<LoadErrorKind> errorKind;
    std::string errorMessage;

    const std::string& cachePath = artifacts_.cacheDir;

    if (!ArtifactStoreClient::isComplete(cachePath)) {
        std::cout << "[ModelLoader] Downloading model from " << artifacts_.bucket << "/"
                  << artifacts_.prefix << std::endl;
        auto fetchError = client_.fetch(artifacts_.bucket, artifacts_.prefix, cachePath, &attempt.cancelled);
        if (fetchError) {
            errorKind = LoadErrorKind::ArtifactUnavailable;
            errorMessage = std::string(toString(fetchError->kind)) + " on " + fetchError->file +
                           ": " + fetchError->message;
        }
    } else {
        std::cout << "[ModelLoader] Using cached model files in " << cachePath << std::endl;
    }

    if (!errorKind && !attempt.cancelled) {
        try {
            bundle = factory_(cachePath);
            if (!bundle) {
                throw ArtifactError("Model factory returned no bundle");
            }
            bundle->bucket = artifacts_.bucket;
            bundle->prefix = artifacts_.prefix;
            bundle->cachePath = cachePath;
        }
        catch (const std::exception& e) {
            errorKind = LoadErrorKind::CorruptArtifact;
            errorMessage = e.what();

            // Drop the cache so the next attempt downloads fresh copies. An
            // abandoned attempt leaves it to its replacement.
            if (!attempt.cancelled) {
                std::error_code ec;
                fs::remove_all(cachePath, ec);
                if (ec) {
                    std::cerr << "[ModelLoader] Failed to clear cache " << cachePath << ": " << ec.message() << std::endl;
                }
            }
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    attempt.finished = true;
    if (attempt.cancelled || attempt.id != attempt_ || state_ != LoadState::Loading) {
        std::cerr << "[ModelLoader] Discarding result of stale load attempt " << attempt.id << std::endl;
        return;
    }

    if (errorKind) {
        failLocked(*errorKind, errorMessage);
    } else {
        std::atomic_store(&readyBundle_, std::shared_ptr<const ModelBundle>(bundle));
        error_.reset();
        consecutiveFailures_ = 0;
        state_ = LoadState::Ready;
        std::cout << "[ModelLoader] Models ready" << std::endl;
    }
    cv_.notify_all();
}

// Caller holds mutex_
void ModelLoader::failLocked(LoadErrorKind kind, const std::string& message) {
    ++consecutiveFailures_;
    auto delay = backoffDelay();
    retryAt_ = clock_() + delay;
    error_ = LoadError{kind, message, delay};
    state_ = LoadState::Failed;

    std::cerr << "[ModelLoader] Model loading failed (" << toString(kind) << "): " << message
              << "; retry allowed in " << delay.count() << " ms" << std::endl;
}

// Caller holds mutex_
void ModelLoader::refreshLocked() {
    if (state_ == LoadState::Failed && clock_() >= retryAt_) {
        std::cout << "[ModelLoader] Backoff elapsed, models may be reloaded" << std::endl;
        state_ = LoadState::NotLoaded;
    }
}

// Caller holds mutex_
LoadResult ModelLoader::resultLocked() const {
    if (state_ == LoadState::Ready) {
        return LoadResult{std::atomic_load(&readyBundle_), std::nullopt};
    }

    LoadError error = error_ ? *error_
                             : LoadError{LoadErrorKind::ArtifactUnavailable, "Models are not loaded", {}};
    if (state_ == LoadState::Failed) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(retryAt_ - clock_());
        error.retryAfter = std::max(remaining, std::chrono::milliseconds(0));
    }
    return LoadResult{nullptr, error};
}

std::chrono::milliseconds ModelLoader::backoffDelay() const {
    long delay = config_.initialBackoffMs;
    for (int i = 1; i < consecutiveFailures_ && delay < config_.maxBackoffMs; i++) {
        delay *= 2;
    }
    return std::chrono::milliseconds(std::min(delay, config_.maxBackoffMs));
}

} // namespace gAI
