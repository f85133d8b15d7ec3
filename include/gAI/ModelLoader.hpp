#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "gAI/ArtifactStore.hpp"
#include "gAI/Config.hpp"
#include "gAI/ModelBundle.hpp"
#include "gAI/Types.hpp"

namespace gAI {

enum class LoadState {
    NotLoaded,
    Loading,
    Ready,
    Failed
};

enum class LoadErrorKind {
    ArtifactUnavailable,
    CorruptArtifact,
    Timeout
};

struct LoadError {
    LoadErrorKind kind;
    std::string message;
    // Time left until the loader accepts another attempt
    std::chrono::milliseconds retryAfter{0};
};

struct LoadResult {
    std::shared_ptr<const ModelBundle> bundle;
    std::optional<LoadError> error;

    explicit operator bool() const { return bundle != nullptr; }
};

const char* toString(LoadState state);
const char* toString(LoadErrorKind kind);

// Owns the process-wide model bundle and its load state machine:
// NotLoaded -> Loading -> Ready, or Loading -> Failed -> NotLoaded once the
// backoff delay has passed. Concurrent callers share one in-flight load.
class ModelLoader {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    ModelLoader(ArtifactConfig artifacts,
                LoaderConfig config,
                std::shared_ptr<ArtifactStore> store,
                BundleFactory factory = loadOnnxBundle,
                Clock clock = [] { return std::chrono::steady_clock::now(); });
    ~ModelLoader();

    ModelLoader(const ModelLoader&) = delete;
    ModelLoader& operator=(const ModelLoader&) = delete;

    // Returns the ready bundle, loading it first if needed. Blocks while a
    // load is in flight, at most until that load's deadline or maxWait.
    LoadResult ensureReady(std::optional<std::chrono::milliseconds> maxWait = std::nullopt);

    // Starts a load without waiting for it; no-op unless NotLoaded
    void startBackgroundLoad();

    LoadState state() const { return state_.load(); }
    std::optional<LoadError> lastError() const;

    // Never triggers a load
    HealthSnapshot health() const;

    // Load threads started but not yet joined
    std::size_t trackedLoads() const;

private:
    struct LoadAttempt {
        std::uint64_t id = 0;
        std::atomic<bool> cancelled{false};
        bool finished = false;  // guarded by mutex_
        std::thread thread;
    };

    void beginLoad();
    void runLoad(LoadAttempt& attempt);
    void reapLocked();
    void cancelCurrentLocked();
    void failLocked(LoadErrorKind kind, const std::string& message);
    void refreshLocked();
    LoadResult resultLocked() const;
    std::chrono::milliseconds backoffDelay() const;

    ArtifactConfig artifacts_;
    LoaderConfig config_;
    ArtifactStoreClient client_;
    BundleFactory factory_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<LoadState> state_{LoadState::NotLoaded};

    // Published with std::atomic_store once Ready so readers skip the mutex
    std::shared_ptr<const ModelBundle> readyBundle_;

    std::optional<LoadError> error_;
    std::chrono::steady_clock::time_point retryAt_;
    std::chrono::steady_clock::time_point deadline_;
    std::uint64_t attempt_ = 0;
    int consecutiveFailures_ = 0;

    // A timed-out attempt may still be running next to its replacement; each
    // one downloads into its own partial directory
    std::vector<std::unique_ptr<LoadAttempt>> attempts_;
};

} // namespace gAI
