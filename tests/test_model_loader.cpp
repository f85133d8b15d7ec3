#include <gtest/gtest.h>
#include <filesystem>
#include <thread>
#include "TestSupport.hpp"
#include "gAI/ModelLoader.hpp"

using namespace gAI;
using namespace std::chrono_literals;
using gAI::test::FakeBundleFactory;
using gAI::test::FakeClassifier;
using gAI::test::FakeDetector;
using gAI::test::GatedArtifactStore;
using gAI::test::ManualClock;
using gAI::test::MemoryArtifactStore;
using gAI::test::ReleaseOnExit;
using gAI::test::TempDir;

namespace fs = std::filesystem;

namespace {

const std::string kBucket = "models";
const std::string kPrefix = "gender/";

class ModelLoaderTest : public ::testing::Test {
protected:
    ModelLoaderTest() {
        artifacts_.store = "local";
        artifacts_.bucket = kBucket;
        artifacts_.prefix = kPrefix;
        artifacts_.cacheDir = tmp_.str("cache");

        config_.initialBackoffMs = 1000;
        config_.maxBackoffMs = 60000;
        config_.loadTimeoutMs = 5000;

        factory_.detector = std::make_shared<FakeDetector>([](const cv::Mat&) {
            return std::vector<Detection>{};
        });
        factory_.classifier = std::make_shared<FakeClassifier>(0.5f, 0.5f);
        store_ = std::make_shared<MemoryArtifactStore>();
    }

    std::unique_ptr<ModelLoader> makeLoader() {
        return std::make_unique<ModelLoader>(artifacts_, config_, store_, factory_, clock_.fn());
    }

    TempDir tmp_;
    ArtifactConfig artifacts_;
    LoaderConfig config_;
    FakeBundleFactory factory_;
    std::shared_ptr<MemoryArtifactStore> store_;
    ManualClock clock_;
};

} // namespace

TEST_F(ModelLoaderTest, StartsNotLoadedAndHealthDoesNotLoad) {
    auto loader = makeLoader();

    HealthSnapshot health = loader->health();
    EXPECT_FALSE(health.healthy());
    EXPECT_FALSE(health.classifierLoaded);
    EXPECT_FALSE(health.preprocessorLoaded);
    EXPECT_FALSE(health.detectorLoaded);
    EXPECT_EQ(loader->state(), LoadState::NotLoaded);
    EXPECT_EQ(store_->downloads.load(), 0);
}

TEST_F(ModelLoaderTest, LoadsOnFirstUse) {
    store_->putBundle(kBucket, kPrefix);
    auto loader = makeLoader();

    LoadResult result = loader->ensureReady();
    ASSERT_TRUE(result);
    EXPECT_EQ(loader->state(), LoadState::Ready);
    EXPECT_TRUE(loader->health().healthy());
    EXPECT_EQ(result.bundle->bucket, kBucket);
    EXPECT_EQ(result.bundle->prefix, kPrefix);
    EXPECT_EQ(result.bundle->cachePath, artifacts_.cacheDir);
    EXPECT_TRUE(ArtifactStoreClient::isComplete(artifacts_.cacheDir));

    // Later calls reuse the bundle without touching the store
    LoadResult again = loader->ensureReady();
    EXPECT_EQ(again.bundle, result.bundle);
    EXPECT_EQ(store_->downloads.load(), static_cast<int>(requiredArtifacts().size()));
    EXPECT_EQ(factory_.calls->load(), 1);
}

TEST_F(ModelLoaderTest, ConcurrentCallersShareOneLoad) {
    store_->putBundle(kBucket, kPrefix);
    store_->delay = 20ms;
    auto loader = makeLoader();

    const int callers = 8;
    std::vector<std::shared_ptr<const ModelBundle>> bundles(callers);
    std::vector<std::thread> threads;
    for (int i = 0; i < callers; i++) {
        threads.emplace_back([&, i] {
            bundles[i] = loader->ensureReady().bundle;
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(store_->downloads.load(), static_cast<int>(requiredArtifacts().size()));
    EXPECT_EQ(factory_.calls->load(), 1);
    for (const auto& bundle : bundles) {
        ASSERT_NE(bundle, nullptr);
        EXPECT_EQ(bundle, bundles[0]);
    }
}

TEST_F(ModelLoaderTest, ConcurrentCallersShareOneFailure) {
    store_->putBundle(kBucket, kPrefix);
    store_->erase(kBucket, kPrefix + "detector.onnx");
    store_->delay = 20ms;
    auto loader = makeLoader();

    const int callers = 8;
    std::vector<LoadResult> results(callers);
    std::vector<std::thread> threads;
    for (int i = 0; i < callers; i++) {
        threads.emplace_back([&, i] {
            results[i] = loader->ensureReady();
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    // A single fetch that stopped at the missing fourth artifact
    EXPECT_EQ(store_->downloads.load(), 4);
    EXPECT_EQ(factory_.calls->load(), 0);
    ASSERT_TRUE(results[0].error.has_value());
    EXPECT_NE(results[0].error->message.find("detector.onnx"), std::string::npos);
    for (const auto& result : results) {
        ASSERT_FALSE(result);
        ASSERT_TRUE(result.error.has_value());
        EXPECT_EQ(result.error->kind, LoadErrorKind::ArtifactUnavailable);
        EXPECT_EQ(result.error->message, results[0].error->message);
    }
}

TEST_F(ModelLoaderTest, CompleteCacheSkipsDownload) {
    for (const auto& file : requiredArtifacts()) {
        gAI::test::writeFile(fs::path(artifacts_.cacheDir) / file, "cached");
    }
    auto loader = makeLoader();

    ASSERT_TRUE(loader->ensureReady());
    EXPECT_EQ(store_->downloads.load(), 0);
}

TEST_F(ModelLoaderTest, MissingArtifactFailsAndBacksOff) {
    store_->putBundle(kBucket, kPrefix);
    store_->erase(kBucket, kPrefix + "detector.onnx");
    auto loader = makeLoader();

    LoadResult result = loader->ensureReady();
    ASSERT_FALSE(result);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, LoadErrorKind::ArtifactUnavailable);
    EXPECT_EQ(result.error->retryAfter, 1000ms);
    EXPECT_EQ(loader->state(), LoadState::Failed);
    EXPECT_FALSE(loader->health().healthy());
    EXPECT_FALSE(fs::exists(artifacts_.cacheDir));

    // Within the backoff window nothing is retried
    const int downloads = store_->downloads.load();
    clock_.advance(400);
    result = loader->ensureReady();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error->retryAfter, 600ms);
    EXPECT_EQ(store_->downloads.load(), downloads);

    // Once it has passed, the next call loads again
    store_->put(kBucket, kPrefix + "detector.onnx", "detector");
    clock_.advance(600);
    result = loader->ensureReady();
    ASSERT_TRUE(result);
    EXPECT_EQ(loader->state(), LoadState::Ready);
    EXPECT_FALSE(loader->lastError().has_value());
}

TEST_F(ModelLoaderTest, BackoffDoublesUpToTheCap) {
    config_.initialBackoffMs = 1000;
    config_.maxBackoffMs = 3000;
    auto loader = makeLoader();

    std::vector<std::chrono::milliseconds> delays;
    for (int i = 0; i < 4; i++) {
        LoadResult result = loader->ensureReady();
        ASSERT_FALSE(result);
        delays.push_back(result.error->retryAfter);
        clock_.advance(result.error->retryAfter.count());
    }

    EXPECT_EQ(delays, (std::vector<std::chrono::milliseconds>{1000ms, 2000ms, 3000ms, 3000ms}));
}

TEST_F(ModelLoaderTest, CorruptArtifactsAreDiscarded) {
    store_->putBundle(kBucket, kPrefix);
    auto calls = std::make_shared<std::atomic<int>>(0);
    auto loader = std::make_unique<ModelLoader>(
        artifacts_, config_, store_,
        [calls](const std::string&) -> std::shared_ptr<ModelBundle> {
            ++*calls;
            throw ArtifactError("Failed to load detector model");
        },
        clock_.fn());

    LoadResult result = loader->ensureReady();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error->kind, LoadErrorKind::CorruptArtifact);
    EXPECT_NE(result.error->message.find("detector"), std::string::npos);
    EXPECT_EQ(calls->load(), 1);
    EXPECT_FALSE(fs::exists(artifacts_.cacheDir));
}

TEST_F(ModelLoaderTest, SlowLoadTimesOut) {
    store_->putBundle(kBucket, kPrefix);
    store_->delay = 100ms;
    config_.loadTimeoutMs = 50;
    auto loader = makeLoader();

    LoadResult result = loader->ensureReady();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error->kind, LoadErrorKind::Timeout);
    EXPECT_EQ(loader->state(), LoadState::Failed);
}

TEST_F(ModelLoaderTest, HungLoadDoesNotBlockTheNextAttempt) {
    auto gated = std::make_shared<GatedArtifactStore>();
    gated->putBundle(kBucket, kPrefix);
    config_.loadTimeoutMs = 50;
    auto loader = std::make_unique<ModelLoader>(artifacts_, config_, gated, factory_, clock_.fn());
    ReleaseOnExit release(*gated);

    LoadResult first = loader->ensureReady();
    ASSERT_FALSE(first);
    EXPECT_EQ(first.error->kind, LoadErrorKind::Timeout);
    EXPECT_EQ(loader->state(), LoadState::Failed);
    EXPECT_EQ(gated->started.load(), 1);

    // The first download is still stuck, but the backoff alone decides
    clock_.advance(first.error->retryAfter.count());
    LoadResult second = loader->ensureReady(0ms);
    ASSERT_FALSE(second);
    EXPECT_EQ(loader->state(), LoadState::Loading);
    ASSERT_TRUE(gated->waitForStarted(2));

    gated->release();
    for (int i = 0; i < 1000 && loader->state() == LoadState::Loading; i++) {
        std::this_thread::sleep_for(2ms);
    }

    EXPECT_EQ(loader->state(), LoadState::Ready);
    ASSERT_TRUE(loader->ensureReady());
    EXPECT_TRUE(ArtifactStoreClient::isComplete(artifacts_.cacheDir));
    // The abandoned attempt stopped before building a bundle
    EXPECT_EQ(factory_.calls->load(), 1);
}

TEST_F(ModelLoaderTest, FinishedLoadThreadsAreJoined) {
    auto loader = makeLoader();

    for (int i = 0; i < 5; i++) {
        LoadResult result = loader->ensureReady();
        ASSERT_FALSE(result);
        clock_.advance(result.error->retryAfter.count());
    }

    EXPECT_EQ(loader->trackedLoads(), 1u);
}

TEST_F(ModelLoaderTest, CallerWaitLimitLeavesLoadRunning) {
    store_->putBundle(kBucket, kPrefix);
    store_->delay = 40ms;
    auto loader = makeLoader();

    LoadResult early = loader->ensureReady(10ms);
    ASSERT_FALSE(early);
    EXPECT_EQ(early.error->kind, LoadErrorKind::Timeout);
    EXPECT_EQ(loader->state(), LoadState::Loading);

    LoadResult later = loader->ensureReady();
    ASSERT_TRUE(later);
    EXPECT_EQ(factory_.calls->load(), 1);
}

TEST_F(ModelLoaderTest, BackgroundLoadReachesReady) {
    store_->putBundle(kBucket, kPrefix);
    auto loader = makeLoader();

    loader->startBackgroundLoad();
    ASSERT_TRUE(loader->ensureReady());
    EXPECT_EQ(factory_.calls->load(), 1);
    EXPECT_EQ(store_->downloads.load(), static_cast<int>(requiredArtifacts().size()));
}
