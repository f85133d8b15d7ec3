#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include "gAI/ArtifactStore.hpp"
#include "gAI/GenderClassifier.hpp"
#include "gAI/ModelBundle.hpp"
#include "gAI/PersonDetector.hpp"

namespace gAI {
namespace test {

// Scratch directory removed when the fixture goes away
class TempDir {
public:
    TempDir() {
        static std::atomic<unsigned> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("genderai-test-" + std::to_string(::getpid()) + "-" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }
    std::string str(const std::string& child = "") const {
        return child.empty() ? path_.string() : (path_ / child).string();
    }

private:
    std::filesystem::path path_;
};

inline void writeFile(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

inline std::vector<unsigned char> encodeImage(int width, int height, const std::string& ext = ".png") {
    cv::Mat image(height, width, CV_8UC3, cv::Scalar(90, 120, 200));
    std::vector<unsigned char> bytes;
    cv::imencode(ext, image, bytes);
    return bytes;
}

inline Detection person(int x, int y, int w, int h, float score, const std::string& label = "person") {
    return Detection{cv::Rect(x, y, w, h), score, 1, label};
}

// Detector whose detections are chosen per image by a callback
class FakeDetector : public PersonDetector {
public:
    using Rule = std::function<std::vector<Detection>(const cv::Mat&)>;

    explicit FakeDetector(Rule rule) : rule_(std::move(rule)) {}

    std::vector<Detection> detect(const cv::Mat& image) override {
        ++calls;
        return rule_(image);
    }

    std::atomic<int> calls{0};

private:
    Rule rule_;
};

class FakeClassifier : public GenderClassifier {
public:
    FakeClassifier(float male, float female) : male_(male), female_(female) {}

    ClassificationOutcome classify(const cv::Mat&) override {
        ++calls;
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        return makeClassification({male_, female_}, {"male", "female"});
    }

    std::atomic<int> calls{0};
    std::chrono::milliseconds delay{0};

private:
    float male_;
    float female_;
};

// Object store backed by a map of key to content. Records every download.
class MemoryArtifactStore : public ArtifactStore {
public:
    std::optional<FetchError> download(const std::string& bucket,
                                       const std::string& key,
                                       const std::string& localPath) override {
        ++downloads;
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = objects_.find(bucket + "/" + key);
        if (it == objects_.end()) {
            return FetchError{FetchErrorKind::MissingFile, key, "Object not found: " + key};
        }
        writeFile(localPath, it->second);
        return std::nullopt;
    }

    void put(const std::string& bucket, const std::string& key, const std::string& content) {
        std::lock_guard<std::mutex> lock(mutex_);
        objects_[bucket + "/" + key] = content;
    }

    void erase(const std::string& bucket, const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        objects_.erase(bucket + "/" + key);
    }

    // Stores every required artifact under bucket/prefix
    void putBundle(const std::string& bucket, const std::string& prefix) {
        for (const auto& file : requiredArtifacts()) {
            put(bucket, prefix + file, "contents of " + file);
        }
    }

    std::atomic<int> downloads{0};
    std::chrono::milliseconds delay{0};

private:
    std::mutex mutex_;
    std::map<std::string, std::string> objects_;
};

// Memory store whose downloads block until release() is called
class GatedArtifactStore : public MemoryArtifactStore {
public:
    std::optional<FetchError> download(const std::string& bucket,
                                       const std::string& key,
                                       const std::string& localPath) override {
        ++started;
        {
            std::unique_lock<std::mutex> lock(gateMutex_);
            gateCv_.wait(lock, [this] { return open_; });
        }
        return MemoryArtifactStore::download(bucket, key, localPath);
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(gateMutex_);
            open_ = true;
        }
        gateCv_.notify_all();
    }

    // Polls until at least count downloads have started
    bool waitForStarted(int count, std::chrono::milliseconds limit = std::chrono::milliseconds(2000)) const {
        auto until = std::chrono::steady_clock::now() + limit;
        while (started.load() < count) {
            if (std::chrono::steady_clock::now() > until) return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        return true;
    }

    std::atomic<int> started{0};

private:
    std::mutex gateMutex_;
    std::condition_variable gateCv_;
    bool open_ = false;
};

// Opens a gated store when it goes out of scope
class ReleaseOnExit {
public:
    explicit ReleaseOnExit(GatedArtifactStore& store) : store_(store) {}
    ~ReleaseOnExit() { store_.release(); }

private:
    GatedArtifactStore& store_;
};

// Factory that hands out bundles built around the given fakes
struct FakeBundleFactory {
    std::shared_ptr<PersonDetector> detector;
    std::shared_ptr<GenderClassifier> classifier;
    std::shared_ptr<std::atomic<int>> calls = std::make_shared<std::atomic<int>>(0);

    std::shared_ptr<ModelBundle> operator()(const std::string&) const {
        ++*calls;
        auto bundle = std::make_shared<ModelBundle>();
        bundle->detector = detector;
        bundle->classifier = classifier;
        bundle->preprocessor = std::make_shared<PreprocessorConfig>();
        return bundle;
    }
};

// Clock under test control, in whole milliseconds
class ManualClock {
public:
    std::chrono::steady_clock::time_point now() const {
        return std::chrono::steady_clock::time_point(std::chrono::milliseconds(ms_->load()));
    }

    void advance(long ms) { *ms_ += ms; }

    std::function<std::chrono::steady_clock::time_point()> fn() const {
        auto ms = ms_;
        return [ms] { return std::chrono::steady_clock::time_point(std::chrono::milliseconds(ms->load())); };
    }

private:
    std::shared_ptr<std::atomic<long>> ms_ = std::make_shared<std::atomic<long>>(1000000);
};

} // namespace test
} // namespace gAI
