#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace gAI {

// Cooperative cancellation flag shared between a request and its inference task.
// A token built over a parent also reports the parent's cancellation, while
// cancelling the child leaves the parent untouched.
class CancellationToken {
public:
    CancellationToken() = default;
    explicit CancellationToken(std::shared_ptr<const CancellationToken> parent)
        : parent_(std::move(parent)) {}

    void cancel() { cancelled_.store(true); }
    bool isCancelled() const {
        return cancelled_.load() || (parent_ && parent_->isCancelled());
    }

private:
    std::shared_ptr<const CancellationToken> parent_;
    std::atomic<bool> cancelled_{false};
};

// Thrown by inference tasks that stop at a checkpoint after cancellation
class CancelledError : public std::runtime_error {
public:
    CancelledError() : std::runtime_error("Request cancelled") {}
};

// Fixed set of worker threads fed from a bounded FIFO. Tasks beyond the queue
// depth are refused instead of queued.
class InferencePool {
public:
    InferencePool(std::size_t workers, std::size_t queueDepth)
        : queueDepth_(queueDepth), stop_(false) {
        if (workers == 0) workers = 1;
        workers_.reserve(workers);
        for (std::size_t i = 0; i < workers; ++i) {
            workers_.emplace_back([this] {
                for (;;) {
                    Task task;
                    {
                        std::unique_lock<std::mutex> lk(m_);
                        cv_.wait(lk, [this] { return stop_ || !q_.empty(); });
                        if (stop_ && q_.empty()) return;
                        task = std::move(q_.front());
                        q_.pop();
                        ++active_;
                    }
                    task();
                    {
                        std::lock_guard<std::mutex> lk(m_);
                        --active_;
                    }
                }
            });
        }
    }

    ~InferencePool() {
        {
            std::lock_guard<std::mutex> lk(m_);
            stop_ = true;
        }
        cv_.notify_all();
        for (auto &t : workers_) if (t.joinable()) t.join();
    }

    InferencePool(const InferencePool&) = delete;
    InferencePool& operator=(const InferencePool&) = delete;

    // Queues the task unless queueDepth tasks are already waiting; returns no
    // future in that case. Exceptions thrown by the task reach the future.
    template<class F>
    auto tryEnqueue(F&& f) -> std::optional<std::future<std::invoke_result_t<F>>> {
        using R = std::invoke_result_t<F>;
        auto p = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
        {
            std::lock_guard<std::mutex> lk(m_);
            if (stop_) throw std::runtime_error("InferencePool stopped");
            if (q_.size() >= queueDepth_) return std::nullopt;
            q_.emplace([p]{ (*p)(); });
        }
        cv_.notify_one();
        return p->get_future();
    }

    std::size_t pending() const {
        std::lock_guard<std::mutex> lk(m_);
        return q_.size();
    }

    std::size_t active() const {
        std::lock_guard<std::mutex> lk(m_);
        return active_;
    }

    std::size_t workerCount() const { return workers_.size(); }

private:
    using Task = std::function<void()>;
    std::vector<std::thread> workers_;
    std::queue<Task> q_;
    mutable std::mutex m_;
    std::condition_variable cv_;
    std::size_t queueDepth_;
    std::size_t active_ = 0;
    bool stop_;
};

} // namespace gAI
