#pragma once

#include <azlist/core/cancellation.hpp>
#include <azlist/core/result.hpp>

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace azlist {

// ---------------------------------------------------------------------------
// TaskPool<R>: fixed-size worker pool that folds task results through a
// single collector.
//
//   TaskPool<Page> pool(8, [&](Page p) { pages.push_back(std::move(p)); });
//   pool.Submit([] { return Result<Page, Error>::Ok(...); });
//   auto status = pool.Wait();   // first task error, if any
//
// - At most `parallelism` tasks run at once. Workers are started on
//   Submit(), one per task, so a pool never holds more threads than
//   min(parallelism, submitted tasks).
// - The collector sees every successful result, one at a time, in
//   completion order. It never runs concurrently with itself, so it may
//   touch caller state without further locking.
// - A failing task does not stop its siblings; Wait() reports the first
//   error after everything has finished.
// - Once `cancel` fires, tasks still in the queue are not started and
//   count as Cancelled errors.
// - If a worker thread cannot be started, no further workers are tried and
//   Wait() reports an Internal error. Tasks no worker picks up are dropped.
//
// Submit() and Wait() are called from the owning thread only, and Submit()
// must not be called after Wait().
// ---------------------------------------------------------------------------
template <typename R>
class TaskPool {
public:
    using Task = std::function<Result<R, Error>()>;
    using Collector = std::function<void(R)>;
    // Starts a thread running the given loop. Replaceable for tests.
    using ThreadStarter = std::function<std::thread(std::function<void()>)>;

    TaskPool(size_t parallelism, Collector collector,
             CancellationToken cancel = {},
             ThreadStarter start_thread = nullptr)
        : collector_(std::move(collector)),
          cancel_(std::move(cancel)),
          start_thread_(std::move(start_thread)),
          max_workers_(std::max<size_t>(parallelism, 1)) {}

    ~TaskPool() {
        Shutdown();
    }

    TaskPool(const TaskPool&) = delete;
    TaskPool& operator=(const TaskPool&) = delete;
    TaskPool(TaskPool&&) = delete;
    TaskPool& operator=(TaskPool&&) = delete;

    void Submit(Task task) {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            queue_.push_back(std::move(task));
        }
        ++submitted_;
        if (!start_failed_ && workers_.size() < max_workers_ &&
            workers_.size() < submitted_) {
            StartWorker();
        }
        queue_cv_.notify_one();
    }

    /// Block until every submitted task has finished.
    [[nodiscard]] Result<void, Error> Wait() {
        Shutdown();
        std::lock_guard<std::mutex> lock(collect_mutex_);
        if (first_error_.has_value()) {
            return Result<void, Error>::Err(*first_error_);
        }
        return Result<void, Error>::Ok();
    }

    /// Number of worker threads started so far.
    [[nodiscard]] size_t WorkerCount() const noexcept { return workers_.size(); }

private:
    void StartWorker() {
        try {
            auto loop = [this] { WorkerLoop(); };
            workers_.push_back(start_thread_ ? start_thread_(loop) : std::thread(loop));
        } catch (const std::system_error& e) {
            start_failed_ = true;
            Deliver(Result<R, Error>::Err(MakeError(
                "TaskPool", std::string("Failed to start worker thread: ") + e.what())));
        }
    }

    void Shutdown() {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            closed_ = true;
        }
        queue_cv_.notify_all();
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    void WorkerLoop() {
        for (;;) {
            Task task;
            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                queue_cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
                if (queue_.empty()) {
                    return;
                }
                task = std::move(queue_.front());
                queue_.pop_front();
            }
            Deliver(Run(task));
        }
    }

    Result<R, Error> Run(const Task& task) {
        if (cancel_.IsCancelled()) {
            return Result<R, Error>::Err(
                MakeError("TaskPool", "Operation cancelled", ErrorCategory::Cancelled));
        }
        try {
            return task();
        } catch (const std::exception& e) {
            return Result<R, Error>::Err(
                MakeError("TaskPool", std::string("Task threw: ") + e.what()));
        }
    }

    void Deliver(Result<R, Error> result) {
        std::lock_guard<std::mutex> lock(collect_mutex_);
        if (result.IsErr()) {
            if (!first_error_.has_value()) {
                first_error_ = std::move(result).Error();
            }
            return;
        }
        collector_(std::move(result).Value());
    }

    Collector collector_;
    CancellationToken cancel_;
    ThreadStarter start_thread_;
    size_t max_workers_;
    size_t submitted_ = 0;
    bool start_failed_ = false;

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<Task> queue_;
    bool closed_ = false;

    std::mutex collect_mutex_;
    std::optional<Error> first_error_;

    std::vector<std::thread> workers_;
};

} // namespace azlist
