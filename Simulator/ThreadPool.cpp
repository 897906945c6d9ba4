#include "ThreadPool.h"
#include "DebugLog.h"
#include "ErrorLogger.h"

#include <string>
#include <exception>

ThreadPool::ThreadPool(size_t numThreads, bool verbose)
    : verbose_(verbose) {
    DEBUG_PRINT("THREADPOOL", "constructor",
        "Creating ThreadPool with " + std::to_string(numThreads) + " worker threads", verbose_);

    for (size_t i = 0; i < numThreads; ++i) {
        workers_.emplace_back([this, i] { workerMain(i); });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::workerMain(size_t index) {
    const std::string who = "Worker " + std::to_string(index);
    DEBUG_PRINT("THREADWORKER", "workerMain", who + " started", verbose_);

    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cond_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

            if (stop_ && tasks_.empty()) break;

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        // A failing game must not take the worker down with it.
        try {
            task();
        } catch (const std::exception& e) {
            ERROR_PRINT("THREADWORKER", "workerMain", who + " task threw: " + std::string(e.what()));
            CitadelCommon::ErrorLogger::instance().log(who + " task threw: " + e.what());
        } catch (...) {
            ERROR_PRINT("THREADWORKER", "workerMain", who + " task threw unknown exception");
            CitadelCommon::ErrorLogger::instance().log(who + " task threw unknown exception");
        }

        std::lock_guard<std::mutex> lock(mutex_);
        ++completed_;
    }

    DEBUG_PRINT("THREADWORKER", "workerMain", who + " exiting", verbose_);
}

void ThreadPool::enqueue(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            WARN_PRINT("THREADPOOL", "enqueue", "Attempted to enqueue task on stopped ThreadPool");
            return;
        }
        tasks_.push(std::move(task));
    }
    cond_.notify_one();
}

void ThreadPool::shutdown() {
    size_t pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) return;
        pending = tasks_.size();
        stop_ = true;
    }

    DEBUG_PRINT("THREADPOOL", "shutdown",
        "Draining " + std::to_string(pending) + " pending task(s) on " +
        std::to_string(workers_.size()) + " worker(s)", verbose_);
    cond_.notify_all();

    for (auto& w : workers_) {
        if (w.joinable()) w.join();
    }
    DEBUG_PRINT("THREADPOOL", "shutdown",
        "ThreadPool shutdown completed after " + std::to_string(completedTasks()) + " task(s)", verbose_);
}

size_t ThreadPool::completedTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_;
}
