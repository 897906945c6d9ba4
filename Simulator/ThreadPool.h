#pragma once
#include <vector>
#include <thread>
#include <queue>
#include <functional>
#include <mutex>
#include <condition_variable>

// Fixed-size worker pool. Competition games are enqueued here; shutdown()
// drains the queue before joining.
class ThreadPool {
public:
    ThreadPool(size_t numThreads, bool verbose);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void enqueue(std::function<void()> task);

    // Stop accepting tasks, run everything pending, join workers
    void shutdown();

    size_t size() const { return workers_.size(); }
    size_t completedTasks() const;

private:
    void workerMain(size_t index);

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cond_;
    bool stop_ = false;
    bool verbose_ = false;
    size_t completed_ = 0;
};
