#pragma once
#include <vector>
#include <thread>
#include <atomic>
#include <queue>
#include <functional>
#include <condition_variable>
#include <mutex>

namespace TickLoop {

class ThreadPool {
public:
    explicit ThreadPool(size_t numThreads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Queue a task; returns false once the pool is shutting down
    bool submit(std::function<void()> task);

    size_t getPendingTasks() const;
    size_t getWorkerCount() const { return workers.size(); }

    // Stop accepting tasks, run what is already queued, join the workers
    void shutdown();

private:
    void workerLoop();

    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;
    mutable std::mutex queueMutex;  // mutable for const getPendingTasks
    std::condition_variable condition;
    std::atomic<bool> isRunning;
};

} // namespace TickLoop
