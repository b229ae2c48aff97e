#include <tickloop/core/utils/thread_pool.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

using namespace TickLoop;

ThreadPool::ThreadPool(size_t numThreads) : isRunning(true) {
    if (numThreads == 0) {
        throw std::invalid_argument("ThreadPool requires at least one worker");
    }
    workers.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
        workers.emplace_back(&ThreadPool::workerLoop, this);
    }
    spdlog::info("[ThreadPool] Started {} workers", numThreads);
}

ThreadPool::~ThreadPool() {
    shutdown();
}

bool ThreadPool::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        if (!isRunning.load(std::memory_order_acquire)) {
            return false;
        }
        tasks.push(std::move(task));
    }
    condition.notify_one();
    return true;
}

size_t ThreadPool::getPendingTasks() const {
    std::lock_guard<std::mutex> lock(queueMutex);
    return tasks.size();
}

void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        if (!isRunning.exchange(false, std::memory_order_acq_rel)) {
            return;
        }
    }
    condition.notify_all();
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    spdlog::info("[ThreadPool] All workers joined");
}

void ThreadPool::workerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queueMutex);
            condition.wait(lock, [this] {
                return !tasks.empty() || !isRunning.load(std::memory_order_acquire);
            });
            // Queued work still runs after shutdown() is requested
            if (tasks.empty()) {
                return;
            }
            task = std::move(tasks.front());
            tasks.pop();
        }
        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("[ThreadPool] Task threw exception: {}", e.what());
        } catch (...) {
            spdlog::error("[ThreadPool] Task threw a non-standard exception");
        }
    }
}
