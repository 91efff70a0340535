#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace vl::concurrency {

// Fixed set of workers for blocking file and transport I/O.
class ThreadPool {
public:
    using Job = std::function<void()>;

    explicit ThreadPool(unsigned int nThreads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Drops queued jobs, lets running ones finish and joins every worker.
    void stop();

    void submit(Job job);

    [[nodiscard]] unsigned int workerCount() const;

private:
    void spawnWorker();

    std::vector<std::thread> threads_;

    std::condition_variable cv;
    mutable std::mutex mutex;
    std::queue<Job> queue;

    std::atomic<bool> stopFlag{false};
};

}
