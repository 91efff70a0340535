#include "concurrency/ThreadPool.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <stdexcept>

using namespace vl::concurrency;
using namespace vl::logging;

ThreadPool::ThreadPool(const unsigned int nThreads) {
    for (unsigned int i = 0; i < std::max(1u, nThreads); ++i) spawnWorker();
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::stop() {
    {
        std::scoped_lock lock(mutex);
        std::queue<Job> empty;
        std::swap(queue, empty);
    }

    stopFlag.store(true);
    cv.notify_all();

    for (auto& t : threads_)
        if (t.joinable()) t.join();

    threads_.clear();
}

void ThreadPool::submit(Job job) {
    if (stopFlag.load()) throw std::runtime_error("ThreadPool::submit after stop()");
    {
        std::scoped_lock lock(mutex);
        queue.push(std::move(job));
    }
    cv.notify_one();
}

unsigned int ThreadPool::workerCount() const {
    return static_cast<unsigned int>(threads_.size());
}

void ThreadPool::spawnWorker() {
    threads_.emplace_back([this] {
        while (true) {
            Job job; {
                std::unique_lock lock(mutex);
                cv.wait(lock, [this] {
                    return stopFlag.load() || !queue.empty();
                });

                if (stopFlag.load() && queue.empty()) break;

                job = std::move(queue.front());
                queue.pop();
            }

            if (!job) continue;
            try {
                job();
            } catch (const std::exception& e) {
                LogRegistry::vidlift()->error("[ThreadPool] Job threw: {}", e.what());
            }
        }
    });
}
