#pragma once

#include "concurrency/Task.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <deque>
#include <functional>
#include <memory>
#include <string>

namespace vl::concurrency {

// Bounded executor over UploadTasks. At most limit() tasks run at once; the
// rest wait in FIFO order. Must be driven from a single executor.
class Pool : public std::enable_shared_from_this<Pool> {
public:
    using RunFn = std::function<TaskFuture(const std::shared_ptr<UploadTask>&)>;

    static std::shared_ptr<Pool> create(boost::asio::any_io_executor executor, unsigned int limit, RunFn run = {});

    // Appends the task to the waiting list and returns a future for this
    // admission. The future also settles when the task concludes on its own.
    TaskFuture enqueue(const std::shared_ptr<UploadTask>& task);

    // Takes from the running list first, then the waiting list. Does not admit.
    // Throws std::out_of_range when both are empty.
    std::shared_ptr<UploadTask> dequeue();

    // Removing a running task frees its slot. Returns nullptr if not present.
    std::shared_ptr<UploadTask> remove(const std::string& id);

    [[nodiscard]] bool contains(const std::string& id) const;
    [[nodiscard]] size_t size() const { return waitingList_.size() + processingList_.size(); }
    [[nodiscard]] size_t runningCount() const { return processingList_.size(); }
    [[nodiscard]] size_t waitingCount() const { return waitingList_.size(); }
    [[nodiscard]] unsigned int limit() const { return limit_; }

private:
    struct Item {
        std::string id;
        std::shared_ptr<UploadTask> task;
        Deferred<TaskResult> deferred;
    };

    using ItemPtr = std::shared_ptr<Item>;
    using List = std::deque<ItemPtr>;

    Pool(boost::asio::any_io_executor executor, unsigned int limit, RunFn run);

    boost::asio::any_io_executor executor_;
    unsigned int limit_;
    RunFn runTask_;
    List waitingList_, processingList_;

    // Admits as many waiting items as free slots allow.
    void check();
    void run(const ItemPtr& item);

    ItemPtr removeItem(const std::string& id, List& list);
    bool removeProcessing(const ItemPtr& item);
};

}
