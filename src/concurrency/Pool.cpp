#include "concurrency/Pool.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <stdexcept>

using namespace vl::concurrency;
using namespace vl::logging;

std::shared_ptr<Pool> Pool::create(boost::asio::any_io_executor executor, const unsigned int limit, RunFn run) {
    return std::shared_ptr<Pool>(new Pool(std::move(executor), limit, std::move(run)));
}

Pool::Pool(boost::asio::any_io_executor executor, const unsigned int limit, RunFn run)
    : executor_(std::move(executor)), limit_(std::max(1u, limit)), runTask_(std::move(run)) {
    if (!runTask_) runTask_ = [](const std::shared_ptr<UploadTask>& task) { return task->start(); };
}

TaskFuture Pool::enqueue(const std::shared_ptr<UploadTask>& task) {
    if (!task) throw std::invalid_argument("Pool::enqueue requires a task");

    auto item = std::make_shared<Item>(Item{task->id(), task, Deferred<TaskResult>(executor_)});

    task->onReject([d = item->deferred](std::exception_ptr e) { d.reject(std::move(e)); });
    task->onResolve([d = item->deferred](const TaskResult& r) { d.resolve(r); });

    waitingList_.push_back(item);
    LogRegistry::pool()->debug("[Pool] Enqueued {} ({} running, {} waiting)",
                               item->id, processingList_.size(), waitingList_.size());
    check();

    return item->deferred.future();
}

std::shared_ptr<UploadTask> Pool::dequeue() {
    List& list = !processingList_.empty() ? processingList_ : waitingList_;
    if (list.empty()) throw std::out_of_range("Pool::dequeue on empty pool");

    auto item = std::move(list.front());
    list.pop_front();
    return item->task;
}

std::shared_ptr<UploadTask> Pool::remove(const std::string& id) {
    auto item = removeItem(id, processingList_);
    if (item) check();
    else item = removeItem(id, waitingList_);
    return item ? item->task : nullptr;
}

bool Pool::contains(const std::string& id) const {
    const auto matches = [&](const ItemPtr& item) { return item->id == id; };
    return std::ranges::any_of(processingList_, matches) || std::ranges::any_of(waitingList_, matches);
}

Pool::ItemPtr Pool::removeItem(const std::string& id, List& list) {
    const auto it = std::ranges::find_if(list, [&](const ItemPtr& item) { return item->id == id; });
    if (it == list.end()) return nullptr;
    auto item = *it;
    list.erase(it);
    return item;
}

bool Pool::removeProcessing(const ItemPtr& item) {
    const auto it = std::ranges::find(processingList_, item);
    if (it == processingList_.end()) return false;
    processingList_.erase(it);
    return true;
}

void Pool::check() {
    const auto available = processingList_.size() < limit_ ? limit_ - processingList_.size() : 0;
    const auto n = std::min<size_t>(available, waitingList_.size());
    if (n == 0) return;

    const List admitted(waitingList_.begin(), waitingList_.begin() + static_cast<std::ptrdiff_t>(n));
    waitingList_.erase(waitingList_.begin(), waitingList_.begin() + static_cast<std::ptrdiff_t>(n));

    processingList_.insert(processingList_.end(), admitted.begin(), admitted.end());

    // start() may call back into the pool, so skip anything removed meanwhile
    for (const auto& item : admitted) {
        if (std::ranges::find(processingList_, item) == processingList_.end()) continue;
        LogRegistry::pool()->debug("[Pool] Admitted {} ({}/{} slots used)", item->id, processingList_.size(), limit_);
        run(item);
    }
}

void Pool::run(const ItemPtr& item) {
    TaskFuture future;
    try {
        future = runTask_(item->task);
    } catch (const std::exception& e) {
        LogRegistry::pool()->error("[Pool] Task {} failed to start: {}", item->id, e.what());
        future = makeRejected<TaskResult>(executor_, std::current_exception());
    }

    future.then(
        [self = shared_from_this(), item](const TaskResult& result) {
            self->removeProcessing(item);
            item->deferred.resolve(result);
            self->check();
        },
        [self = shared_from_this(), item](std::exception_ptr error) {
            // A failed run keeps its slot until the task is removed explicitly.
            item->deferred.reject(std::move(error));
            self->check();
        });
}
