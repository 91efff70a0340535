#pragma once

#include "concurrency/Pool.hpp"
#include "concurrency/Queue.hpp"
#include "concurrency/Task.hpp"
#include "config/Config.hpp"
#include "events/EventEmitter.hpp"
#include "types/FileData.hpp"
#include "types/UserData.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <functional>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace vl::upload {

// Tracks a collection of uploads: which are waiting, which are admitted to the
// pool, and when a started batch has fully finished. Every public method must
// be called from the executor the orchestrator was created with.
class Orchestrator : public events::EventEmitter, public std::enable_shared_from_this<Orchestrator> {
public:
    enum class Mode { NotStarted, Uploading };

    using TaskQueue = concurrency::Queue<concurrency::UploadTask>;
    using TaskFactory = std::function<std::shared_ptr<concurrency::UploadTask>(
        const types::FileData&, const std::shared_ptr<types::UserData>&, const events::Handlers&)>;
    using FileDataBuilder = std::function<types::FileData(
        const types::FileSource&, const types::FileSetting&, const types::UserData&)>;
    using TypePredicate = std::function<bool(const types::FileData&)>;

    struct Options {
        config::UploadConfig config;
        TaskFactory taskFactory;
        FileDataBuilder fileDataBuilder;    // defaults to types::generateFileData
        TypePredicate acceptType;           // defaults to config.accepted_mime_types
        events::Handlers events;            // Error, UploadComplete
        concurrency::Pool::RunFn runTask;   // defaults to task->start()
        std::shared_ptr<types::UserData> userData;
    };

    static std::shared_ptr<Orchestrator> create(boost::asio::any_io_executor executor, Options options);

    // Throws DuplicateTaskError or UnacceptableTypeError after emitting Error.
    std::shared_ptr<concurrency::UploadTask> addFile(const types::FileSource& file,
                                                     const events::Handlers& events = {},
                                                     const types::FileSetting& setting = {});

    void removeFile(const std::string& id);
    void resumeFile(const std::string& id);
    void stopFile(const std::string& id);

    void startAll();
    void stopAll();
    void clearAll();

    // Only while the task waits and has never started; otherwise emits Error
    // and throws FileLockedError without touching the task.
    void updateFileData(const std::string& id, const types::FileSetting& setting);

    // Merged in place: every task holding the credentials sees the update.
    void updateUserData(const types::UserData& userData);

    [[nodiscard]] std::vector<types::FileData> files() const;

    // Nothing moves without a caller: either the batch has closed, or every
    // task left in the pool holds its slot after a rejected run.
    [[nodiscard]] bool isIdle() const;

    [[nodiscard]] Mode mode() const { return mode_; }
    [[nodiscard]] const TaskQueue& fileQueue() const { return fileQueue_; }
    [[nodiscard]] const TaskQueue& waitQueue() const { return waitQueue_; }
    [[nodiscard]] const concurrency::Pool& uploadPool() const { return *uploadPool_; }
    [[nodiscard]] const std::shared_ptr<types::UserData>& userData() const { return userData_; }
    [[nodiscard]] const config::UploadConfig& config() const { return options_.config; }

private:
    Orchestrator(boost::asio::any_io_executor executor, Options options);

    boost::asio::any_io_executor executor_;
    Options options_;

    TaskQueue fileQueue_;
    TaskQueue waitQueue_;
    std::shared_ptr<concurrency::Pool> uploadPool_;
    std::shared_ptr<types::UserData> userData_;

    struct PendingFuture {
        std::string taskId;
        concurrency::TaskFuture future;
    };

    // Futures handed out by the pool that no completion watch has taken yet.
    std::vector<PendingFuture> pendingFutures_;

    // Pooled tasks whose last run was rejected.
    std::unordered_set<std::string> stalled_;
    Mode mode_ = Mode::NotStarted;

    void submit(const std::shared_ptr<concurrency::UploadTask>& task);
    void stopAll(bool deleteTasks);

    // One drain step: take the pending futures, dispatch each result as it
    // arrives, and once all have settled either drain again or close the batch.
    void watchCompletion();
    void onBatchSettled();

    void handleStatusChange(const concurrency::TaskResult& result);
    void requeueFront(const std::shared_ptr<concurrency::UploadTask>& task);
    [[nodiscard]] bool isTracked(const std::shared_ptr<concurrency::UploadTask>& task) const;

    void emitError(const nlohmann::json& error) const;
    void emitTaskFailure(const std::string& taskId, std::exception_ptr error) const;
};

}
