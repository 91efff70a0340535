#pragma once

#include "concurrency/Deferred.hpp"

#include <functional>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace vl::types {
struct FileData;
struct FileSetting;
}

namespace vl::concurrency {

struct UploadTask;

// Outcome of one run of a task. status 0 carries no status change.
struct TaskResult {
    int status = 0;
    std::string taskId;
    std::shared_ptr<UploadTask> task;
    nlohmann::json error;   // {code, message, data} when the outcome is reportable
};

using TaskFuture = Future<TaskResult>;

// Capability set the pool and the orchestrator rely on. Implementations report
// through statusCode() and the result of start().
struct UploadTask {
    using ResolveListener = std::function<void(const TaskResult&)>;
    using RejectListener = std::function<void(std::exception_ptr)>;

    virtual ~UploadTask() = default;

    [[nodiscard]] virtual const std::string& id() const = 0;
    [[nodiscard]] virtual int statusCode() const = 0;

    virtual TaskFuture start() = 0;

    // Cooperative: the running start() settles at its next suspension point.
    virtual void stop() = 0;

    virtual void updateFileData(const types::FileSetting& setting) = 0;
    [[nodiscard]] virtual const types::FileData& fileData() const = 0;

    // A single listener of each kind; registering replaces the previous one.
    // Each fires at most once when the task concludes.
    virtual void onResolve(ResolveListener listener) = 0;
    virtual void onReject(RejectListener listener) = 0;

    virtual void markDeleted() { deleted_ = true; }
    [[nodiscard]] bool isDeleted() const { return deleted_; }

private:
    bool deleted_ = false;
};

}
