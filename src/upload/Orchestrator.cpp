#include "upload/Orchestrator.hpp"
#include "types/Status.hpp"
#include "types/UploadError.hpp"
#include "util/mime.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

using namespace vl::upload;
using namespace vl::concurrency;
using namespace vl::types;
using namespace vl::events;
using namespace vl::logging;

std::shared_ptr<Orchestrator> Orchestrator::create(boost::asio::any_io_executor executor, Options options) {
    return std::shared_ptr<Orchestrator>(new Orchestrator(std::move(executor), std::move(options)));
}

Orchestrator::Orchestrator(boost::asio::any_io_executor executor, Options options)
    : EventEmitter(options.events), executor_(std::move(executor)), options_(std::move(options)) {
    if (!options_.taskFactory) throw std::invalid_argument("Orchestrator requires a task factory");

    if (!options_.fileDataBuilder) options_.fileDataBuilder = generateFileData;
    if (!options_.acceptType)
        options_.acceptType = [accepted = options_.config.accepted_mime_types](const FileData& f) {
            return util::isAcceptedMimeType(f.mime, accepted);
        };

    userData_ = options_.userData ? options_.userData : std::make_shared<UserData>();
    uploadPool_ = Pool::create(executor_, options_.config.parallelFileLimit(), options_.runTask);

    LogRegistry::orchestrator()->debug("[Orchestrator] Ready with {} parallel uploads", uploadPool_->limit());
}

std::shared_ptr<UploadTask> Orchestrator::addFile(const FileSource& file, const Handlers& events,
                                                  const FileSetting& setting) {
    const auto fileData = options_.fileDataBuilder(file, setting, *userData_);

    if (fileQueue_.contains(fileData.id)) {
        const DuplicateTaskError err(nlohmann::json{{"filename", fileData.title}, {"taskId", fileData.id}});
        emitError(err.toJson());
        throw err;
    }

    if (!options_.acceptType(fileData)) {
        const UnacceptableTypeError err(nlohmann::json{{"filename", fileData.title}, {"mime", fileData.mime}});
        emitError(err.toJson());
        throw err;
    }

    auto task = options_.taskFactory(fileData, userData_, events);
    if (!task) throw std::runtime_error("Task factory returned no task for " + fileData.title);

    fileQueue_.enqueue(task);
    if (mode_ == Mode::NotStarted) waitQueue_.enqueue(task);
    else submit(task);

    LogRegistry::orchestrator()->info("[Orchestrator] Added {} as {}", fileData.title, task->id());
    return task;
}

void Orchestrator::removeFile(const std::string& id) {
    stalled_.erase(id);
    if (const auto task = uploadPool_->remove(id)) {
        task->markDeleted();
        task->stop();
    } else if (const auto waiting = waitQueue_.remove(id)) {
        waiting->markDeleted();
    }

    if (const auto tracked = fileQueue_.remove(id)) {
        tracked->markDeleted();
        LogRegistry::orchestrator()->info("[Orchestrator] Removed {}", id);
    }
}

void Orchestrator::resumeFile(const std::string& id) {
    const auto task = waitQueue_.remove(id);
    if (!task) return;

    submit(task);
    if (mode_ == Mode::NotStarted) watchCompletion();
}

void Orchestrator::stopFile(const std::string& id) {
    const auto task = uploadPool_->remove(id);
    if (!task) return;

    task->stop();
    waitQueue_.enqueue(task);
}

void Orchestrator::startAll() {
    while (!waitQueue_.empty()) {
        const auto task = waitQueue_.dequeue();
        if (task->statusCode() != TaskStatus::CANCELLED) submit(task);
    }

    mode_ = Mode::Uploading;
    LogRegistry::orchestrator()->info("[Orchestrator] Started, {} in pool", uploadPool_->size());
    watchCompletion();
}

void Orchestrator::stopAll() {
    stopAll(false);
}

void Orchestrator::clearAll() {
    stopAll(true);

    for (const auto& task : fileQueue_.list()) task->markDeleted();
    waitQueue_.clear();
    fileQueue_.clear();
}

void Orchestrator::stopAll(const bool deleteTasks) {
    while (uploadPool_->size() > 0) {
        const auto task = uploadPool_->dequeue();
        if (deleteTasks) task->markDeleted();
        task->stop();

        // never-started tasks go back in their original order
        if (task->statusCode() == TaskStatus::NOT_STARTED) waitQueue_.enqueue(task);
    }

    stalled_.clear();
    mode_ = Mode::NotStarted;
}

void Orchestrator::updateFileData(const std::string& id, const FileSetting& setting) {
    const auto task = waitQueue_.find(id);
    if (!task || task->statusCode() != TaskStatus::NOT_STARTED) {
        const FileLockedError err(nlohmann::json{{"taskId", id}});
        emitError(err.toJson());
        throw err;
    }

    task->updateFileData(setting);
}

void Orchestrator::updateUserData(const UserData& userData) {
    userData_->merge(userData);
}

std::vector<FileData> Orchestrator::files() const {
    std::vector<FileData> out;
    out.reserve(fileQueue_.size());
    for (const auto& task : fileQueue_.list()) out.push_back(task->fileData());
    return out;
}

bool Orchestrator::isIdle() const {
    if (uploadPool_->size() == 0) return mode_ == Mode::NotStarted;
    const auto held = std::ranges::count_if(stalled_, [this](const std::string& id) { return uploadPool_->contains(id); });
    return static_cast<size_t>(held) == uploadPool_->size();
}

void Orchestrator::submit(const std::shared_ptr<UploadTask>& task) {
    stalled_.erase(task->id());
    pendingFutures_.push_back({task->id(), uploadPool_->enqueue(task)});
}

void Orchestrator::watchCompletion() {
    const auto snapshot = std::exchange(pendingFutures_, {});

    std::vector<TaskFuture> futures;
    futures.reserve(snapshot.size());

    for (const auto& [taskId, future] : snapshot) {
        futures.push_back(future);
        future.then(
            [self = shared_from_this(), taskId](const TaskResult& result) {
                if (result.status == ResultCode::NONE) return;
                try {
                    self->handleStatusChange(result);
                } catch (const std::exception&) {
                    self->emitTaskFailure(taskId, std::current_exception());
                }
            },
            [self = shared_from_this(), taskId](std::exception_ptr error) {
                self->stalled_.insert(taskId);
                self->emitTaskFailure(taskId, std::move(error));
            });
    }

    // Runs from a posted handler, so a repeated drain never nests on the stack.
    whenAllSettled(executor_, futures, [self = shared_from_this()] { self->onBatchSettled(); });
}

void Orchestrator::onBatchSettled() {
    if (!pendingFutures_.empty()) {
        watchCompletion();
        return;
    }

    if (uploadPool_->size() != 0) return;
    mode_ = Mode::NotStarted;

    if (waitQueue_.empty() && !fileQueue_.empty()) {
        LogRegistry::orchestrator()->info("[Orchestrator] All {} files finished", fileQueue_.size());
        emit(EventType::UploadComplete);
    }
}

void Orchestrator::handleStatusChange(const TaskResult& result) {
    const auto task = result.task ? result.task : fileQueue_.find(result.taskId);

    LogRegistry::orchestrator()->debug("[Orchestrator] {} settled with {}", result.taskId, result.status);

    switch (result.status) {
    case ResultCode::SUCCEEDED:
        waitQueue_.remove(result.taskId);
        break;
    case ResultCode::QUOTA_EXHAUSTED:
        if (task && isTracked(task)) requeueFront(task);
        emitError(result.error.is_object() && result.error.contains("code")
                      ? result.error
                      : errorPayload(ResultCode::QUOTA_EXHAUSTED, "Insufficient remaining space",
                                     {{"taskId", result.taskId}}));
        break;
    case ResultCode::INIT_FAILED:
    case ResultCode::USER_PAUSED:
    case ResultCode::SESSION_INVALID:
        if (task && !task->isDeleted() && isTracked(task)) requeueFront(task);
        break;
    case ResultCode::CREDENTIAL_EXPIRED:
    case ResultCode::TRANSIENT_RETRY:
        if (!task || task->isDeleted() || !isTracked(task) || uploadPool_->contains(task->id())) break;
        waitQueue_.remove(task->id());
        submit(task);
        if (mode_ == Mode::NotStarted) watchCompletion();
        break;
    default:
        break;
    }
}

void Orchestrator::requeueFront(const std::shared_ptr<UploadTask>& task) {
    // Resumed again before this result arrived.
    if (uploadPool_->contains(task->id())) return;

    waitQueue_.remove(task->id());
    waitQueue_.unshift(task);
}

bool Orchestrator::isTracked(const std::shared_ptr<UploadTask>& task) const {
    return fileQueue_.find(task->id()) == task;
}

void Orchestrator::emitError(const nlohmann::json& error) const {
    LogRegistry::orchestrator()->warn("[Orchestrator] Error {}: {}", error.value("code", 0),
                                      error.value("message", std::string{}));
    emit(EventType::Error, error);
}

void Orchestrator::emitTaskFailure(const std::string& taskId, std::exception_ptr error) const {
    std::string message = "Unknown failure";
    try {
        std::rethrow_exception(std::move(error));
    } catch (const UploadError& e) {
        emitError(e.toJson());
        return;
    } catch (const std::exception& e) {
        message = e.what();
    } catch (...) {
        message = "Non-standard exception";
    }

    emitError(errorPayload(ResultCode::TASK_FAILED, message, {{"taskId", taskId}}));
}
