#include "upload/UploadManager.hpp"
#include "concurrency/ThreadPool.hpp"
#include "types/Status.hpp"
#include "types/UserData.hpp"
#include "logging/LogRegistry.hpp"

#include <boost/asio.hpp>

#include <algorithm>
#include <fstream>
#include <vector>
#include <fmt/core.h>

using namespace vl::upload;
using namespace vl::concurrency;
using namespace vl::types;
using namespace vl::storage;
using namespace vl::events;
using namespace vl::logging;

UploadManager::UploadManager(Deps deps, FileData fileData, const Handlers& handlers)
    : EventEmitter(handlers), deps_(std::move(deps)), fileData_(std::move(fileData)),
      statusCode_(TaskStatus::NOT_STARTED) {
    if (!deps_.workers || !deps_.transport || !deps_.userData)
        throw std::invalid_argument("UploadManager requires workers, a transport and user data");
}

UploadManager::Factory UploadManager::factory(boost::asio::any_io_executor executor,
                                              std::shared_ptr<ThreadPool> workers,
                                              std::shared_ptr<Transport> transport,
                                              config::UploadConfig config) {
    return [executor = std::move(executor), workers = std::move(workers), transport = std::move(transport),
            config = std::move(config)](const FileData& fileData, const std::shared_ptr<UserData>& userData,
                                        const Handlers& handlers) -> std::shared_ptr<UploadTask> {
        return std::make_shared<UploadManager>(Deps{executor, workers, transport, userData, config}, fileData, handlers);
    };
}

double UploadManager::progress() const {
    if (fileData_.size == 0) return statusCode_ == TaskStatus::SUCCEEDED ? 1.0 : 0.0;
    return static_cast<double>(offset_) / static_cast<double>(fileData_.size);
}

nlohmann::json UploadManager::payload() const {
    return filePayload(fileData_.id, fileData_);
}

TaskFuture UploadManager::start() {
    // Resumed before the pending stop took effect: keep going.
    if (run_) {
        stopRequested_ = false;
        return run_->future();
    }

    run_.emplace(deps_.executor);
    ++generation_;
    stopRequested_ = false;
    if (statusCode_ == TaskStatus::CANCELLED) failures_ = 0;
    statusCode_ = TaskStatus::UPLOADING;

    auto future = run_->future();

    LogRegistry::transfer()->info("[UploadManager] Starting {} at offset {} of {}",
                                  fileData_.filename, offset_, fileData_.size);
    emit(EventType::FileStarted, payload());

    try {
        if (!session_) openSession();
        else sendPart();
    } catch (const std::exception& e) {
        LogRegistry::transfer()->error("[UploadManager] Failed to schedule {}: {}", fileData_.filename, e.what());
        run_.reset();
        statusCode_ = TaskStatus::PAUSED;
        throw;
    }

    return future;
}

void UploadManager::stop() {
    if (run_) {
        stopRequested_ = true;
        return;
    }

    // Not running but still admitted somewhere: conclude that admission now.
    if (!resolveListener_) return;

    if (statusCode_ == TaskStatus::UPLOADING) {
        statusCode_ = TaskStatus::PAUSED;
        emit(EventType::FileStopped, payload());
        const auto listener = std::exchange(resolveListener_, nullptr);
        rejectListener_ = nullptr;
        listener(TaskResult{ResultCode::USER_PAUSED, fileData_.id, shared_from_this(), nullptr});
    } else if (statusCode_ == TaskStatus::NOT_STARTED) {
        const auto listener = std::exchange(resolveListener_, nullptr);
        rejectListener_ = nullptr;
        listener(TaskResult{ResultCode::NONE, fileData_.id, shared_from_this(), nullptr});
    }
}

void UploadManager::updateFileData(const FileSetting& setting) {
    fileData_.merge(setting);
}

void UploadManager::markDeleted() {
    UploadTask::markDeleted();
    if (!run_) releaseSession();
}

template <typename Result>
void UploadManager::offload(std::function<Result()> work, std::function<void(Result)> onDone) {
    // Keeps the executor's run() alive while the job is on a worker.
    auto tracked = boost::asio::prefer(deps_.executor, boost::asio::execution::outstanding_work.tracked);

    deps_.workers->submit([self = shared_from_this(), gen = generation_, tracked,
                           work = std::move(work), onDone = std::move(onDone)]() mutable {
        std::optional<Result> result;
        std::exception_ptr error;
        try {
            result = work();
        } catch (...) {
            error = std::current_exception();
        }

        boost::asio::post(tracked, [self, gen, result = std::move(result), error, onDone = std::move(onDone)]() mutable {
            if (!self->run_ || gen != self->generation_) return;
            try {
                if (error) self->handleFailure(error);
                else onDone(std::move(*result));
            } catch (const std::exception& e) {
                LogRegistry::transfer()->error("[UploadManager] {} aborted: {}", self->fileData_.filename, e.what());
                self->rejectRun(std::current_exception());
            }
        });
    });
}

void UploadManager::openSession() {
    auto transport = deps_.transport;
    const auto user = *deps_.userData;
    const auto file = fileData_;

    offload<UploadSession>(
        [transport, user, file] { return transport->initSession(user, file); },
        [this](UploadSession session) {
            LogRegistry::transfer()->debug("[UploadManager] Session {} opened for {}", session.vid, fileData_.filename);
            session_ = std::move(session);
            offset_ = 0;
            if (consumeStop()) return;
            sendPart();
        });
}

void UploadManager::sendPart() {
    const auto length = std::min(deps_.config.partSize(), fileData_.size - offset_);

    offload<uint64_t>(
        [transport = deps_.transport, session = *session_, path = fileData_.path, offset = offset_, length] {
            std::vector<char> bytes(length);
            std::ifstream in(path, std::ios::binary);
            if (!in) throw std::runtime_error(fmt::format("Failed to open {}", path.string()));
            in.seekg(static_cast<std::streamoff>(offset));
            in.read(bytes.data(), static_cast<std::streamsize>(length));
            if (static_cast<uint64_t>(in.gcount()) != length)
                throw std::runtime_error(fmt::format("Short read at offset {} of {}", offset, path.string()));

            transport->putPart(session, offset, bytes);
            return length;
        },
        [this](const uint64_t sent) {
            offset_ += sent;
            failures_ = 0;

            auto progressPayload = payload();
            progressPayload["progress"] = progress();
            emit(EventType::FileProgress, progressPayload);

            if (consumeStop()) return;
            if (offset_ >= fileData_.size) finish();
            else sendPart();
        });
}

void UploadManager::finish() {
    offload<bool>(
        [transport = deps_.transport, session = *session_, file = fileData_] {
            transport->complete(session, file);
            return true;
        },
        [this](bool) {
            fileData_.vid = session_->vid;
            session_.reset();
            statusCode_ = TaskStatus::SUCCEEDED;
            LogRegistry::transfer()->info("[UploadManager] {} uploaded as {}", fileData_.filename, fileData_.vid);
            emit(EventType::FileSucceed, payload());
            settle(ResultCode::SUCCEEDED);
        });
}

void UploadManager::handleFailure(std::exception_ptr error) {
    if (consumeStop()) return;

    try {
        std::rethrow_exception(std::move(error));
    } catch (const TransportError& e) {
        handleTransportError(e);
    } catch (const std::exception& e) {
        fail(e.what());
    }
}

void UploadManager::handleTransportError(const TransportError& e) {
    LogRegistry::transfer()->warn("[UploadManager] {} failed ({}): {}", fileData_.filename, to_string(e.kind()), e.what());

    switch (e.kind()) {
    case TransportError::Kind::QuotaExceeded:
        statusCode_ = TaskStatus::PAUSED;
        settle(ResultCode::QUOTA_EXHAUSTED, errorPayload(ResultCode::QUOTA_EXHAUSTED, e.what(), payload()));
        return;
    case TransportError::Kind::SessionInvalid:
        releaseSession();
        statusCode_ = TaskStatus::PAUSED;
        settle(ResultCode::SESSION_INVALID);
        return;
    case TransportError::Kind::CredentialExpired:
        retryOrFail(ResultCode::CREDENTIAL_EXPIRED, e.what());
        return;
    case TransportError::Kind::Network:
        retryOrFail(ResultCode::TRANSIENT_RETRY, e.what());
        return;
    case TransportError::Kind::Rejected:
        fail(e.what());
        return;
    }
}

void UploadManager::retryOrFail(const int code, const std::string& reason) {
    if (++failures_ > deps_.config.retry_count) {
        fail(fmt::format("Giving up after {} attempts: {}", failures_, reason));
        return;
    }
    // status stays UPLOADING while the retry waits for a slot
    settle(code);
}

void UploadManager::fail(const std::string& reason) {
    statusCode_ = TaskStatus::CANCELLED;
    LogRegistry::transfer()->error("[UploadManager] {} failed: {}", fileData_.filename, reason);
    releaseSession();

    auto failed = payload();
    failed["errData"] = errorPayload(ResultCode::INIT_FAILED, reason);
    emit(EventType::FileFailed, failed);

    settle(ResultCode::INIT_FAILED, errorPayload(ResultCode::INIT_FAILED, reason, payload()));
}

void UploadManager::releaseSession() {
    offset_ = 0;
    if (!session_) return;

    auto session = std::move(*session_);
    session_.reset();

    auto tracked = boost::asio::prefer(deps_.executor, boost::asio::execution::outstanding_work.tracked);
    deps_.workers->submit([transport = deps_.transport, session = std::move(session), tracked] {
        transport->abort(session);
        boost::asio::post(tracked, [vid = session.vid] {
            LogRegistry::transfer()->debug("[UploadManager] Released session {}", vid);
        });
    });
}

bool UploadManager::consumeStop() {
    if (!stopRequested_) return false;
    stopRequested_ = false;
    statusCode_ = TaskStatus::PAUSED;
    LogRegistry::transfer()->info("[UploadManager] {} paused at offset {}", fileData_.filename, offset_);
    emit(EventType::FileStopped, payload());
    settle(ResultCode::USER_PAUSED);
    return true;
}

void UploadManager::settle(const int status, nlohmann::json error) {
    if (!run_) return;

    const auto run = std::move(*run_);
    run_.reset();

    if (isDeleted()) releaseSession();

    const TaskResult result{status, fileData_.id, shared_from_this(), std::move(error)};

    // The run future first, so the pool frees the slot before listeners observe the result.
    run.resolve(result);
    rejectListener_ = nullptr;
    if (const auto listener = std::exchange(resolveListener_, nullptr)) listener(result);
}

void UploadManager::rejectRun(std::exception_ptr error) {
    if (!run_) return;

    const auto run = std::move(*run_);
    run_.reset();
    statusCode_ = TaskStatus::PAUSED;

    run.reject(error);
    resolveListener_ = nullptr;
    if (const auto listener = std::exchange(rejectListener_, nullptr)) listener(error);
}
