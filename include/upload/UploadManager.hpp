#pragma once

#include "concurrency/Task.hpp"
#include "config/Config.hpp"
#include "events/EventEmitter.hpp"
#include "storage/Transport.hpp"
#include "types/FileData.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <functional>
#include <memory>
#include <optional>

namespace vl::types { struct UserData; }
namespace vl::concurrency { class ThreadPool; }

namespace vl::upload {

// Drives one file through session init, part-by-part transfer and completion.
// Blocking transport calls run on the worker pool; every state change happens
// on the executor.
class UploadManager final : public concurrency::UploadTask,
                            public events::EventEmitter,
                            public std::enable_shared_from_this<UploadManager> {
public:
    struct Deps {
        boost::asio::any_io_executor executor;
        std::shared_ptr<concurrency::ThreadPool> workers;
        std::shared_ptr<storage::Transport> transport;
        std::shared_ptr<types::UserData> userData;     // shared, merged in place by the orchestrator
        config::UploadConfig config;
    };

    using Factory = std::function<std::shared_ptr<concurrency::UploadTask>(
        const types::FileData&, const std::shared_ptr<types::UserData>&, const events::Handlers&)>;

    UploadManager(Deps deps, types::FileData fileData, const events::Handlers& handlers = {});

    // Builds UploadManagers sharing one executor, worker pool and transport.
    static Factory factory(boost::asio::any_io_executor executor,
                           std::shared_ptr<concurrency::ThreadPool> workers,
                           std::shared_ptr<storage::Transport> transport,
                           config::UploadConfig config);

    [[nodiscard]] const std::string& id() const override { return fileData_.id; }
    [[nodiscard]] int statusCode() const override { return statusCode_; }

    concurrency::TaskFuture start() override;
    void stop() override;

    void updateFileData(const types::FileSetting& setting) override;

    // Releases the open session at once when idle, otherwise when the run settles.
    void markDeleted() override;
    [[nodiscard]] const types::FileData& fileData() const override { return fileData_; }

    void onResolve(ResolveListener listener) override { resolveListener_ = std::move(listener); }
    void onReject(RejectListener listener) override { rejectListener_ = std::move(listener); }

    [[nodiscard]] bool isRunning() const { return run_.has_value(); }
    [[nodiscard]] uint64_t offset() const { return offset_; }
    [[nodiscard]] double progress() const;

private:
    Deps deps_;
    types::FileData fileData_;

    int statusCode_;
    bool stopRequested_ = false;
    uint64_t offset_ = 0;
    unsigned int failures_ = 0;
    uint64_t generation_ = 0;

    std::optional<storage::UploadSession> session_;
    std::optional<concurrency::Deferred<concurrency::TaskResult>> run_;

    ResolveListener resolveListener_;
    RejectListener rejectListener_;

    template <typename Result>
    void offload(std::function<Result()> work, std::function<void(Result)> onDone);

    void openSession();
    void sendPart();
    void finish();

    void handleFailure(std::exception_ptr error);
    void handleTransportError(const storage::TransportError& e);
    void retryOrFail(int code, const std::string& reason);
    void fail(const std::string& reason);

    // Aborts the open session on a worker and rewinds to offset 0.
    void releaseSession();

    // Settles the pending stop request, if any. Returns true when it did.
    bool consumeStop();

    void settle(int status, nlohmann::json error = nullptr);
    void rejectRun(std::exception_ptr error);

    [[nodiscard]] nlohmann::json payload() const;
};

}
