#pragma once

#include "storage/Transport.hpp"

#include <filesystem>
#include <mutex>
#include <unordered_map>

namespace vl::storage {

// Treats a local directory as the object store. Parts land in <vid>.part, the
// finished object is <vid><ext> next to a <vid>.json metadata sidecar.
class LocalTransport final : public Transport {
public:
    explicit LocalTransport(std::filesystem::path root, uint64_t quotaBytes = 0);

    UploadSession initSession(const types::UserData& user, const types::FileData& file) override;
    void putPart(const UploadSession& session, uint64_t offset, const std::vector<char>& bytes) override;
    void complete(const UploadSession& session, const types::FileData& file) override;
    void abort(const UploadSession& session) override;

    // Drops every open session, as a remote would after a restart.
    void invalidateSessions();

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }
    [[nodiscard]] uint64_t usedBytes() const;

private:
    std::filesystem::path root_;
    uint64_t quotaBytes_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, uint64_t> sessions_;   // vid -> reserved bytes
    uint64_t counter_ = 0;

    [[nodiscard]] std::filesystem::path partPath(const std::string& vid) const;
    [[nodiscard]] uint64_t usedBytesLocked() const;
};

}
