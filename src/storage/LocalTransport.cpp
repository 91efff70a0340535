#include "storage/LocalTransport.hpp"
#include "types/FileData.hpp"
#include "types/UserData.hpp"
#include "util/fingerprint.hpp"
#include "logging/LogRegistry.hpp"

#include <fstream>
#include <limits>
#include <ranges>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace vl::storage;
using namespace vl::logging;

namespace fs = std::filesystem;

std::string vl::storage::to_string(const TransportError::Kind kind) {
    switch (kind) {
    case TransportError::Kind::Network: return "network";
    case TransportError::Kind::CredentialExpired: return "credential_expired";
    case TransportError::Kind::SessionInvalid: return "session_invalid";
    case TransportError::Kind::QuotaExceeded: return "quota_exceeded";
    case TransportError::Kind::Rejected: return "rejected";
    }
    return "unknown";
}

LocalTransport::LocalTransport(fs::path root, const uint64_t quotaBytes)
    : root_(std::move(root)), quotaBytes_(quotaBytes) {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) throw std::runtime_error(fmt::format("Failed to create transport root {}: {}", root_.string(), ec.message()));
}

UploadSession LocalTransport::initSession(const types::UserData& user, const types::FileData& file) {
    if (user.userid.empty() || user.sign.empty())
        throw TransportError(TransportError::Kind::CredentialExpired, "Missing or expired upload signature");

    if (file.size == 0)
        throw TransportError(TransportError::Kind::Rejected, fmt::format("Refusing empty file {}", file.filename));

    std::scoped_lock lock(mutex_);

    const auto used = usedBytesLocked();
    if (quotaBytes_ && used + file.size > quotaBytes_)
        throw TransportError(TransportError::Kind::QuotaExceeded,
                             fmt::format("Insufficient remaining space: {} bytes free, {} needed",
                                         quotaBytes_ > used ? quotaBytes_ - used : 0, file.size));

    UploadSession session;
    session.vid = util::md5Hex(fmt::format("{}-{}-{}", file.id, user.userid, ++counter_)).substr(0, 24);
    session.objectKey = session.vid + fs::path(file.filename).extension().string();
    session.remainSpace = quotaBytes_ ? quotaBytes_ - used - file.size : std::numeric_limits<uint64_t>::max();
    session.meta = {{"region", user.region.empty() ? "line1" : user.region}};

    std::ofstream out(partPath(session.vid), std::ios::binary | std::ios::trunc);
    if (!out) throw TransportError(TransportError::Kind::Network, "Failed to create part file for " + session.vid);

    sessions_[session.vid] = file.size;
    LogRegistry::storage()->debug("[LocalTransport] Opened session {} for {} ({} bytes)",
                                  session.vid, file.filename, file.size);
    return session;
}

void LocalTransport::putPart(const UploadSession& session, const uint64_t offset, const std::vector<char>& bytes) {
    {
        std::scoped_lock lock(mutex_);
        if (!sessions_.contains(session.vid))
            throw TransportError(TransportError::Kind::SessionInvalid, "Unknown upload session " + session.vid);
    }

    std::fstream out(partPath(session.vid), std::ios::binary | std::ios::in | std::ios::out);
    if (!out) throw TransportError(TransportError::Kind::Network, "Failed to open part file for " + session.vid);

    out.seekp(static_cast<std::streamoff>(offset));
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!out) throw TransportError(TransportError::Kind::Network,
                                   fmt::format("Short write at offset {} for {}", offset, session.vid));
}

void LocalTransport::complete(const UploadSession& session, const types::FileData& file) {
    std::scoped_lock lock(mutex_);
    if (!sessions_.contains(session.vid))
        throw TransportError(TransportError::Kind::SessionInvalid, "Unknown upload session " + session.vid);

    const auto part = partPath(session.vid);
    std::error_code ec;
    const auto written = fs::file_size(part, ec);
    if (ec) throw TransportError(TransportError::Kind::Network, "Failed to stat part file: " + ec.message());
    if (written != file.size)
        throw TransportError(TransportError::Kind::Rejected,
                             fmt::format("Size mismatch for {}: {} of {} bytes received", session.vid, written, file.size));

    fs::rename(part, root_ / session.objectKey, ec);
    if (ec) throw TransportError(TransportError::Kind::Network, "Failed to finalise object: " + ec.message());

    auto meta = nlohmann::json(file);
    meta["vid"] = session.vid;
    meta["objectKey"] = session.objectKey;
    std::ofstream sidecar(root_ / (session.vid + ".json"), std::ios::trunc);
    sidecar << meta.dump(2);
    if (!sidecar) throw TransportError(TransportError::Kind::Network, "Failed to write metadata for " + session.vid);

    sessions_.erase(session.vid);
    LogRegistry::storage()->info("[LocalTransport] Stored {} as {}", file.filename, session.objectKey);
}

void LocalTransport::abort(const UploadSession& session) {
    std::scoped_lock lock(mutex_);
    if (!sessions_.erase(session.vid)) return;

    std::error_code ec;
    fs::remove(partPath(session.vid), ec);
    if (ec) LogRegistry::storage()->warn("[LocalTransport] Failed to remove part file for {}: {}", session.vid, ec.message());
    LogRegistry::storage()->debug("[LocalTransport] Aborted session {}", session.vid);
}

void LocalTransport::invalidateSessions() {
    std::scoped_lock lock(mutex_);
    for (const auto& vid : sessions_ | std::views::keys) {
        std::error_code ec;
        fs::remove(partPath(vid), ec);
    }
    sessions_.clear();
}

uint64_t LocalTransport::usedBytes() const {
    std::scoped_lock lock(mutex_);
    return usedBytesLocked();
}

fs::path LocalTransport::partPath(const std::string& vid) const {
    return root_ / (vid + ".part");
}

uint64_t LocalTransport::usedBytesLocked() const {
    uint64_t used = 0;
    for (const auto& entry : fs::directory_iterator(root_)) {
        if (!entry.is_regular_file()) continue;
        const auto ext = entry.path().extension();
        if (ext == ".part" || ext == ".json") continue;
        used += entry.file_size();
    }
    for (const auto& reserved : sessions_ | std::views::values) used += reserved;
    return used;
}
