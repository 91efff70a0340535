#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace vl::types {
struct UserData;
struct FileData;
}

namespace vl::storage {

struct UploadSession {
    std::string vid;
    std::string objectKey;
    uint64_t remainSpace{};
    nlohmann::json meta = nlohmann::json::object();
};

class TransportError : public std::runtime_error {
public:
    enum class Kind { Network, CredentialExpired, SessionInvalid, QuotaExceeded, Rejected };

    TransportError(const Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] Kind kind() const { return kind_; }

private:
    Kind kind_;
};

std::string to_string(TransportError::Kind kind);

// Remote side of an upload. Every call blocks and may be made from any worker
// thread; failures are reported as TransportError.
class Transport {
public:
    virtual ~Transport() = default;

    virtual UploadSession initSession(const types::UserData& user, const types::FileData& file) = 0;
    virtual void putPart(const UploadSession& session, uint64_t offset, const std::vector<char>& bytes) = 0;
    virtual void complete(const UploadSession& session, const types::FileData& file) = 0;

    // Gives up an unfinished session: its reservation and received parts are
    // discarded. Unknown sessions are ignored.
    virtual void abort(const UploadSession& session) = 0;
};

}
