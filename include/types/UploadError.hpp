#pragma once

#include "types/Status.hpp"

#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace vl::types {

class UploadError : public std::runtime_error {
public:
    UploadError(const int code, const std::string& message, nlohmann::json data = nlohmann::json::object())
        : std::runtime_error(message), code_(code), data_(std::move(data)) {}

    [[nodiscard]] int code() const { return code_; }
    [[nodiscard]] const nlohmann::json& data() const { return data_; }

    // Payload of the Error event: {code, message, data}
    [[nodiscard]] nlohmann::json toJson() const {
        return {{"code", code_}, {"message", what()}, {"data", data_}};
    }

private:
    int code_;
    nlohmann::json data_;
};

struct DuplicateTaskError final : UploadError {
    explicit DuplicateTaskError(nlohmann::json data)
        : UploadError(ResultCode::DUPLICATE_TASK, "Uploading duplicate file", std::move(data)) {}
};

struct UnacceptableTypeError final : UploadError {
    explicit UnacceptableTypeError(nlohmann::json data)
        : UploadError(ResultCode::UNACCEPTABLE_TYPE, "Unacceptable file type", std::move(data)) {}
};

struct FileLockedError final : UploadError {
    explicit FileLockedError(nlohmann::json data)
        : UploadError(ResultCode::FILE_LOCKED,
                      "File has already started uploading or has finished, its data can no longer be edited",
                      std::move(data)) {}
};

}
