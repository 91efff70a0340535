#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace vl::types { struct FileData; }

namespace vl::events {

enum class EventType {
    Error,
    UploadComplete,
    FileStarted,
    FileStopped,
    FileProgress,
    FileSucceed,
    FileFailed
};

std::string_view to_string(EventType type);
std::optional<EventType> eventTypeFromString(std::string_view name);

// {taskId, fileData}, the minimum every per-file event carries.
nlohmann::json filePayload(const std::string& taskId, const types::FileData& fileData);

// {code, message, data}
nlohmann::json errorPayload(int code, const std::string& message, nlohmann::json data = nlohmann::json::object());

}
