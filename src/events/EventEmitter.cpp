#include "events/EventEmitter.hpp"
#include "types/FileData.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <array>
#include <utility>

using namespace vl::events;
using namespace vl::logging;

namespace {

constexpr std::array<std::pair<EventType, std::string_view>, 7> EVENT_NAMES{{
    {EventType::Error, "Error"},
    {EventType::UploadComplete, "UploadComplete"},
    {EventType::FileStarted, "FileStarted"},
    {EventType::FileStopped, "FileStopped"},
    {EventType::FileProgress, "FileProgress"},
    {EventType::FileSucceed, "FileSucceed"},
    {EventType::FileFailed, "FileFailed"},
}};

}

std::string_view vl::events::to_string(const EventType type) {
    for (const auto& [t, name] : EVENT_NAMES)
        if (t == type) return name;
    return "Unknown";
}

std::optional<EventType> vl::events::eventTypeFromString(const std::string_view name) {
    for (const auto& [t, n] : EVENT_NAMES)
        if (n == name) return t;
    return std::nullopt;
}

nlohmann::json vl::events::filePayload(const std::string& taskId, const types::FileData& fileData) {
    return {{"taskId", taskId}, {"fileData", fileData}};
}

nlohmann::json vl::events::errorPayload(const int code, const std::string& message, nlohmann::json data) {
    return {{"code", code}, {"message", message}, {"data", std::move(data)}};
}

EventEmitter::EventEmitter(const Handlers& handlers) {
    for (const auto& [type, handler] : handlers)
        if (handler) on(type, handler);
}

EventEmitter::Token EventEmitter::on(const EventType type, Handler handler) {
    const auto token = nextToken_++;
    subscribers_[type].push_back({token, std::move(handler)});
    return token;
}

bool EventEmitter::off(const EventType type, const Token token) {
    const auto it = subscribers_.find(type);
    if (it == subscribers_.end()) return false;
    return std::erase_if(it->second, [&](const Subscriber& s) { return s.token == token; }) > 0;
}

void EventEmitter::emit(const EventType type, const nlohmann::json& payload) const {
    const auto it = subscribers_.find(type);
    if (it == subscribers_.end()) return;

    const auto snapshot = it->second;
    for (const auto& s : snapshot) {
        try {
            s.handler(payload);
        } catch (const std::exception& e) {
            LogRegistry::vidlift()->error("[EventEmitter] {} handler threw: {}", to_string(type), e.what());
        }
    }
}

size_t EventEmitter::listenerCount(const EventType type) const {
    const auto it = subscribers_.find(type);
    return it == subscribers_.end() ? 0 : it->second.size();
}
