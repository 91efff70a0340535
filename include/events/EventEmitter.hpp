#pragma once

#include "events/Event.hpp"

#include <cstdint>
#include <functional>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace vl::events {

using Handler = std::function<void(const nlohmann::json&)>;
using Handlers = std::unordered_map<EventType, Handler>;

class EventEmitter {
public:
    using Token = uint64_t;

    EventEmitter() = default;
    explicit EventEmitter(const Handlers& handlers);
    virtual ~EventEmitter() = default;

    Token on(EventType type, Handler handler);
    bool off(EventType type, Token token);

    // Synchronous, in registration order. Handlers registered while a dispatch
    // is in progress are not called by that dispatch.
    void emit(EventType type, const nlohmann::json& payload = nlohmann::json::object()) const;

    [[nodiscard]] size_t listenerCount(EventType type) const;

private:
    struct Subscriber {
        Token token;
        Handler handler;
    };

    std::unordered_map<EventType, std::vector<Subscriber>> subscribers_;
    Token nextToken_ = 1;
};

}
