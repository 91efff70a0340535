#include <gtest/gtest.h>
#include "events/EventEmitter.hpp"
#include "types/FileData.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace vl::events;

TEST(EventEmitterTest, HandlersRunInRegistrationOrder) {
    EventEmitter emitter;
    std::vector<int> order;
    emitter.on(EventType::FileProgress, [&](const nlohmann::json&) { order.push_back(1); });
    emitter.on(EventType::FileProgress, [&](const nlohmann::json&) { order.push_back(2); });

    emitter.emit(EventType::FileProgress);
    EXPECT_EQ(order, (std::vector<int>{1, 2}));
}

TEST(EventEmitterTest, ConstructorHandlersAreSubscribed) {
    std::string message;
    const EventEmitter emitter(Handlers{
        {EventType::Error, [&](const nlohmann::json& e) { message = e["message"].get<std::string>(); }}});

    emitter.emit(EventType::Error, errorPayload(103, "failed"));
    EXPECT_EQ(message, "failed");
    EXPECT_EQ(emitter.listenerCount(EventType::Error), 1u);
    EXPECT_EQ(emitter.listenerCount(EventType::UploadComplete), 0u);
}

TEST(EventEmitterTest, OffRemovesOnlyThatHandler) {
    EventEmitter emitter;
    int a = 0, b = 0;
    const auto token = emitter.on(EventType::FileSucceed, [&](const nlohmann::json&) { ++a; });
    emitter.on(EventType::FileSucceed, [&](const nlohmann::json&) { ++b; });

    EXPECT_TRUE(emitter.off(EventType::FileSucceed, token));
    EXPECT_FALSE(emitter.off(EventType::FileSucceed, token));

    emitter.emit(EventType::FileSucceed);
    EXPECT_EQ(a, 0);
    EXPECT_EQ(b, 1);
}

TEST(EventEmitterTest, HandlerAddedDuringDispatchWaitsForNextEmit) {
    EventEmitter emitter;
    int late = 0;
    emitter.on(EventType::FileStarted, [&](const nlohmann::json&) {
        emitter.on(EventType::FileStarted, [&](const nlohmann::json&) { ++late; });
    });

    emitter.emit(EventType::FileStarted);
    EXPECT_EQ(late, 0);
    emitter.emit(EventType::FileStarted);
    EXPECT_EQ(late, 1);
}

TEST(EventEmitterTest, ThrowingHandlerDoesNotStopOthers) {
    EventEmitter emitter;
    bool reached = false;
    emitter.on(EventType::FileFailed, [](const nlohmann::json&) { throw std::runtime_error("handler bug"); });
    emitter.on(EventType::FileFailed, [&](const nlohmann::json&) { reached = true; });

    EXPECT_NO_THROW(emitter.emit(EventType::FileFailed));
    EXPECT_TRUE(reached);
}

TEST(EventEmitterTest, EventNamesRoundTrip) {
    EXPECT_EQ(to_string(EventType::UploadComplete), "UploadComplete");
    EXPECT_EQ(eventTypeFromString("FileProgress"), EventType::FileProgress);
    EXPECT_FALSE(eventTypeFromString("NoSuchEvent").has_value());
}

TEST(EventEmitterTest, FilePayloadCarriesTaskAndData) {
    vl::types::FileData data;
    data.id = "abc";
    data.title = "clip.mp4";

    const auto payload = filePayload(data.id, data);
    EXPECT_EQ(payload["taskId"], "abc");
    EXPECT_EQ(payload["fileData"]["title"], "clip.mp4");
}
