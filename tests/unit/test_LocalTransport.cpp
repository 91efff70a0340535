#include <gtest/gtest.h>
#include "storage/LocalTransport.hpp"
#include "types/FileData.hpp"
#include "types/UserData.hpp"

#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <sstream>

namespace fs = std::filesystem;
using namespace vl::storage;
using namespace vl::types;

namespace {

std::optional<TransportError::Kind> failureKind(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const TransportError& e) {
        return e.kind();
    }
    return std::nullopt;
}

std::vector<char> bytes(const std::string& s) { return {s.begin(), s.end()}; }

}

class LocalTransportTest : public ::testing::Test {
protected:
    fs::path test_dir;
    std::unique_ptr<LocalTransport> transport;
    UserData user{.userid = "u1", .sign = "s1"};
    FileData file;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "vidlift_transport_test";
        fs::remove_all(test_dir);
        transport = std::make_unique<LocalTransport>(test_dir, 64);

        file.id = "file-1";
        file.filename = "clip.mp4";
        file.size = 10;
    }

    void TearDown() override {
        transport.reset();
        fs::remove_all(test_dir);
    }
};

TEST_F(LocalTransportTest, StoresObjectAndSidecar) {
    const auto session = transport->initSession(user, file);
    EXPECT_EQ(session.vid.size(), 24u);
    EXPECT_EQ(session.objectKey, session.vid + ".mp4");
    EXPECT_EQ(session.remainSpace, 54u);

    transport->putPart(session, 5, bytes("56789"));
    transport->putPart(session, 0, bytes("01234"));
    transport->complete(session, file);

    std::ifstream in(test_dir / session.objectKey, std::ios::binary);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_EQ(content.str(), "0123456789");

    EXPECT_TRUE(fs::exists(test_dir / (session.vid + ".json")));
    EXPECT_FALSE(fs::exists(test_dir / (session.vid + ".part")));
    EXPECT_EQ(transport->usedBytes(), 10u);
}

TEST_F(LocalTransportTest, MissingSignatureIsCredentialFailure) {
    EXPECT_EQ(failureKind([&] { transport->initSession(UserData{.userid = "u1"}, file); }),
              TransportError::Kind::CredentialExpired);
}

TEST_F(LocalTransportTest, QuotaCountsOpenSessions) {
    file.size = 40;
    transport->initSession(user, file);
    EXPECT_EQ(transport->usedBytes(), 40u);

    EXPECT_EQ(failureKind([&] { transport->initSession(user, file); }), TransportError::Kind::QuotaExceeded);
}

TEST_F(LocalTransportTest, EmptyFileIsRejected) {
    file.size = 0;
    EXPECT_EQ(failureKind([&] { transport->initSession(user, file); }), TransportError::Kind::Rejected);
}

TEST_F(LocalTransportTest, InvalidatedSessionRefusesParts) {
    const auto session = transport->initSession(user, file);
    transport->invalidateSessions();

    EXPECT_EQ(failureKind([&] { transport->putPart(session, 0, bytes("0123456789")); }),
              TransportError::Kind::SessionInvalid);
    EXPECT_EQ(transport->usedBytes(), 0u);
}

TEST_F(LocalTransportTest, IncompleteUploadIsRejectedOnComplete) {
    const auto session = transport->initSession(user, file);
    transport->putPart(session, 0, bytes("0123"));

    EXPECT_EQ(failureKind([&] { transport->complete(session, file); }), TransportError::Kind::Rejected);
}

TEST_F(LocalTransportTest, AbortReleasesReservationAndParts) {
    file.size = 40;
    const auto session = transport->initSession(user, file);
    transport->putPart(session, 0, bytes("0123"));

    transport->abort(session);
    EXPECT_EQ(transport->usedBytes(), 0u);
    EXPECT_FALSE(fs::exists(test_dir / (session.vid + ".part")));
    EXPECT_EQ(failureKind([&] { transport->putPart(session, 4, bytes("4567")); }),
              TransportError::Kind::SessionInvalid);

    // the freed space is available again
    EXPECT_NO_THROW(transport->initSession(user, file));

    // aborting twice is harmless
    EXPECT_NO_THROW(transport->abort(session));
    EXPECT_EQ(transport->usedBytes(), 40u);
}
