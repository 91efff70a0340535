#include <gtest/gtest.h>
#include "types/FileData.hpp"
#include "types/UserData.hpp"
#include "util/fingerprint.hpp"
#include "util/mime.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace vl::types;
using namespace vl::util;

class FileDataTest : public ::testing::Test {
protected:
    fs::path test_dir;
    UserData user{.userid = "u1", .sign = "s"};

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "vidlift_filedata_test";
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    fs::path writeFile(const std::string& name, const std::string& content) const {
        const auto path = test_dir / name;
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }
};

TEST_F(FileDataTest, CleanupTitleStripsMarkupAndWhitespace) {
    EXPECT_EQ(cleanupTitle("  <b>Launch</b> demo.mp4 \n"), "Launch demo.mp4");
    EXPECT_EQ(cleanupTitle("plain.mov"), "plain.mov");
}

TEST_F(FileDataTest, GenerateFillsMetadataFromDisk) {
    const auto path = writeFile("demo.mp4", "0123456789");
    const auto data = generateFileData(FileSource{path, {}, {}}, {}, user);

    EXPECT_EQ(data.filename, "demo.mp4");
    EXPECT_EQ(data.title, "demo.mp4");
    EXPECT_EQ(data.mime, "video/mp4");
    EXPECT_EQ(data.size, 10u);
    EXPECT_EQ(data.cataid, 1);
    EXPECT_TRUE(data.vid.empty());
    EXPECT_EQ(data.id, fingerprint("u1", 1, "demo.mp4", "video/mp4", md5FileHex(path)));
}

TEST_F(FileDataTest, FingerprintIsStableAndDependsOnInputs) {
    const auto path = writeFile("demo.mp4", "same bytes");
    const auto first = generateFileData(FileSource{path, {}, {}}, {}, user);
    const auto second = generateFileData(FileSource{path, {}, {}}, {}, user);
    EXPECT_EQ(first.id, second.id);

    const auto otherUser = generateFileData(FileSource{path, {}, {}}, {}, UserData{.userid = "u2"});
    EXPECT_NE(first.id, otherUser.id);

    FileSetting setting;
    setting.cataid = 7;
    const auto otherCategory = generateFileData(FileSource{path, {}, {}}, setting, user);
    EXPECT_NE(first.id, otherCategory.id);
}

TEST_F(FileDataTest, SourceNameAndMimeOverrideGuesses) {
    const auto path = writeFile("upload.bin", "xyz");
    const auto data = generateFileData(FileSource{path, "Quarterly review.mkv", "video/x-matroska"}, {}, user);

    EXPECT_EQ(data.filename, "Quarterly review.mkv");
    EXPECT_EQ(data.mime, "video/x-matroska");
}

TEST_F(FileDataTest, MissingFileThrows) {
    EXPECT_THROW(generateFileData(FileSource{test_dir / "absent.mp4", {}, {}}, {}, user), std::runtime_error);
}

TEST_F(FileDataTest, MergeAppliesOnlySetFields) {
    FileData data;
    data.title = "old";
    data.desc = "keep";

    FileSetting setting;
    setting.title = " <i>new</i> ";
    setting.luping = 5;
    data.merge(setting);

    EXPECT_EQ(data.title, "new");
    EXPECT_EQ(data.desc, "keep");
    EXPECT_EQ(data.luping, 1);
    EXPECT_EQ(data.keepsource, 0);
}

TEST(FingerprintTest, Md5MatchesKnownDigests) {
    EXPECT_EQ(md5Hex(""), "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(md5Hex("abc"), "900150983cd24fb0d6963f7d28e17f72");
}

TEST(MimeTest, GuessesFromExtension) {
    EXPECT_EQ(mimeFromPath("a.MP4"), "video/mp4");
    EXPECT_EQ(mimeFromPath("notes.txt"), "text/plain");
    EXPECT_EQ(mimeFromPath("blob"), "application/octet-stream");
}

TEST(MimeTest, AcceptedTypesSupportWildcards) {
    EXPECT_TRUE(isAcceptedMimeType("text/plain", {}));
    EXPECT_TRUE(isAcceptedMimeType("video/mp4", {"video/*"}));
    EXPECT_TRUE(isAcceptedMimeType("audio/mpeg", {"*/*"}));
    EXPECT_TRUE(isAcceptedMimeType("video/webm", {"audio/*", "video/webm"}));
    EXPECT_FALSE(isAcceptedMimeType("text/plain", {"video/*"}));
    EXPECT_FALSE(isAcceptedMimeType("videos/mp4", {"video/*"}));
}
