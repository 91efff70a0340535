#include <gtest/gtest.h>
#include "config/Config.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>

using namespace vl::config;

TEST(UploadConfigTest, ParallelLimitOutOfRangeFallsBackToMax) {
    UploadConfig cfg;
    for (const int v : {0, -1, 6, 100}) {
        cfg.parallel_file_limit = v;
        EXPECT_EQ(cfg.parallelFileLimit(), MAX_PARALLEL_FILES) << "limit " << v;
    }
    for (const int v : {1, 3, 5}) {
        cfg.parallel_file_limit = v;
        EXPECT_EQ(cfg.parallelFileLimit(), static_cast<unsigned int>(v));
    }
}

TEST(UploadConfigTest, PartSizeHasDefaultAndFloor) {
    UploadConfig cfg;
    EXPECT_EQ(cfg.partSize(), DEFAULT_PART_SIZE_BYTES);

    cfg.part_size = 10;
    EXPECT_EQ(cfg.partSize(), MIN_PART_SIZE_BYTES);

    cfg.part_size = 4 * 1024 * 1024;
    EXPECT_EQ(cfg.partSize(), 4u * 1024 * 1024);
}

TEST(UploadConfigTest, JsonKeepsFields) {
    UploadConfig cfg;
    cfg.parallel_file_limit = 2;
    cfg.accepted_mime_types = {"video/*"};

    const nlohmann::json j = cfg;
    EXPECT_EQ(j["parallel_file_limit"], 2);
    EXPECT_EQ(j["accepted_mime_types"][0], "video/*");
    EXPECT_EQ(j.get<UploadConfig>().parallel_file_limit, 2);
}

TEST(ConfigParseTest, EmptyDocumentGivesDefaults) {
    const auto cfg = parseConfig("");
    EXPECT_EQ(cfg.upload.parallelFileLimit(), MAX_PARALLEL_FILES);
    EXPECT_EQ(cfg.upload.region, "line1");
    EXPECT_EQ(cfg.transport.quota_bytes, 0u);
}

TEST(ConfigParseTest, ReadsEverySection) {
    const auto cfg = parseConfig(R"(
upload:
  parallel_file_limit: 2
  part_size: 204800
  retry_count: 1
  accepted_mime_types: ["video/*", "audio/mpeg"]
transport:
  root: /tmp/vidlift-objects
  quota_bytes: 1048576
credentials:
  userid: u1
  sign: abc
  app_id: sub
logging:
  log_dir: /tmp/vidlift-logs
  levels:
    console: debug
    file: not-a-level
    subsystems:
      pool: trace
)");

    EXPECT_EQ(cfg.upload.parallelFileLimit(), 2u);
    EXPECT_EQ(cfg.upload.partSize(), 204800u);
    EXPECT_EQ(cfg.upload.retry_count, 1u);
    ASSERT_EQ(cfg.upload.accepted_mime_types.size(), 2u);
    EXPECT_EQ(cfg.transport.root, std::filesystem::path("/tmp/vidlift-objects"));
    EXPECT_EQ(cfg.transport.quota_bytes, 1048576u);
    EXPECT_EQ(cfg.credentials.userid, "u1");
    EXPECT_EQ(cfg.credentials.sign, "abc");
    EXPECT_TRUE(cfg.credentials.isSubAccount());
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.file_log_level, spdlog::level::warn);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.pool, spdlog::level::trace);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.vidlift, spdlog::level::info);
}

TEST(ConfigParseTest, MalformedDocumentsThrow) {
    EXPECT_THROW(parseConfig("- just\n- a list\n"), std::runtime_error);
    EXPECT_THROW(parseConfig("upload: 3\n"), std::runtime_error);
}

TEST(ConfigParseTest, MissingFileThrows) {
    EXPECT_THROW(loadConfig("/nonexistent/vidlift/config.yaml"), std::runtime_error);
}
