#pragma once

#include "types/UserData.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace vl::config {

constexpr static unsigned int MAX_PARALLEL_FILES = 5;
constexpr static uint64_t MIN_PART_SIZE_BYTES = 100 * 1024;           // 100KiB
constexpr static uint64_t DEFAULT_PART_SIZE_BYTES = 1024 * 1024;      // 1MiB

struct UploadConfig {
    int parallel_file_limit = MAX_PARALLEL_FILES;
    uint64_t part_size = 0;                 // 0 picks DEFAULT_PART_SIZE_BYTES
    unsigned int thread_count = 3;
    unsigned int retry_count = 3;
    std::vector<std::string> accepted_mime_types;
    std::string region = "line1";

    // Out of range [1, MAX_PARALLEL_FILES] resets to MAX_PARALLEL_FILES.
    [[nodiscard]] unsigned int parallelFileLimit() const;
    [[nodiscard]] uint64_t partSize() const;
    [[nodiscard]] unsigned int threadCount() const { return thread_count ? thread_count : 1; }
};

struct TransportConfig {
    std::filesystem::path root = "/var/lib/vidlift/objects";
    uint64_t quota_bytes = 0;               // 0 is unlimited
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum vidlift      = spdlog::level::info;   // Startup, shutdown, batch completion
    spdlog::level::level_enum pool         = spdlog::level::warn;   // Admission and slot accounting
    spdlog::level::level_enum orchestrator = spdlog::level::info;   // File lifecycle and status dispatch
    spdlog::level::level_enum transfer     = spdlog::level::warn;   // Per-file session and part progress
    spdlog::level::level_enum storage      = spdlog::level::warn;   // Transport I/O failures
    spdlog::level::level_enum config       = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/vidlift";
    LogLevelsConfig levels;
};

struct Config {
    UploadConfig upload;
    TransportConfig transport;
    types::UserData credentials;
    LoggingConfig logging;
};

Config loadConfig(const std::string& path);
Config parseConfig(const std::string& yaml);

void to_json(nlohmann::json& j, const UploadConfig& c);
void from_json(const nlohmann::json& j, UploadConfig& c);

} // namespace vl::config
