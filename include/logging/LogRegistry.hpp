#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace vl::logging {

class LogRegistry {
public:
    // Initialize all loggers with sinks/levels.
    static void init(const config::LoggingConfig& cnf);

    // Console-only loggers at the given level, for tests and when the log dir is unusable.
    static void initConsoleOnly(spdlog::level::level_enum level = spdlog::level::warn);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> vidlift()      { return get("vidlift"); }
    static std::shared_ptr<spdlog::logger> pool()         { return get("pool"); }
    static std::shared_ptr<spdlog::logger> orchestrator() { return get("orchestrator"); }
    static std::shared_ptr<spdlog::logger> transfer()     { return get("transfer"); }
    static std::shared_ptr<spdlog::logger> storage()      { return get("storage"); }
    static std::shared_ptr<spdlog::logger> config()       { return get("config"); }

    [[nodiscard]] static bool isInitialized();

    static void reopenMainLog();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path log_dir_;
    static inline std::filesystem::path main_log_path_;

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;

    static void registerLogger(const std::string& name, const std::vector<spdlog::sink_ptr>& sinks,
                               spdlog::level::level_enum lvl);

    static void replaceSinkEverywhere_(const std::shared_ptr<spdlog::sinks::sink>& old_sink,
                                       const std::shared_ptr<spdlog::sinks::sink>& new_sink);
};

}
