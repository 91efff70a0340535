#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <utility>

namespace vl::logging {

void LogRegistry::registerLogger(const std::string& name, const std::vector<spdlog::sink_ptr>& sinks,
                                 const spdlog::level::level_enum lvl) {
    if (spdlog::get(name)) spdlog::drop(name);
    const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(lvl);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
}

void LogRegistry::init(const config::LoggingConfig& cnf) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    log_dir_ = cnf.log_dir;
    main_log_path_ = log_dir_ / "vidlift.log";

    namespace fs = std::filesystem;
    if (!fs::exists(log_dir_)) fs::create_directories(log_dir_);

    // console
    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    // main file sink (rotating)
    main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        main_log_path_.string(), main_max_bytes_, main_max_files_);
    main_file_sink_->set_level(cnf.levels.file_log_level);
    main_file_sink_->set_pattern(LOG_FORMAT);

    const std::vector<spdlog::sink_ptr> sinks{console_sink_, main_file_sink_};
    const auto& lv = cnf.levels.subsystem_levels;
    const std::pair<const char*, spdlog::level::level_enum> subsystems[] = {
        {"vidlift", lv.vidlift}, {"pool", lv.pool}, {"orchestrator", lv.orchestrator},
        {"transfer", lv.transfer}, {"storage", lv.storage}, {"config", lv.config}};
    for (const auto& [name, level] : subsystems) registerLogger(name, sinks, level);

    initialized_ = true;
    vidlift()->debug("[LogRegistry] Initialized, writing to {}", main_log_path_.string());
}

void LogRegistry::initConsoleOnly(const spdlog::level::level_enum level) {
    if (initialized_) return;

    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(level);
    console_sink_->set_pattern(LOG_FORMAT);

    const std::vector<spdlog::sink_ptr> sinks{console_sink_};
    for (const auto* name : {"vidlift", "pool", "orchestrator", "transfer", "storage", "config"})
        registerLogger(name, sinks, level);

    initialized_ = true;
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool LogRegistry::isInitialized() { return initialized_; }

void LogRegistry::replaceSinkEverywhere_(const std::shared_ptr<spdlog::sinks::sink>& old_sink,
                                         const std::shared_ptr<spdlog::sinks::sink>& new_sink) {
    spdlog::apply_all([&](const std::shared_ptr<spdlog::logger>& lg) {
        auto& sinks = lg->sinks();
        if (std::ranges::find(sinks, old_sink) == sinks.end()) return;
        lg->flush();
        std::ranges::replace(sinks, old_sink, new_sink);
    });
}

void LogRegistry::reopenMainLog() {
    if (!initialized_ || !main_file_sink_) return;

    auto fresh = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        main_log_path_.string(), main_max_bytes_, main_max_files_);

    fresh->set_level(main_file_sink_->level());
    fresh->set_pattern(LOG_FORMAT);

    replaceSinkEverywhere_(main_file_sink_, fresh);
    main_file_sink_ = std::move(fresh);
}

}
