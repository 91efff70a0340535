#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace vl::config;

inline spdlog::level::level_enum decodeLevel(const Node& node, const spdlog::level::level_enum def) {
    if (!node) return def;
    const auto lvl = spdlog::level::from_str(node.as<std::string>());
    // from_str maps unknown names to off
    if (lvl == spdlog::level::off && node.as<std::string>() != "off") return def;
    return lvl;
}

template<>
struct convert<UploadConfig> {
    static Node encode(const UploadConfig& rhs) {
        Node node;
        node["parallel_file_limit"] = rhs.parallel_file_limit;
        node["part_size"] = rhs.part_size;
        node["thread_count"] = rhs.thread_count;
        node["retry_count"] = rhs.retry_count;
        node["accepted_mime_types"] = rhs.accepted_mime_types;
        node["region"] = rhs.region;
        return node;
    }

    static bool decode(const Node& node, UploadConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.parallel_file_limit = node["parallel_file_limit"].as<int>(MAX_PARALLEL_FILES);
        rhs.part_size = node["part_size"].as<uint64_t>(0);
        rhs.thread_count = node["thread_count"].as<unsigned int>(3);
        rhs.retry_count = node["retry_count"].as<unsigned int>(3);
        rhs.accepted_mime_types = node["accepted_mime_types"].as<std::vector<std::string>>(std::vector<std::string>{});
        rhs.region = node["region"].as<std::string>("line1");
        return true;
    }
};

template<>
struct convert<TransportConfig> {
    static Node encode(const TransportConfig& rhs) {
        Node node;
        node["root"] = rhs.root.string();
        node["quota_bytes"] = rhs.quota_bytes;
        return node;
    }

    static bool decode(const Node& node, TransportConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.root = node["root"].as<std::string>("/var/lib/vidlift/objects");
        rhs.quota_bytes = node["quota_bytes"].as<uint64_t>(0);
        return true;
    }
};

template<>
struct convert<vl::types::UserData> {
    static Node encode(const vl::types::UserData& rhs) {
        Node node;
        node["userid"] = rhs.userid;
        node["ptime"] = rhs.ptime;
        node["hash"] = rhs.hash;
        node["app_id"] = rhs.appId;
        node["timestamp"] = rhs.timestamp;
        node["region"] = rhs.region;
        return node;
    }

    static bool decode(const Node& node, vl::types::UserData& rhs) {
        if (!node.IsMap()) return false;
        rhs.userid = node["userid"].as<std::string>("");
        rhs.ptime = node["ptime"].as<uint64_t>(0);
        rhs.sign = node["sign"].as<std::string>("");
        rhs.hash = node["hash"].as<std::string>("");
        rhs.appId = node["app_id"].as<std::string>("");
        rhs.timestamp = node["timestamp"].as<uint64_t>(0);
        rhs.region = node["region"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["vidlift"] = spdlog::level::to_string_view(rhs.vidlift).data();
        node["pool"] = spdlog::level::to_string_view(rhs.pool).data();
        node["orchestrator"] = spdlog::level::to_string_view(rhs.orchestrator).data();
        node["transfer"] = spdlog::level::to_string_view(rhs.transfer).data();
        node["storage"] = spdlog::level::to_string_view(rhs.storage).data();
        node["config"] = spdlog::level::to_string_view(rhs.config).data();
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.vidlift = decodeLevel(node["vidlift"], spdlog::level::info);
        rhs.pool = decodeLevel(node["pool"], spdlog::level::warn);
        rhs.orchestrator = decodeLevel(node["orchestrator"], spdlog::level::info);
        rhs.transfer = decodeLevel(node["transfer"], spdlog::level::warn);
        rhs.storage = decodeLevel(node["storage"], spdlog::level::warn);
        rhs.config = decodeLevel(node["config"], spdlog::level::warn);
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console"] = spdlog::level::to_string_view(rhs.console_log_level).data();
        node["file"] = spdlog::level::to_string_view(rhs.file_log_level).data();
        node["subsystems"] = convert<SubsystemLogLevelsConfig>::encode(rhs.subsystem_levels);
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = decodeLevel(node["console"], spdlog::level::info);
        rhs.file_log_level = decodeLevel(node["file"], spdlog::level::warn);
        if (node["subsystems"]) return convert<SubsystemLogLevelsConfig>::decode(node["subsystems"], rhs.subsystem_levels);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["levels"] = convert<LogLevelsConfig>::encode(rhs.levels);
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/vidlift");
        if (node["levels"]) return convert<LogLevelsConfig>::decode(node["levels"], rhs.levels);
        return true;
    }
};

}
