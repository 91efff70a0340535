#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <algorithm>
#include <stdexcept>
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace vl::config {

unsigned int UploadConfig::parallelFileLimit() const {
    if (parallel_file_limit < 1 || parallel_file_limit > static_cast<int>(MAX_PARALLEL_FILES))
        return MAX_PARALLEL_FILES;
    return static_cast<unsigned int>(parallel_file_limit);
}

uint64_t UploadConfig::partSize() const {
    if (part_size == 0) return DEFAULT_PART_SIZE_BYTES;
    return std::max(part_size, MIN_PART_SIZE_BYTES);
}

namespace {

template <typename T>
void decodeSection(const YAML::Node& root, const char* key, T& out) {
    const auto node = root[key];
    if (!node) return;
    if (!YAML::convert<T>::decode(node, out))
        throw std::runtime_error(fmt::format("Config section '{}' must be a mapping", key));
}

Config decodeRoot(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::runtime_error("Config root must be a mapping");

    decodeSection(root, "upload", cfg.upload);
    decodeSection(root, "transport", cfg.transport);
    decodeSection(root, "credentials", cfg.credentials);
    decodeSection(root, "logging", cfg.logging);

    return cfg;
}

}

Config loadConfig(const std::string& path) {
    try {
        return decodeRoot(YAML::LoadFile(path));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(fmt::format("Failed to load config {}: {}", path, e.what()));
    }
}

Config parseConfig(const std::string& yaml) {
    try {
        return decodeRoot(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(fmt::format("Failed to parse config: {}", e.what()));
    }
}

void to_json(nlohmann::json& j, const UploadConfig& c) {
    j = {
        {"parallel_file_limit", c.parallel_file_limit},
        {"part_size", c.part_size},
        {"thread_count", c.thread_count},
        {"retry_count", c.retry_count},
        {"accepted_mime_types", c.accepted_mime_types},
        {"region", c.region}
    };
}

void from_json(const nlohmann::json& j, UploadConfig& c) {
    c.parallel_file_limit = j.value("parallel_file_limit", static_cast<int>(MAX_PARALLEL_FILES));
    c.part_size = j.value("part_size", uint64_t{0});
    c.thread_count = j.value("thread_count", 3u);
    c.retry_count = j.value("retry_count", 3u);
    c.accepted_mime_types = j.value("accepted_mime_types", std::vector<std::string>{});
    c.region = j.value("region", std::string("line1"));
}

} // namespace vl::config
