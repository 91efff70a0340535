#include "config/ConfigRegistry.hpp"

#include <stdexcept>

namespace vl::config {

void ConfigRegistry::init(const Config& config) {
    std::call_once(init_flag_, [&]() {
        config_ = config;
        initialized_ = true;
    });
}

void ConfigRegistry::init(const std::filesystem::path& path) {
    init(loadConfig(path.string()));
}

const Config& ConfigRegistry::get() {
    ensureInitialized();
    return config_;
}

void ConfigRegistry::ensureInitialized() {
    if (!initialized_)
        throw std::runtime_error("ConfigRegistry accessed before initialization. Call ConfigRegistry::init() first.");
}

} // namespace vl::config
