#include "Config.hpp"
#include "ConfigLoader.hpp"

namespace mw {

Config& Config::instance() {
    static Config instance;
    return instance;
}

Result<void> Config::load(const fs::path& path) {
    std::lock_guard lock(mutex_);
    return ConfigLoader::load(*this, path);
}

Result<void> Config::loadDefault() {
    std::lock_guard lock(mutex_);
    return ConfigLoader::loadDefault(*this);
}

Result<void> Config::save(const fs::path& path) const {
    std::lock_guard lock(mutex_);
    return ConfigLoader::save(*this, path);
}

fs::path Config::configPath() const {
    std::lock_guard lock(mutex_);
    return configPath_;
}

bool Config::debug() const {
    std::lock_guard lock(mutex_);
    return debug_;
}

void Config::setDebug(bool v) {
    std::lock_guard lock(mutex_);
    debug_ = v;
}

RecorderConfig Config::recorder() const {
    std::lock_guard lock(mutex_);
    return recorder_;
}

void Config::setRecorder(const RecorderConfig& cfg) {
    std::lock_guard lock(mutex_);
    recorder_ = cfg;
}

} // namespace mw
