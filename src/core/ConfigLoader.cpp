#include "ConfigLoader.hpp"
#include <fstream>
#include "Config.hpp"
#include "ConfigParsers.hpp"
#include "Logger.hpp"
#include "util/FileUtils.hpp"

namespace mw {

Result<void> ConfigLoader::load(Config& config, const fs::path& path) {
    try {
        auto tbl = toml::parse_file(path.string());

        config.debug_ = ConfigParsers::parseDebug(tbl);
        ConfigParsers::parseRecorder(tbl, config.recorder_);
        config.configPath_ = path;

        LOG_INFO("Config loaded from: {}", path.string());
        return Result<void>::ok();
    } catch (const toml::parse_error& err) {
        return Result<void>::err(
                std::string("Config parse error: ") + err.what(),
                ErrorCode::Io);
    }
}

Result<void> ConfigLoader::loadDefault(Config& config) {
    auto configDir = file::configDir();
    auto defaultPath = configDir / "config.toml";

    if (fs::exists(defaultPath)) {
        return load(config, defaultPath);
    }

    LOG_WARN("No config file found, using built-in defaults");
    config.recorder_ = RecorderConfig{};
    config.debug_ = false;
    config.configPath_ = defaultPath;
    if (file::ensureDir(configDir)) {
        if (auto result = save(config, defaultPath); !result) {
            LOG_WARN("{}", result.error().message);
        }
    }
    return Result<void>::ok();
}

Result<void> ConfigLoader::save(const Config& config, const fs::path& path) {
    try {
        auto tbl = ConfigParsers::serialize(config.recorder_, config.debug_);
        fs::path tempPath = path;
        tempPath += ".tmp";
        {
            std::ofstream file(tempPath);
            if (!file)
                return Result<void>::err("Failed to open temp config file",
                                         ErrorCode::Io);
            file << tbl;
        }
        fs::rename(tempPath, path);
        LOG_DEBUG("Config saved to: {}", path.string());
        return Result<void>::ok();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to save config: {}", e.what());
        return Result<void>::err(
                std::string("Failed to save config: ") + e.what(),
                ErrorCode::Io);
    }
}

} // namespace mw
