/**
 * @file Config.hpp
 * @brief Configuration management singleton.
 *
 * Thread-safe access point for the recorder settings. Recording sessions
 * take a copy of recorder() when they begin and never read it again, so
 * edits made while recording apply to the next file.
 *
 * @section Dependencies
 * - ConfigData
 * - ConfigLoader
 *
 * @section Patterns
 * - Singleton: Global access point for configuration.
 */

#pragma once
#include <mutex>
#include "ConfigData.hpp"
#include "util/Result.hpp"

namespace mw {

class Config {
public:
    static Config& instance();

    Result<void> load(const fs::path& path);
    Result<void> save(const fs::path& path) const;
    Result<void> loadDefault();

    fs::path configPath() const;
    bool debug() const;
    void setDebug(bool v);

    RecorderConfig recorder() const;
    void setRecorder(const RecorderConfig& cfg);

private:
    friend class ConfigLoader;

    Config() = default;

    fs::path configPath_;
    bool debug_{false};
    RecorderConfig recorder_;

    mutable std::mutex mutex_;
};

#define CONFIG mw::Config::instance()

} // namespace mw
