/**
 * @file ConfigLoader.hpp
 * @brief Configuration file I/O.
 *
 * Reads and writes config.toml. Saving goes through a temporary file and a
 * rename so a crash never leaves a truncated config behind.
 */

#pragma once
#include <filesystem>
#include "util/Result.hpp"

namespace mw {

class Config;

class ConfigLoader {
public:
    static Result<void> load(Config& config, const std::filesystem::path& path);
    static Result<void> save(const Config& config,
                             const std::filesystem::path& path);
    static Result<void> loadDefault(Config& config);
};

} // namespace mw
