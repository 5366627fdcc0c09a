/**
 * @file FileUtils.hpp
 * @brief XDG directory lookup and small path helpers.
 */

#pragma once
#include <string>
#include <string_view>
#include "util/Types.hpp"

namespace mw::file {

fs::path configDir();
fs::path cacheDir();

bool ensureDir(const fs::path& dir);

// Lower-case extension without the leading dot ("webm" for "a/b.WEBM").
std::string extension(const fs::path& path);

fs::path expandHome(std::string_view path);

} // namespace mw::file
