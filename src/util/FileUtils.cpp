#include "FileUtils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace mw::file {

namespace {

constexpr const char* kAppDir = "moviewriter";

fs::path xdgDir(const char* envVar, const char* fallback) {
    if (const char* xdg = std::getenv(envVar); xdg && *xdg)
        return fs::path(xdg) / kAppDir;
    if (const char* home = std::getenv("HOME"); home && *home)
        return fs::path(home) / fallback / kAppDir;
    return fs::temp_directory_path() / kAppDir;
}

} // namespace

fs::path configDir() {
    return xdgDir("XDG_CONFIG_HOME", ".config");
}

fs::path cacheDir() {
    return xdgDir("XDG_CACHE_HOME", ".cache");
}

bool ensureDir(const fs::path& dir) {
    if (dir.empty())
        return true;
    std::error_code ec;
    if (fs::is_directory(dir, ec))
        return true;
    return fs::create_directories(dir, ec) && !ec;
}

std::string extension(const fs::path& path) {
    std::string ext = path.extension().string();
    if (!ext.empty() && ext.front() == '.')
        ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return ext;
}

fs::path expandHome(std::string_view path) {
    std::string p(path);
    if (p.starts_with("~/")) {
        if (const char* home = std::getenv("HOME")) {
            p = std::string(home) + p.substr(1);
        }
    }
    return fs::path(p);
}

} // namespace mw::file
