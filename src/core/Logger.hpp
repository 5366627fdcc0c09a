/**
 * @file Logger.hpp
 * @brief Logging wrapper around spdlog.
 *
 * This file defines the Logger class which initializes and manages the
 * spdlog instance. It provides macros for convenient logging with source
 * location information.
 *
 * @section Dependencies
 * - spdlog
 *
 * @section Patterns
 * - Wrapper: Simplifies spdlog usage.
 */

#pragma once
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <string_view>
#include "util/Types.hpp"

namespace mw {

class Logger {
public:
    // A long recording at debug level fills one file in a few minutes.
    static constexpr usize kMaxLogFileSize = 5 * 1024 * 1024;
    static constexpr usize kMaxLogFiles = 3;

    static void init(std::string_view appName = "moviewriter",
                     bool debug = false);
    static void shutdown();
    static void setDebug(bool debug);

    static std::shared_ptr<spdlog::logger>& get();

    // Current rotating log file; empty when only the console is logged to.
    static const fs::path& logFile() {
        return logFile_;
    }

private:
    static std::shared_ptr<spdlog::logger> logger_;
    static fs::path logFile_;
};

// Use these instead of calling Logger::get() directly

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(mw::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(mw::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...) SPDLOG_LOGGER_INFO(mw::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...) SPDLOG_LOGGER_WARN(mw::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(mw::Logger::get(), __VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(mw::Logger::get(), __VA_ARGS__)

} // namespace mw
