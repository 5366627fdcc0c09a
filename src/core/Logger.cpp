#include "Logger.hpp"
#include <vector>
#include "util/FileUtils.hpp"

namespace mw {

std::shared_ptr<spdlog::logger> Logger::logger_;
fs::path Logger::logFile_;

void Logger::init(std::string_view appName, bool debug) {
    auto level = debug ? spdlog::level::debug : spdlog::level::info;
    logFile_.clear();
    try {
        spdlog::drop(std::string(appName));

        std::vector<spdlog::sink_ptr> sinks;

        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_pattern("%^[%H:%M:%S.%e] [%l]%$ %v");
        sinks.push_back(console);

        auto logDir = file::cacheDir() / "logs";
        file::ensureDir(logDir);

        auto logFile = logDir / (std::string(appName) + ".log");
        auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFile.string(), kMaxLogFileSize, kMaxLogFiles);
        file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%#] %v");
        sinks.push_back(file);

        logger_ = std::make_shared<spdlog::logger>(
                std::string(appName), sinks.begin(), sinks.end());

        logger_->set_level(level);
        logger_->flush_on(spdlog::level::warn);

        spdlog::register_logger(logger_);
        spdlog::set_default_logger(logger_);

        logFile_ = logFile;
        LOG_DEBUG("Logging to {} (up to {} files of {} MiB)",
                  logFile.string(),
                  kMaxLogFiles,
                  kMaxLogFileSize / (1024 * 1024));

    } catch (const spdlog::spdlog_ex& ex) {
        spdlog::drop(std::string(appName));
        logger_ = spdlog::stdout_color_mt(std::string(appName));
        logger_->set_level(level);
        logger_->warn("Failed to create file logger: {}", ex.what());
    }
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
    }
    logger_.reset();
    logFile_.clear();
    spdlog::shutdown();
}

void Logger::setDebug(bool debug) {
    get()->set_level(debug ? spdlog::level::debug : spdlog::level::info);
}

std::shared_ptr<spdlog::logger>& Logger::get() {
    if (!logger_) {
        init();
    }
    return logger_;
}

} // namespace mw
