#include "Logger.hpp"
#include <spdlog/pattern_formatter.h>

namespace Rbum {

namespace {
constexpr const char* kLoggerName = "rbum";
constexpr const char* kConsoleOnlyName = "rbum_console";
constexpr std::size_t kMaxLogFileSize = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& logFilePath, Level level) {
    try {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_pattern("[%H:%M:%S] [%^%l%$] [%t] %v");

        auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFilePath, kMaxLogFileSize, kMaxLogFiles);
        file->set_pattern("[%Y-%m-%d %H:%M:%S.%f] [%l] [%P:%t] %v");

        spdlog::drop(kLoggerName);
        logger_ = std::make_shared<spdlog::logger>(kLoggerName,
            spdlog::sinks_init_list{console, file});
        spdlog::register_logger(logger_);

        // The helper can be killed at any time; keep warnings on disk
        logger_->flush_on(spdlog::level::warn);
        logFilePath_ = logFilePath;
        setLevel(level);

        RBUM_INFO("Logging to {}", logFilePath);
    } catch (const spdlog::spdlog_ex& ex) {
        logFilePath_.clear();
        logger_ = spdlog::get(kConsoleOnlyName);
        if (!logger_) {
            logger_ = spdlog::stdout_color_mt(kConsoleOnlyName);
        }
        setLevel(level);
        logger_->error("Cannot open log file {}: {}", logFilePath, ex.what());
    }
}

spdlog::logger* Logger::sink() {
    // Tests construct components before anything configured the sinks
    if (!logger_) {
        logger_ = spdlog::get(kConsoleOnlyName);
        if (!logger_) {
            logger_ = spdlog::stdout_color_mt(kConsoleOnlyName);
        }
    }
    return logger_.get();
}

void Logger::setLevel(Level level) {
    level_ = level;
    if (logger_) {
        logger_->set_level(static_cast<spdlog::level::level_enum>(level));
    }
}

void Logger::shutdown() {
    if (!logger_) {
        return;
    }
    logger_->flush();
    spdlog::drop(logger_->name());
    logger_.reset();
    logFilePath_.clear();
}

} // namespace Rbum
