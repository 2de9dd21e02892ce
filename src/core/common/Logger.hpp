#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/core.h>
#include <memory>
#include <string>

namespace Rbum {

class Logger {
public:
    enum class Level {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Critical = 5
    };
    
    static Logger& instance();

    // Console plus a rotating file; calling it again replaces both sinks
    void initialize(const std::string& logFilePath = "rbum.log",
                    Level level = Level::Info);

    void setLevel(Level level);
    Level level() const { return level_; }
    bool isInitialized() const { return static_cast<bool>(logger_); }
    const std::string& logFilePath() const { return logFilePath_; }

    // Flushes and drops the sinks; used by rbum-helper on exit
    void shutdown();
    
    template<typename... Args>
    void trace(fmt::format_string<Args...> format, Args&&... args) {
        sink()->trace(format, std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void debug(fmt::format_string<Args...> format, Args&&... args) {
        sink()->debug(format, std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void info(fmt::format_string<Args...> format, Args&&... args) {
        sink()->info(format, std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void warn(fmt::format_string<Args...> format, Args&&... args) {
        sink()->warn(format, std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void error(fmt::format_string<Args...> format, Args&&... args) {
        sink()->error(format, std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void critical(fmt::format_string<Args...> format, Args&&... args) {
        sink()->critical(format, std::forward<Args>(args)...);
    }
    
private:
    Logger() = default;
    spdlog::logger* sink();

    std::shared_ptr<spdlog::logger> logger_;
    std::string logFilePath_;
    Level level_ = Level::Info;
};

// Convenience macros
#define RBUM_TRACE(...) Rbum::Logger::instance().trace(__VA_ARGS__)
#define RBUM_DEBUG(...) Rbum::Logger::instance().debug(__VA_ARGS__)
#define RBUM_INFO(...) Rbum::Logger::instance().info(__VA_ARGS__)
#define RBUM_WARN(...) Rbum::Logger::instance().warn(__VA_ARGS__)
#define RBUM_ERROR(...) Rbum::Logger::instance().error(__VA_ARGS__)
#define RBUM_CRITICAL(...) Rbum::Logger::instance().critical(__VA_ARGS__)

} // namespace Rbum