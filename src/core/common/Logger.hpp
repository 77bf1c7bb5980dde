#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/core.h>
#include <memory>
#include <string>

namespace Ferry {

class Logger {
public:
    enum class Level {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Critical = 5,
        Off = 6
    };

    static Logger& instance();

    void initialize(const std::string& logFilePath = "ferry.log",
                   Level level = Level::Info,
                   bool consoleOutput = true);

    void setLevel(Level level);
    Level level() const;
    bool isInitialized() const { return logger_ != nullptr; }

    void flush();

    template<typename... Args>
    void trace(fmt::format_string<Args...> format, Args&&... args) {
        get()->trace(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(fmt::format_string<Args...> format, Args&&... args) {
        get()->debug(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> format, Args&&... args) {
        get()->info(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(fmt::format_string<Args...> format, Args&&... args) {
        get()->warn(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> format, Args&&... args) {
        get()->error(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(fmt::format_string<Args...> format, Args&&... args) {
        get()->critical(format, std::forward<Args>(args)...);
    }

private:
    Logger() = default;

    // Components log before main() has set up sinks in tests and tools,
    // so an uninitialized logger falls back to spdlog's default console logger.
    spdlog::logger* get() const {
        return logger_ ? logger_.get() : spdlog::default_logger_raw();
    }

    std::shared_ptr<spdlog::logger> logger_;
};

// Convenience macros
#define FERRY_TRACE(...) Ferry::Logger::instance().trace(__VA_ARGS__)
#define FERRY_DEBUG(...) Ferry::Logger::instance().debug(__VA_ARGS__)
#define FERRY_INFO(...) Ferry::Logger::instance().info(__VA_ARGS__)
#define FERRY_WARN(...) Ferry::Logger::instance().warn(__VA_ARGS__)
#define FERRY_ERROR(...) Ferry::Logger::instance().error(__VA_ARGS__)
#define FERRY_CRITICAL(...) Ferry::Logger::instance().critical(__VA_ARGS__)

} // namespace Ferry
