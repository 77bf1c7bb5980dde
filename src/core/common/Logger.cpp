#include "Logger.hpp"
#include <spdlog/pattern_formatter.h>
#include <vector>

namespace Ferry {

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& logFilePath, Level level, bool consoleOutput) {
    if (logger_) {
        spdlog::drop(logger_->name());
        logger_.reset();
    }

    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (consoleOutput) {
            auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            consoleSink->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%t] %v");
            sinks.push_back(consoleSink);
        }

        if (!logFilePath.empty()) {
            auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFilePath, 1024 * 1024 * 5, 3); // 5MB, 3 files
            fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%f] [%l] [%t] %v");
            sinks.push_back(fileSink);
        }

        logger_ = std::make_shared<spdlog::logger>("ferry", sinks.begin(), sinks.end());
        setLevel(level);

        // Warnings and above reach the file even if the process dies right after
        logger_->flush_on(spdlog::level::warn);

        spdlog::register_logger(logger_);

        FERRY_INFO("Logger initialized with file: {}", logFilePath.empty() ? "<none>" : logFilePath);

    } catch (const spdlog::spdlog_ex& ex) {
        logger_ = spdlog::get("ferry_fallback");
        if (!logger_) {
            logger_ = spdlog::stdout_color_mt("ferry_fallback");
        }
        setLevel(level);
        logger_->error("Logger initialization failed: {}", ex.what());
    }
}

void Logger::setLevel(Level level) {
    if (logger_) {
        logger_->set_level(static_cast<spdlog::level::level_enum>(level));
    }
}

Logger::Level Logger::level() const {
    return static_cast<Level>(get()->level());
}

void Logger::flush() {
    get()->flush();
}

} // namespace Ferry
