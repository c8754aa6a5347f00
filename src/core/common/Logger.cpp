#include "Logger.hpp"
#include <spdlog/pattern_formatter.h>

namespace Scribe {

namespace {
const char* kLoggerName = "scribe";
const char* kConsoleLoggerName = "scribe_console";
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& logFilePath, Level level) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFilePath, 1024 * 1024 * 5, 3); // 5MB, 3 files

        console_sink->set_pattern("[%H:%M:%S] [%^%l%$] [%t] %v");
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%f] [%l] [%t] %v");

        spdlog::drop(kLoggerName);
        logger_ = std::make_shared<spdlog::logger>(kLoggerName,
            spdlog::sinks_init_list{console_sink, file_sink});
        logger_->set_level(static_cast<spdlog::level::level_enum>(level));
        logger_->flush_on(spdlog::level::warn);

        spdlog::register_logger(logger_);

        logger_->info("Logger initialized with file: {}", logFilePath);

    } catch (const spdlog::spdlog_ex& ex) {
        logger_ = spdlog::get(kConsoleLoggerName);
        if (!logger_) {
            logger_ = spdlog::stdout_color_mt(kConsoleLoggerName);
        }
        logger_->set_level(static_cast<spdlog::level::level_enum>(level));
        logger_->error("Logger initialization failed: {}", ex.what());
    }
}

void Logger::setLevel(Level level) {
    get()->set_level(static_cast<spdlog::level::level_enum>(level));
}

void Logger::flush() {
    get()->flush();
}

std::shared_ptr<spdlog::logger> Logger::get() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logger_) {
        logger_ = spdlog::get(kConsoleLoggerName);
        if (!logger_) {
            logger_ = spdlog::stdout_color_mt(kConsoleLoggerName);
        }
    }
    return logger_;
}

} // namespace Scribe
