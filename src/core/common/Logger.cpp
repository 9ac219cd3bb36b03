#include "Logger.hpp"
#include <spdlog/pattern_formatter.h>

#include <algorithm>
#include <cctype>
#include <mutex>

namespace Attest {

namespace {
std::once_flag fallbackOnce;
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& logFilePath, Level level) {
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern("[%H:%M:%S] [%^%l%$] [%t] %v");

        if (!logFilePath.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFilePath, 1024 * 1024 * 5, 3); // 5MB, 3 files
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%f] [%l] [%t] %v");
            logger_ = std::make_shared<spdlog::logger>("attest",
                spdlog::sinks_init_list{console_sink, file_sink});
        } else {
            logger_ = std::make_shared<spdlog::logger>("attest", console_sink);
        }

        setLevel(level);

        spdlog::drop("attest");
        spdlog::register_logger(logger_);

        if (!logFilePath.empty()) {
            ATTEST_INFO("Logger initialized with file: {}", logFilePath);
        }

    } catch (const spdlog::spdlog_ex& ex) {
        // Fallback to console only
        logger_ = std::make_shared<spdlog::logger>(
            "attest_fallback", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        logger_->error("Logger initialization failed: {}", ex.what());
    }
}

void Logger::setLevel(Level level) {
    if (logger_) {
        logger_->set_level(static_cast<spdlog::level::level_enum>(level));
    }
}

Logger::Level Logger::parseLevel(const std::string& name, Level fallback) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "trace") return Level::Trace;
    if (lowered == "debug") return Level::Debug;
    if (lowered == "info") return Level::Info;
    if (lowered == "warn" || lowered == "warning") return Level::Warn;
    if (lowered == "error") return Level::Error;
    if (lowered == "critical") return Level::Critical;
    return fallback;
}

std::shared_ptr<spdlog::logger> Logger::get() {
    // Components may log before main() configured sinks (tests, library use)
    std::call_once(fallbackOnce, [this]() {
        if (!logger_) {
            logger_ = std::make_shared<spdlog::logger>(
                "attest_default", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
            logger_->set_level(spdlog::level::warn);
        }
    });
    return logger_;
}

} // namespace Attest
