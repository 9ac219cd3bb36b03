#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/core.h>
#include <memory>
#include <string>

namespace Attest {

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

    // Console output goes to stderr so stdout stays free for verdict output.
    // An empty path disables the rotating file sink.
    void initialize(const std::string& logFilePath = std::string(),
                    Level level = Level::Info);

    void setLevel(Level level);
    static Level parseLevel(const std::string& name, Level fallback = Level::Info);

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
    std::shared_ptr<spdlog::logger> get();

    std::shared_ptr<spdlog::logger> logger_;
};

#define ATTEST_TRACE(...) Attest::Logger::instance().trace(__VA_ARGS__)
#define ATTEST_DEBUG(...) Attest::Logger::instance().debug(__VA_ARGS__)
#define ATTEST_INFO(...) Attest::Logger::instance().info(__VA_ARGS__)
#define ATTEST_WARN(...) Attest::Logger::instance().warn(__VA_ARGS__)
#define ATTEST_ERROR(...) Attest::Logger::instance().error(__VA_ARGS__)
#define ATTEST_CRITICAL(...) Attest::Logger::instance().critical(__VA_ARGS__)

} // namespace Attest
