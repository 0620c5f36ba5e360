// gantry/common/logger.h
#ifndef GANTRY_COMMON_LOGGER_H
#define GANTRY_COMMON_LOGGER_H

#include <cstdint>
#include <string>

namespace gantry {

enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

// Process-wide leveled logger. Lines go to stderr so stdout stays usable for
// command output (`gantry split`, `gantry report`).
class Logger {
public:
    static void set_level(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel level() noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

    // Parses "error", "warn", ... (case-insensitive); unknown names give INFO
    static LogLevel parse_level(const std::string& name) noexcept;

private:
    static LogLevel level_from_env() noexcept;
    static const char* level_name(LogLevel level) noexcept;
};

// Labels the calling thread in log lines (e.g. "job:build", "shard-2")
void set_thread_label(const std::string& label);

} // namespace gantry

#define GANTRY_LOG_ERROR(msg) ::gantry::Logger::error(msg)
#define GANTRY_LOG_WARN(msg)  ::gantry::Logger::warn(msg)
#define GANTRY_LOG_INFO(msg)  ::gantry::Logger::info(msg)
#define GANTRY_LOG_DEBUG(msg) ::gantry::Logger::debug(msg)
#define GANTRY_LOG_TRACE(msg) ::gantry::Logger::trace(msg)

#endif // GANTRY_COMMON_LOGGER_H
