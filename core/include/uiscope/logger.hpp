#pragma once
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace uiscope {

enum class LogLevel : std::uint8_t {
    TRACE = 0,
    DEBUG,
    INFO,
    WARN,
    ERR
};

struct LogMessage {
    LogLevel level;
    std::string timestamp;
    std::string thread;
    std::string message;
};

const char* level_to_str(LogLevel level);
std::optional<LogLevel> parse_log_level(std::string_view s);

class Logger {
public:
    static Logger& get();

    bool should_log(LogLevel level) const;
    void log(LogLevel level, const std::string& msg);
    std::vector<LogMessage> get_recent_logs(size_t count = 100);
    void set_level(LogLevel level);
    LogLevel level() const;

    // Stops writing to stderr; the recent-log buffer keeps filling.
    void set_quiet(bool quiet);

private:
    Logger() = default;
    mutable std::mutex mu_;
    LogLevel min_level_ = LogLevel::INFO;
    bool quiet_ = false;
    std::vector<LogMessage> buffer_;
    static constexpr size_t MAX_LOGS = 256;
};

#define LOG_AT_LEVEL(level, msg) \
    do { if (uiscope::Logger::get().should_log(level)) uiscope::Logger::get().log(level, msg); } while(0)

#define LOG_TRACE(msg) LOG_AT_LEVEL(uiscope::LogLevel::TRACE, msg)
#define LOG_DEBUG(msg) LOG_AT_LEVEL(uiscope::LogLevel::DEBUG, msg)
#define LOG_INFO(msg)  LOG_AT_LEVEL(uiscope::LogLevel::INFO, msg)
#define LOG_WARN(msg)  LOG_AT_LEVEL(uiscope::LogLevel::WARN, msg)
#define LOG_ERROR(msg) LOG_AT_LEVEL(uiscope::LogLevel::ERR, msg)

} // namespace uiscope
