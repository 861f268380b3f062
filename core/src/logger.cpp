#include "uiscope/logger.hpp"
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

#ifdef _WIN32
#include <windows.h>
#endif

namespace uiscope {

const char* level_to_str(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERR:   return "ERROR";
        default: return "UNKNOWN";
    }
}

std::optional<LogLevel> parse_log_level(std::string_view s) {
    if (s == "TRACE" || s == "trace") return LogLevel::TRACE;
    if (s == "DEBUG" || s == "debug") return LogLevel::DEBUG;
    if (s == "INFO" || s == "info") return LogLevel::INFO;
    if (s == "WARN" || s == "warn") return LogLevel::WARN;
    if (s == "ERROR" || s == "error") return LogLevel::ERR;
    return std::nullopt;
}

static std::string format_local_time(std::time_t t) {
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %X");
    return ss.str();
}

Logger& Logger::get() {
    // Never destroyed: capture workers abandoned at a timeout may still log
    // while the process exits.
    static Logger *instance = new Logger;
    return *instance;
}

bool Logger::should_log(LogLevel level) const {
    std::lock_guard<std::mutex> lk(mu_);
    return level >= min_level_;
}

void Logger::log(LogLevel level, const std::string& msg) {
    auto now = std::chrono::system_clock::now();
    std::string ts = format_local_time(std::chrono::system_clock::to_time_t(now));

    std::ostringstream tid;
    tid << std::this_thread::get_id();

    std::lock_guard<std::mutex> lk(mu_);
    if (level < min_level_)
        return;

    if (!quiet_) {
        std::string formatted = "[" + ts + "] [" + level_to_str(level) + "] [t" +
                                tid.str() + "] " + msg;
        std::cerr << formatted << std::endl;
#ifdef _WIN32
        std::string win_msg = formatted + "\n";
        OutputDebugStringA(win_msg.c_str());
#endif
    }

    buffer_.push_back(LogMessage{level, ts, tid.str(), msg});
    if (buffer_.size() > MAX_LOGS) {
        buffer_.erase(buffer_.begin());
    }
}

std::vector<LogMessage> Logger::get_recent_logs(size_t count) {
    std::lock_guard<std::mutex> lk(mu_);
    if (count >= buffer_.size()) return buffer_;
    return std::vector<LogMessage>(buffer_.end() - count, buffer_.end());
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lk(mu_);
    min_level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lk(mu_);
    return min_level_;
}

void Logger::set_quiet(bool quiet) {
    std::lock_guard<std::mutex> lk(mu_);
    quiet_ = quiet;
}

} // namespace uiscope
