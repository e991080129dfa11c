#pragma once
#include <string>
#include <memory>
#include <mutex>
#include <fstream>
#include <ostream>

namespace cmdb {

enum class LogLevel {
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
};

LogLevel parse_log_level(int level);
const char* to_string(LogLevel level);

// Thread-safe line logger. Every line reads
//   2026-10-19 08:30:00 INFO  [tag] message
// and goes to stderr unless an output directory is configured.
class Logger {
public:
    explicit Logger(LogLevel level = LogLevel::info);
    Logger(LogLevel level, const std::string& output_dir);
    // Writes to a caller-owned stream; used by tests.
    Logger(LogLevel level, std::ostream& sink);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string& tag, const std::string& msg);

    void debug(const std::string& tag, const std::string& msg) { log(LogLevel::debug, tag, msg); }
    void info(const std::string& tag, const std::string& msg)  { log(LogLevel::info, tag, msg); }
    void warn(const std::string& tag, const std::string& msg)  { log(LogLevel::warn, tag, msg); }
    void error(const std::string& tag, const std::string& msg) { log(LogLevel::error, tag, msg); }

    bool enabled(LogLevel level) const { return level >= level_; }
    LogLevel level() const { return level_; }

    void sync();

private:
    LogLevel level_;
    std::mutex mutex_;
    std::ofstream file_;
    std::ostream* out_;
};

using LoggerPtr = std::shared_ptr<Logger>;

} // namespace cmdb
