#include "log.hpp"
#include "utils.hpp"
#include <iostream>
#include <chrono>
#include <stdexcept>

namespace cmdb {

LogLevel parse_log_level(int level) {
    if (level <= 1) return LogLevel::debug;
    if (level >= 4) return LogLevel::error;
    return static_cast<LogLevel>(level);
}

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::debug: return "DEBUG";
        case LogLevel::info:  return "INFO ";
        case LogLevel::warn:  return "WARN ";
        case LogLevel::error: return "ERROR";
    }
    return "?????";
}

Logger::Logger(LogLevel level) : level_(level), out_(&std::cerr) {}

Logger::Logger(LogLevel level, const std::string& output_dir)
    : level_(level), out_(&std::cerr) {
    if (output_dir.empty()) return;
    std::string dir = expand_path(output_dir);
    fs::create_directories(dir);
    std::string path = dir + "/cmdb-scheduler.log";
    file_.open(path, std::ios::app);
    if (!file_) {
        throw std::runtime_error("Failed to open log file: " + path);
    }
    out_ = &file_;
}

Logger::Logger(LogLevel level, std::ostream& sink) : level_(level), out_(&sink) {}

void Logger::log(LogLevel level, const std::string& tag, const std::string& msg) {
    if (!enabled(level)) return;
    std::string line = format_time(std::chrono::system_clock::now());
    line += ' ';
    line += to_string(level);
    line += " [" + tag + "] " + msg + "\n";

    std::lock_guard<std::mutex> lock(mutex_);
    *out_ << line;
    if (level >= LogLevel::warn) out_->flush();
}

void Logger::sync() {
    std::lock_guard<std::mutex> lock(mutex_);
    out_->flush();
}

} // namespace cmdb
