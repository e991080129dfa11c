#pragma once
#include <string>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <chrono>
#include <ctime>
#include <random>
#include <mutex>
#include <cstdio>

namespace cmdb {

namespace fs = std::filesystem;

inline std::string home_dir() {
#ifdef _WIN32
    const char* h = std::getenv("USERPROFILE");
    if (!h) h = std::getenv("HOMEDRIVE");
#else
    const char* h = std::getenv("HOME");
#endif
    return h ? std::string(h) : ".";
}

inline std::string expand_path(const std::string& p) {
    if (p.size() >= 2 && p[0] == '~' && (p[1] == '/' || p[1] == '\\')) {
        return home_dir() + p.substr(1);
    }
    return p;
}

inline std::string default_config_path() {
    return home_dir() + "/.cmdb/config.json";
}

inline std::tm local_tm(std::time_t t) {
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    return tm;
}

inline int64_t epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

inline int64_t epoch_ms_now() {
    return epoch_ms(std::chrono::system_clock::now());
}

// "2026-10-19 08:30:00" in local time
inline std::string format_time(std::chrono::system_clock::time_point tp) {
    std::tm tm = local_tm(std::chrono::system_clock::to_time_t(tp));
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

// Random version 4 UUID, lowercase hex with dashes.
inline std::string new_guid() {
    static std::mutex mu;
    static std::mt19937_64 rng{std::random_device{}()};
    uint64_t hi, lo;
    {
        std::lock_guard<std::mutex> lock(mu);
        hi = rng();
        lo = rng();
    }
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;
    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buf;
}

} // namespace cmdb
