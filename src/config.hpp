#pragma once
#include <string>
#include <vector>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "utils.hpp"

namespace cmdb {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct SchedulerConfig {
    std::string expression = "@daily";
    int revalidate_seconds = 60;     // re-poll while the schedule is indefinite
    int discovery_retries = 5;
    int discovery_backoff_ms = 200;
    int dispatch_workers = 4;
    int dispatch_queue = 64;
    bool drain_on_stop = true;
};

struct ExecutorConfig {
    int workers = 1;
    int timeout = 3600;              // seconds per task
    int queue = 256;                 // jobs waiting per executor
};

struct DatabaseConfig {
    std::string adapter = "sqlite";
    std::string path = "~/.cmdb/cmdb.db";   // database.config.path
};

struct LogConfig {
    std::string output;              // directory; empty = stderr
    int level = 2;                   // 1 debug, 2 info, 3 warn, 4 error
};

struct Config {
    SchedulerConfig scheduler;
    ExecutorConfig executor;
    DatabaseConfig database;
    LogConfig log;
    std::vector<std::string> discovery_zones = {"default"};

    // Throws ConfigError describing the first invalid value.
    void validate() const;

    static Config make_default();
    // Missing file: defaults. Unreadable or invalid file: ConfigError.
    static Config load(const std::string& path);
    void save(const std::string& path) const;
    nlohmann::json to_json() const;
    static Config from_json(const nlohmann::json& j);
};

} // namespace cmdb
