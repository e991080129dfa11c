#include "config.hpp"
#include "schedule.hpp"
#include <fstream>
#include <iostream>

namespace cmdb {

Config Config::make_default() {
    return Config{};
}

void Config::validate() const {
    try {
        parse_schedule(scheduler.expression);
    } catch (const ScheduleParseError& e) {
        throw ConfigError(std::string("scheduler.expression: ") + e.what());
    }
    if (scheduler.revalidate_seconds < 1) throw ConfigError("scheduler.revalidate_seconds must be >= 1");
    if (scheduler.discovery_retries < 1) throw ConfigError("scheduler.discovery_retries must be >= 1");
    if (scheduler.discovery_backoff_ms < 0) throw ConfigError("scheduler.discovery_backoff_ms must be >= 0");
    if (scheduler.dispatch_workers < 1) throw ConfigError("scheduler.dispatch_workers must be >= 1");
    if (scheduler.dispatch_queue < 1) throw ConfigError("scheduler.dispatch_queue must be >= 1");
    if (executor.workers < 1) throw ConfigError("executor.workers must be >= 1");
    if (executor.timeout < 0) throw ConfigError("executor.timeout must be >= 0");
    if (executor.queue < 1) throw ConfigError("executor.queue must be >= 1");
    if (database.adapter.empty()) throw ConfigError("database.adapter is required");
    if (database.path.empty()) throw ConfigError("database.config.path is required");
    if (log.level < 1 || log.level > 4) throw ConfigError("log.level must be between 1 and 4");
}

nlohmann::json Config::to_json() const {
    nlohmann::json j;

    auto& sc = j["scheduler"];
    sc["expression"] = scheduler.expression;
    sc["revalidate_seconds"] = scheduler.revalidate_seconds;
    sc["discovery_retries"] = scheduler.discovery_retries;
    sc["discovery_backoff_ms"] = scheduler.discovery_backoff_ms;
    sc["dispatch_workers"] = scheduler.dispatch_workers;
    sc["dispatch_queue"] = scheduler.dispatch_queue;
    sc["drain_on_stop"] = scheduler.drain_on_stop;

    j["executor"] = {{"workers", executor.workers}, {"timeout", executor.timeout}, {"queue", executor.queue}};

    j["database"]["adapter"] = database.adapter;
    j["database"]["config"]["path"] = database.path;

    j["log"]["level"] = log.level;
    if (!log.output.empty()) j["log"]["output"] = log.output;

    j["discovery"]["zones"] = discovery_zones;
    return j;
}

Config Config::from_json(const nlohmann::json& j) {
    Config c;
    try {
        if (j.contains("scheduler")) {
            auto& sc = j["scheduler"];
            c.scheduler.expression = sc.value("expression", c.scheduler.expression);
            c.scheduler.revalidate_seconds = sc.value("revalidate_seconds", c.scheduler.revalidate_seconds);
            c.scheduler.discovery_retries = sc.value("discovery_retries", c.scheduler.discovery_retries);
            c.scheduler.discovery_backoff_ms = sc.value("discovery_backoff_ms", c.scheduler.discovery_backoff_ms);
            c.scheduler.dispatch_workers = sc.value("dispatch_workers", c.scheduler.dispatch_workers);
            c.scheduler.dispatch_queue = sc.value("dispatch_queue", c.scheduler.dispatch_queue);
            c.scheduler.drain_on_stop = sc.value("drain_on_stop", c.scheduler.drain_on_stop);
        }

        if (j.contains("executor")) {
            auto& ex = j["executor"];
            c.executor.workers = ex.value("workers", c.executor.workers);
            c.executor.timeout = ex.value("timeout", c.executor.timeout);
            c.executor.queue = ex.value("queue", c.executor.queue);
        }

        if (j.contains("database")) {
            auto& db = j["database"];
            c.database.adapter = db.value("adapter", c.database.adapter);
            if (db.contains("config")) {
                c.database.path = db["config"].value("path", c.database.path);
            }
        }

        if (j.contains("log")) {
            auto& lg = j["log"];
            c.log.output = lg.value("output", c.log.output);
            c.log.level = lg.value("level", c.log.level);
        }

        if (j.contains("discovery") && j["discovery"].contains("zones")) {
            c.discovery_zones.clear();
            for (auto& z : j["discovery"]["zones"]) {
                if (z.is_string()) c.discovery_zones.push_back(z.get<std::string>());
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid configuration: ") + e.what());
    }
    return c;
}

Config Config::load(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        std::cerr << "[config] Config not found at " << path << ", using defaults\n";
        return make_default();
    }
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(f);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Failed to parse config " + path + ": " + e.what());
    }
    if (!j.is_object()) {
        throw ConfigError("Config " + path + " must be a JSON object");
    }
    return from_json(j);
}

void Config::save(const std::string& path) const {
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) fs::create_directories(parent);
    std::ofstream f(path);
    if (!f) throw ConfigError("Failed to write config " + path);
    f << to_json().dump(2) << std::endl;
}

} // namespace cmdb
