#include "commands.hpp"
#include "config.hpp"
#include "server.hpp"
#include "storage.hpp"
#include "executor.hpp"
#include "jobs.hpp"
#include "log.hpp"
#include <iostream>
#include <csignal>
#include <atomic>
#include <thread>
#include <chrono>

namespace cmdb {

static std::atomic<bool> g_interrupted{false};

static void signal_handler(int) {
    g_interrupted = true;
}

int cmd_serve(const std::string& config_path) {
    Config cfg;
    try {
        cfg = Config::load(config_path);
        cfg.validate();
    } catch (const ConfigError& e) {
        std::cerr << "[serve] " << e.what() << "\n";
        return 1;
    }

    LoggerPtr logger;
    StoragePtr storage;
    try {
        logger = std::make_shared<Logger>(parse_log_level(cfg.log.level), cfg.log.output);
        storage = make_storage(cfg.database);
    } catch (const std::exception& e) {
        std::cerr << "[serve] " << e.what() << "\n";
        return 1;
    }

    ServerOptions options;
    options.revalidate_interval = std::chrono::seconds(cfg.scheduler.revalidate_seconds);
    options.dispatch_workers = static_cast<std::size_t>(cfg.scheduler.dispatch_workers);
    options.dispatch_queue = static_cast<std::size_t>(cfg.scheduler.dispatch_queue);
    options.drain_on_stop = cfg.scheduler.drain_on_stop;

    HandlerOptions handler_options;
    handler_options.discovery_attempts = cfg.scheduler.discovery_retries;
    handler_options.discovery_backoff = std::chrono::milliseconds(cfg.scheduler.discovery_backoff_ms);
    handler_options.zones = cfg.discovery_zones;

    Server server(cfg.scheduler.expression, options);
    server.prepare(storage, logger, handler_options);

    std::vector<std::shared_ptr<QueueExecutor>> executors;
    for (int i = 0; i < cfg.executor.workers; ++i) {
        auto exec = std::make_shared<QueueExecutor>(
            "executor-" + std::to_string(i),
            make_digest_job(storage, logger),
            make_discovery_job(storage, logger),
            std::chrono::seconds(cfg.executor.timeout),
            logger,
            static_cast<std::size_t>(cfg.executor.queue));
        exec->start();
        server.handler().register_executor(exec);
        executors.push_back(exec);
    }
    logger->info("serve", "Registered " + std::to_string(executors.size()) + " executor(s), schedule \"" +
                          cfg.scheduler.expression + "\"");

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // Turns a signal into Server::stop(); also exits once serve() returns.
    auto finished = server.subscribe();
    std::thread signal_watch([&server, &finished] {
        while (finished.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
            if (g_interrupted) {
                server.stop();
                return;
            }
        }
    });

    int code = 0;
    try {
        ShutdownReason reason = server.serve();
        code = reason == ShutdownReason::stopped ? 0 : 2;
    } catch (const WatchEstablishmentError& e) {
        logger->error("serve", e.what());
        code = 1;
    } catch (const std::exception& e) {
        logger->error("serve", std::string("Scheduler failed: ") + e.what());
        code = 2;
    }

    signal_watch.join();
    for (auto& exec : executors) exec->stop();
    storage->close();
    logger->info("serve", "Done.");
    logger->sync();
    return code;
}

} // namespace cmdb
