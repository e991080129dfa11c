#include "handler.hpp"
#include <stdexcept>
#include <thread>

namespace cmdb {

const char* to_string(DiscoveryResult r) {
    switch (r) {
        case DiscoveryResult::updated:        return "updated";
        case DiscoveryResult::created:        return "created";
        case DiscoveryResult::internal_error: return "internal_error";
        case DiscoveryResult::exhausted:      return "exhausted";
    }
    return "unknown";
}

Handler::Handler(StoragePtr storage, LoggerPtr logger, HandlerOptions options)
    : Handler(std::move(storage), std::move(logger), std::move(options), std::random_device{}())
{}

Handler::Handler(StoragePtr storage, LoggerPtr logger, HandlerOptions options, uint64_t seed)
    : storage_(std::move(storage))
    , logger_(std::move(logger))
    , options_(std::move(options))
    , rng_(seed)
{
    if (options_.discovery_attempts < 1) options_.discovery_attempts = 1;
}

void Handler::register_executor(ExecutorPtr exec) {
    if (frozen_) {
        throw std::logic_error("Executors must be registered before the scheduler starts");
    }
    if (!exec) {
        throw std::invalid_argument("Cannot register a null executor");
    }
    executors_.push_back(std::move(exec));
}

Executor* Handler::pick_executor() {
    if (executors_.empty()) return nullptr;
    std::uniform_int_distribution<std::size_t> dist(0, executors_.size() - 1);
    std::lock_guard<std::mutex> lock(rng_mutex_);
    return executors_[dist(rng_)].get();
}

bool Handler::create_digest_on_schedule() {
    logger_->info("handler", "Creating a new digest on schedule");
    MachineDigest digest = new_machine_digest();
    try {
        storage_->create(digest);
    } catch (const StorageError& e) {
        logger_->error("handler", std::string("Could not create new machine digest: ") + e.what());
        return false;
    }
    logger_->debug("handler", "Created digest " + digest.guid);
    return true;
}

DiscoveryResult Handler::run_discovery_on_schedule() {
    logger_->info("handler", "Auto-discovering new machines on preset zones...");
    DiscoveredMachines latest;
    latest.state = discovery_state::started;
    latest.zones = options_.zones;

    bool use_update = true;
    for (int attempt = 1; attempt <= options_.discovery_attempts; ++attempt) {
        try {
            if (use_update) {
                storage_->update(latest);
                return DiscoveryResult::updated;
            }
            storage_->create(latest);
            return DiscoveryResult::created;
        } catch (const StorageError& e) {
            if (is_internal_error(e)) {
                logger_->error("handler", std::string("Could not mark auto-discovery as `Started`: ") + e.what());
                return DiscoveryResult::internal_error;
            }
            logger_->debug("handler", std::string(use_update ? "update" : "create") + " attempt " +
                                      std::to_string(attempt) + " failed: " + e.what());
            // A missing record is created immediately; anything else backs off.
            bool missing = use_update && is_not_found_error(e);
            use_update = e.code() == StorageErrorCode::already_exists;
            latest.guid.clear();
            if (!missing && attempt < options_.discovery_attempts) {
                std::this_thread::sleep_for(options_.discovery_backoff * attempt);
            }
        }
    }
    logger_->error("handler", "Giving up marking auto-discovery as `Started` after " +
                              std::to_string(options_.discovery_attempts) + " attempt(s)");
    return DiscoveryResult::exhausted;
}

bool Handler::on_digest_event(const WatchEvent& event) {
    logger_->info("handler", "Notifying executor to refresh machine information");
    MachineDigest digest;
    try {
        decode(event, digest);
    } catch (const DecodeError& e) {
        logger_->error("handler", std::string("Dropping digest event on ") + event.key + ": " + e.what());
        return false;
    }
    Executor* exec = pick_executor();
    if (!exec) {
        logger_->warn("handler", "No executor registered, dropping digest " + digest.guid);
        return false;
    }
    exec->notify_digest(digest);
    return true;
}

bool Handler::on_discovery_event(const WatchEvent& event) {
    logger_->info("handler", "Notifying executor to refresh discovered machines");
    DiscoveredMachines latest;
    try {
        decode(event, latest);
    } catch (const DecodeError& e) {
        logger_->error("handler", std::string("Dropping discovery event on ") + event.key + ": " + e.what());
        return false;
    }
    Executor* exec = pick_executor();
    if (!exec) {
        logger_->warn("handler", "No executor registered, dropping discovery update");
        return false;
    }
    exec->notify_discovered_machines(latest);
    return true;
}

} // namespace cmdb
