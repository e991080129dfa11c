#pragma once
#include "storage.hpp"
#include "executor.hpp"
#include "watch.hpp"
#include "log.hpp"
#include <string>
#include <vector>
#include <random>
#include <mutex>
#include <atomic>
#include <chrono>
#include <cstdint>

namespace cmdb {

enum class DiscoveryResult {
    updated,          // existing record marked Started
    created,          // record did not exist and was created
    internal_error,   // storage failed unexpectedly, abandoned for this tick
    exhausted,        // every attempt failed with a retryable error
};

const char* to_string(DiscoveryResult r);

struct HandlerOptions {
    int discovery_attempts = 5;
    std::chrono::milliseconds discovery_backoff{200};
    std::vector<std::string> zones;
};

// Carries out what the scheduler decides: periodic storage writes and the
// hand-off of watched objects to executors.
class Handler {
public:
    Handler(StoragePtr storage, LoggerPtr logger, HandlerOptions options = {});
    Handler(StoragePtr storage, LoggerPtr logger, HandlerOptions options, uint64_t seed);

    Handler(const Handler&) = delete;
    Handler& operator=(const Handler&) = delete;

    // Setup only. Throws std::logic_error once the pool is frozen.
    void register_executor(ExecutorPtr exec);
    // Called by the server before its loop starts.
    void freeze() { frozen_ = true; }
    std::size_t executor_count() const { return executors_.size(); }

    // Returns false if storage refused the new digest.
    bool create_digest_on_schedule();

    DiscoveryResult run_discovery_on_schedule();

    // Return true when the decoded object reached an executor.
    bool on_digest_event(const WatchEvent& event);
    bool on_discovery_event(const WatchEvent& event);

private:
    StoragePtr storage_;
    LoggerPtr logger_;
    HandlerOptions options_;
    std::vector<ExecutorPtr> executors_;
    std::atomic<bool> frozen_{false};

    std::mutex rng_mutex_;
    std::mt19937_64 rng_;

    Executor* pick_executor();
};

} // namespace cmdb
