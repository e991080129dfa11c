#pragma once
#include "object.hpp"
#include "log.hpp"
#include <string>
#include <deque>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <chrono>
#include <memory>
#include <cstddef>

namespace cmdb {

// Worker that refreshes machine information. The scheduler only hands
// work over; the entry points must return quickly.
class Executor {
public:
    virtual ~Executor() = default;
    virtual void notify_digest(const MachineDigest& digest) = 0;
    virtual void notify_discovered_machines(const DiscoveredMachines& latest) = 0;
};

using ExecutorPtr = std::shared_ptr<Executor>;

constexpr std::size_t default_executor_queue = 256;

// Executor with its own thread and a bounded job queue. The job bodies are
// supplied by the caller. Jobs arriving while the queue is full are dropped.
class QueueExecutor : public Executor {
public:
    using DigestJob = std::function<void(const MachineDigest&)>;
    using DiscoveryJob = std::function<void(const DiscoveredMachines&)>;

    QueueExecutor(std::string name, DigestJob on_digest, DiscoveryJob on_discovery,
                  std::chrono::seconds timeout, LoggerPtr logger,
                  std::size_t queue_limit = default_executor_queue);
    ~QueueExecutor() override;

    QueueExecutor(const QueueExecutor&) = delete;
    QueueExecutor& operator=(const QueueExecutor&) = delete;

    void start();
    // Finishes the job in progress, drops the rest and joins.
    void stop();

    void notify_digest(const MachineDigest& digest) override;
    void notify_discovered_machines(const DiscoveredMachines& latest) override;

    const std::string& name() const { return name_; }
    std::size_t processed() const;
    std::size_t dropped() const;

private:
    struct Job {
        std::string what;
        std::function<void()> run;
    };

    std::string name_;
    DigestJob on_digest_;
    DiscoveryJob on_discovery_;
    std::chrono::seconds timeout_;
    LoggerPtr logger_;
    std::size_t queue_limit_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Job> jobs_;
    std::thread thread_;
    bool running_ = false;
    std::size_t processed_ = 0;
    std::size_t dropped_ = 0;

    void enqueue(Job job);
    void run_loop();
};

} // namespace cmdb
