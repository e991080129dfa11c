#include "executor.hpp"
#include <stdexcept>

namespace cmdb {

QueueExecutor::QueueExecutor(std::string name, DigestJob on_digest, DiscoveryJob on_discovery,
                             std::chrono::seconds timeout, LoggerPtr logger,
                             std::size_t queue_limit)
    : name_(std::move(name))
    , on_digest_(std::move(on_digest))
    , on_discovery_(std::move(on_discovery))
    , timeout_(timeout)
    , logger_(std::move(logger))
    , queue_limit_(queue_limit)
{
    if (queue_limit_ == 0) {
        throw std::invalid_argument("QueueExecutor needs at least one queue slot");
    }
}

QueueExecutor::~QueueExecutor() {
    stop();
}

void QueueExecutor::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) return;
    running_ = true;
    thread_ = std::thread(&QueueExecutor::run_loop, this);
}

void QueueExecutor::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
        if (!jobs_.empty()) {
            logger_->warn(name_, "Dropping " + std::to_string(jobs_.size()) + " queued job(s) on stop");
            jobs_.clear();
        }
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

void QueueExecutor::notify_digest(const MachineDigest& digest) {
    enqueue(Job{"digest " + digest.guid, [this, digest] {
        if (on_digest_) on_digest_(digest);
    }});
}

void QueueExecutor::notify_discovered_machines(const DiscoveredMachines& latest) {
    enqueue(Job{"discovery (" + latest.state + ")", [this, latest] {
        if (on_discovery_) on_discovery_(latest);
    }});
}

std::size_t QueueExecutor::processed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return processed_;
}

std::size_t QueueExecutor::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

void QueueExecutor::enqueue(Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            logger_->warn(name_, "Not running, ignoring " + job.what);
            return;
        }
        if (jobs_.size() >= queue_limit_) {
            ++dropped_;
            logger_->warn(name_, "Queue full (" + std::to_string(queue_limit_) + "), dropping " + job.what);
            return;
        }
        jobs_.push_back(std::move(job));
    }
    cv_.notify_one();
}

void QueueExecutor::run_loop() {
    logger_->debug(name_, "Started");
    for (;;) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !running_ || !jobs_.empty(); });
            if (!running_) break;
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }

        logger_->info(name_, "Running " + job.what);
        auto begin = std::chrono::steady_clock::now();
        try {
            job.run();
        } catch (const std::exception& e) {
            logger_->error(name_, job.what + " failed: " + e.what());
        } catch (...) {
            logger_->error(name_, job.what + " failed with an unknown exception");
        }
        auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - begin);
        if (timeout_.count() > 0 && elapsed > timeout_) {
            logger_->warn(name_, job.what + " overran its timeout (" + std::to_string(elapsed.count()) +
                                 "s > " + std::to_string(timeout_.count()) + "s)");
        }

        std::lock_guard<std::mutex> lock(mutex_);
        ++processed_;
    }
    logger_->debug(name_, "Stopped");
}

} // namespace cmdb
