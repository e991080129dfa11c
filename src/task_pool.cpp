#include "task_pool.hpp"
#include <stdexcept>

namespace cmdb {

TaskPool::TaskPool(std::size_t workers, std::size_t capacity, LoggerPtr logger)
    : capacity_(capacity), logger_(std::move(logger)) {
    if (workers == 0 || capacity == 0) {
        throw std::invalid_argument("TaskPool needs at least one worker and one queue slot");
    }
    workers_.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

TaskPool::~TaskPool() {
    shutdown(false);
}

bool TaskPool::submit(const std::string& name, Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accepting_ || queue_.size() >= capacity_) return false;
        queue_.push_back(Entry{name, std::move(task)});
    }
    work_cv_.notify_one();
    return true;
}

std::size_t TaskPool::shutdown(bool drain) {
    std::size_t discarded = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return 0;
        accepting_ = false;
        stopping_ = true;
        if (!drain) {
            discarded = queue_.size();
            queue_.clear();
        }
    }
    work_cv_.notify_all();
    for (auto& w : workers_) {
        if (w.joinable()) w.join();
    }
    idle_cv_.notify_all();
    return discarded;
}

void TaskPool::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return queue_.empty() && running_ == 0; });
}

std::size_t TaskPool::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

std::size_t TaskPool::completed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_;
}

bool TaskPool::accepting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accepting_;
}

void TaskPool::worker_loop() {
    for (;;) {
        Entry entry;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) return;   // stopping and drained
            entry = std::move(queue_.front());
            queue_.pop_front();
            ++running_;
        }

        try {
            entry.task();
        } catch (const std::exception& e) {
            if (logger_) logger_->error("pool", "Task " + entry.name + " failed: " + e.what());
        } catch (...) {
            if (logger_) logger_->error("pool", "Task " + entry.name + " failed with an unknown exception");
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --running_;
            ++completed_;
        }
        idle_cv_.notify_all();
    }
}

} // namespace cmdb
