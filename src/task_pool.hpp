#pragma once
#include "log.hpp"
#include <string>
#include <deque>
#include <vector>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <cstddef>

namespace cmdb {

// Fixed set of worker threads over a bounded FIFO. submit() never blocks:
// when the queue is full the task is refused.
class TaskPool {
public:
    using Task = std::function<void()>;

    TaskPool(std::size_t workers, std::size_t capacity, LoggerPtr logger);
    ~TaskPool();

    TaskPool(const TaskPool&) = delete;
    TaskPool& operator=(const TaskPool&) = delete;

    bool submit(const std::string& name, Task task);

    // Stops accepting work and joins the workers. With drain the queued
    // tasks still run first, otherwise they are discarded. Returns the
    // number of discarded tasks. Later calls return 0.
    std::size_t shutdown(bool drain);

    // Blocks until the queue is empty and no task is running.
    void wait_idle();

    std::size_t pending() const;
    std::size_t completed() const;
    bool accepting() const;

private:
    struct Entry {
        std::string name;
        Task task;
    };

    const std::size_t capacity_;
    LoggerPtr logger_;
    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::deque<Entry> queue_;
    std::vector<std::thread> workers_;
    std::size_t running_ = 0;
    std::size_t completed_ = 0;
    bool accepting_ = true;
    bool stopping_ = false;

    void worker_loop();
};

} // namespace cmdb
