#pragma once
#include "schedule.hpp"
#include "storage.hpp"
#include "handler.hpp"
#include "task_pool.hpp"
#include "watch.hpp"
#include "log.hpp"
#include <string>
#include <vector>
#include <memory>
#include <future>
#include <mutex>
#include <atomic>
#include <chrono>
#include <optional>
#include <exception>
#include <stdexcept>
#include <cstddef>

namespace cmdb {

enum class ShutdownReason {
    stopped,                // stop() was called
    machine_watch_failed,   // ERROR event on the machine stream
    digest_watch_failed,    // ERROR event on the digest stream
};

const char* to_string(ShutdownReason r);

enum class ServerState {
    init,
    running,
    stopping,
    stopped,
};

const char* to_string(ServerState s);

class WatchEstablishmentError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ServerOptions {
    // Re-poll interval while the schedule has no defined next instant.
    std::chrono::milliseconds revalidate_interval{std::chrono::minutes(1)};
    std::size_t dispatch_workers = 4;
    std::size_t dispatch_queue = 64;
    // Run queued dispatches on exit instead of discarding them.
    bool drain_on_stop = true;
};

// The scheduler server does not listen on any port. It watches machines,
// machine digests and the discovered-machines record, fires digest
// snapshots and discovery sweeps on the configured schedule, and routes
// everything it sees to the Handler.
class Server {
public:
    // Throws ScheduleParseError for a malformed expression.
    explicit Server(const std::string& expression, ServerOptions options = {});
    // Throws std::invalid_argument for zero dispatch workers or queue slots.
    explicit Server(ScheduleOraclePtr schedule, ServerOptions options = {});
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Attaches storage and logger and builds the handler.
    void prepare(StoragePtr storage, LoggerPtr logger, HandlerOptions handler_options = {});

    // Throws std::logic_error before prepare().
    Handler& handler();

    // One-shot completion handle. Resolves with the shutdown reason once
    // serve() has released its resources, or with the exception serve()
    // threw (WatchEstablishmentError when a watch could not be opened).
    std::future<ShutdownReason> subscribe();

    // Runs the loop on the calling thread until stop() or a fatal watch
    // error. Throws WatchEstablishmentError when a watch cannot be opened.
    ShutdownReason serve();

    // Single use; later calls do nothing.
    void stop();

    ServerState state() const { return state_; }
    std::size_t subscriber_count() const;

    std::size_t ticks() const { return ticks_; }
    std::size_t revalidations() const { return revalidations_; }
    std::size_t dispatched() const { return dispatched_; }
    std::size_t dropped() const { return dropped_; }
    std::size_t auto_disc_reopens() const { return auto_disc_reopens_; }

private:
    using SteadyClock = std::chrono::steady_clock;

    ScheduleOraclePtr schedule_;
    ServerOptions options_;
    StoragePtr storage_;
    LoggerPtr logger_;
    std::unique_ptr<Handler> handler_;
    std::unique_ptr<TaskPool> pool_;
    std::shared_ptr<Waker> waker_ = std::make_shared<Waker>();

    WatcherPtr machine_observer_;
    WatcherPtr digest_observer_;
    WatcherPtr auto_disc_observer_;

    std::atomic<ServerState> state_{ServerState::init};
    std::atomic<bool> serving_{false};
    std::atomic<bool> stop_requested_{false};

    mutable std::mutex sub_mutex_;
    std::vector<std::promise<ShutdownReason>> subscribers_;
    std::optional<ShutdownReason> final_reason_;
    std::exception_ptr final_error_;

    SteadyClock::time_point deadline_;
    bool indefinite_ = false;

    std::atomic<std::size_t> ticks_{0};
    std::atomic<std::size_t> revalidations_{0};
    std::atomic<std::size_t> dispatched_{0};
    std::atomic<std::size_t> dropped_{0};
    std::atomic<std::size_t> auto_disc_reopens_{0};

    void open_watchers();
    void close_watchers();
    void reopen_auto_disc_watch();
    bool arm_timer();
    void on_timer();
    std::optional<ShutdownReason> on_machine_event(const WatchEvent& event);
    std::optional<ShutdownReason> on_digest_event(const WatchEvent& event);
    void on_auto_disc_event(const WatchEvent& event);
    void dispatch(const std::string& name, TaskPool::Task task);
    ShutdownReason run_loop();
    void release(const char* outcome);
    void abort_serve(std::exception_ptr error);
    void notify_subscribers(std::optional<ShutdownReason> reason, std::exception_ptr error);
};

} // namespace cmdb
