#include "server.hpp"
#include "utils.hpp"
#include <algorithm>

namespace cmdb {

const char* to_string(ShutdownReason r) {
    switch (r) {
        case ShutdownReason::stopped:              return "stopped";
        case ShutdownReason::machine_watch_failed: return "machine_watch_failed";
        case ShutdownReason::digest_watch_failed:  return "digest_watch_failed";
    }
    return "unknown";
}

const char* to_string(ServerState s) {
    switch (s) {
        case ServerState::init:     return "init";
        case ServerState::running:  return "running";
        case ServerState::stopping: return "stopping";
        case ServerState::stopped:  return "stopped";
    }
    return "unknown";
}

Server::Server(const std::string& expression, ServerOptions options)
    : Server(parse_schedule(expression), options)
{}

Server::Server(ScheduleOraclePtr schedule, ServerOptions options)
    : schedule_(std::move(schedule)), options_(options) {
    if (!schedule_) {
        throw std::invalid_argument("Server needs a schedule");
    }
    if (options_.revalidate_interval.count() <= 0) {
        options_.revalidate_interval = std::chrono::minutes(1);
    }
    if (options_.dispatch_workers < 1 || options_.dispatch_queue < 1) {
        throw std::invalid_argument("Server needs at least one dispatch worker and one queue slot");
    }
}

Server::~Server() {
    close_watchers();
}

void Server::prepare(StoragePtr storage, LoggerPtr logger, HandlerOptions handler_options) {
    if (serving_) {
        throw std::logic_error("prepare() must be called before serve()");
    }
    storage_ = std::move(storage);
    logger_ = std::move(logger);
    handler_ = std::make_unique<Handler>(storage_, logger_, std::move(handler_options));
}

Handler& Server::handler() {
    if (!handler_) throw std::logic_error("Server::prepare() has not been called");
    return *handler_;
}

std::future<ShutdownReason> Server::subscribe() {
    std::lock_guard<std::mutex> lock(sub_mutex_);
    std::promise<ShutdownReason> p;
    auto f = p.get_future();
    if (final_error_) {
        p.set_exception(final_error_);
    } else if (final_reason_) {
        p.set_value(*final_reason_);
    } else {
        subscribers_.push_back(std::move(p));
    }
    return f;
}

std::size_t Server::subscriber_count() const {
    std::lock_guard<std::mutex> lock(sub_mutex_);
    return subscribers_.size();
}

void Server::notify_subscribers(std::optional<ShutdownReason> reason, std::exception_ptr error) {
    std::vector<std::promise<ShutdownReason>> subs;
    {
        std::lock_guard<std::mutex> lock(sub_mutex_);
        final_reason_ = reason;
        final_error_ = error;
        subs.swap(subscribers_);
    }
    // Registration order.
    for (auto& p : subs) {
        if (error) {
            p.set_exception(error);
        } else {
            p.set_value(*reason);
        }
    }
}

void Server::stop() {
    if (stop_requested_.exchange(true)) return;
    waker_->notify();
}

// ── Watches ─────────────────────────────────────────────────────────

void Server::open_watchers() {
    try {
        machine_observer_ = storage_->watch(Machine(), WatchMode::kind);
        digest_observer_ = storage_->watch(MachineDigest(), WatchMode::kind);
        auto_disc_observer_ = storage_->watch(DiscoveredMachines(), WatchMode::name);
    } catch (const StorageError& e) {
        close_watchers();
        throw WatchEstablishmentError(std::string("Could not establish watch: ") + e.what());
    } catch (...) {
        close_watchers();
        throw;
    }
    machine_observer_->output().set_waker(waker_);
    digest_observer_->output().set_waker(waker_);
    auto_disc_observer_->output().set_waker(waker_);
}

// The store drops a by-name registration once it reports ERROR on it, so
// the old stream is dead. Without a fresh watch discovery updates are lost.
void Server::reopen_auto_disc_watch() {
    if (auto_disc_observer_) {
        auto_disc_observer_->close();
        auto_disc_observer_.reset();
    }
    try {
        auto_disc_observer_ = storage_->watch(DiscoveredMachines(), WatchMode::name);
    } catch (const StorageError& e) {
        logger_->warn("scheduler", std::string("Could not re-establish discovery watch, "
                                               "discovery updates are no longer followed: ") + e.what());
        return;
    }
    auto_disc_observer_->output().set_waker(waker_);
    ++auto_disc_reopens_;
    logger_->info("scheduler", "Discovery watch re-established");
}

void Server::close_watchers() {
    for (auto* w : {&machine_observer_, &digest_observer_, &auto_disc_observer_}) {
        if (*w) {
            (*w)->close();
            w->reset();
        }
    }
}

// ── Timer ───────────────────────────────────────────────────────────

bool Server::arm_timer() {
    auto now = Clock::now();
    auto next = schedule_->next(now);
    if (!next) {
        indefinite_ = true;
        ++revalidations_;
        deadline_ = SteadyClock::now() + options_.revalidate_interval;
        logger_->debug("scheduler", "Schedule has no next activation, revalidating in " +
                                    std::to_string(options_.revalidate_interval.count()) + "ms");
        return false;
    }
    if (indefinite_) {
        logger_->info("scheduler", "Schedule has a next activation again");
        indefinite_ = false;
    }
    auto remaining = std::max(Clock::duration::zero(), *next - now);
    deadline_ = SteadyClock::now() + std::chrono::duration_cast<SteadyClock::duration>(remaining);
    logger_->debug("scheduler", "Next activation at " + format_time(*next));
    return true;
}

void Server::on_timer() {
    if (!arm_timer()) return;
    ++ticks_;
    Handler* h = handler_.get();
    dispatch("create-digest", [h] { h->create_digest_on_schedule(); });
    dispatch("auto-discovery", [h] { h->run_discovery_on_schedule(); });
}

// ── Events ──────────────────────────────────────────────────────────

std::optional<ShutdownReason> Server::on_machine_event(const WatchEvent& event) {
    switch (event.type) {
        case WatchEventType::remove:
            // Reserved: machine removal has no cleanup action yet.
            logger_->debug("scheduler", "Machine deleted: " + event.key);
            break;
        case WatchEventType::error:
            logger_->error("scheduler", "Machine watch reported an error, shutting down");
            return ShutdownReason::machine_watch_failed;
        default:
            break;
    }
    return std::nullopt;
}

std::optional<ShutdownReason> Server::on_digest_event(const WatchEvent& event) {
    switch (event.type) {
        case WatchEventType::create: {
            Handler* h = handler_.get();
            dispatch("refresh-digest", [h, event] { h->on_digest_event(event); });
            break;
        }
        case WatchEventType::error:
            logger_->error("scheduler", "Digest watch reported an error, shutting down");
            return ShutdownReason::digest_watch_failed;
        default:
            break;
    }
    return std::nullopt;
}

void Server::on_auto_disc_event(const WatchEvent& event) {
    switch (event.type) {
        case WatchEventType::create:
        case WatchEventType::update: {
            Handler* h = handler_.get();
            dispatch("refresh-discovery", [h, event] { h->on_discovery_event(event); });
            break;
        }
        case WatchEventType::error:
            logger_->warn("scheduler", "Discovery watch reported an error, re-establishing it");
            reopen_auto_disc_watch();
            break;
        default:
            break;
    }
}

void Server::dispatch(const std::string& name, TaskPool::Task task) {
    if (pool_->submit(name, std::move(task))) {
        ++dispatched_;
        return;
    }
    ++dropped_;
    logger_->warn("scheduler", "Dispatch queue full, dropping " + name);
}

// ── Loop ────────────────────────────────────────────────────────────

ShutdownReason Server::run_loop() {
    WatchChannel& machines = machine_observer_->output();
    WatchChannel& digests = digest_observer_->output();

    for (;;) {
        if (stop_requested_) return ShutdownReason::stopped;

        bool busy = false;
        if (auto ev = machines.try_pop()) {
            busy = true;
            if (auto reason = on_machine_event(*ev)) return *reason;
        }
        if (auto ev = digests.try_pop()) {
            busy = true;
            if (auto reason = on_digest_event(*ev)) return *reason;
        }
        // Re-read each pass: an ERROR replaces the discovery watch.
        std::optional<WatchEvent> ev;
        if (auto_disc_observer_) ev = auto_disc_observer_->output().try_pop();
        if (ev) {
            busy = true;
            on_auto_disc_event(*ev);
        }
        if (SteadyClock::now() >= deadline_) {
            busy = true;
            on_timer();
        }
        if (!busy) waker_->wait_until(deadline_);
    }
}

void Server::release(const char* outcome) {
    state_ = ServerState::stopping;
    close_watchers();
    if (pool_) {
        std::size_t discarded = pool_->shutdown(options_.drain_on_stop);
        if (discarded > 0) {
            logger_->warn("scheduler", "Cancelled " + std::to_string(discarded) + " pending dispatch(es)");
        }
    }
    logger_->info("scheduler", std::string("Stopped (") + outcome + ")");
    logger_->sync();
}

ShutdownReason Server::serve() {
    if (!storage_ || !handler_) {
        throw std::logic_error("Server::prepare() must be called before serve()");
    }
    if (serving_.exchange(true)) {
        throw std::logic_error("Server::serve() may only be called once");
    }
    handler_->freeze();

    ShutdownReason reason;
    try {
        pool_ = std::make_unique<TaskPool>(options_.dispatch_workers, options_.dispatch_queue, logger_);
        open_watchers();
        arm_timer();
        state_ = ServerState::running;
        logger_->info("scheduler", "Started with " + std::to_string(handler_->executor_count()) + " executor(s)");
        reason = run_loop();
    } catch (const std::exception& e) {
        logger_->error("scheduler", std::string("Scheduler aborted: ") + e.what());
        abort_serve(std::current_exception());
        throw;
    } catch (...) {
        logger_->error("scheduler", "Scheduler aborted by an unknown exception");
        abort_serve(std::current_exception());
        throw;
    }

    // The timer is a plain deadline; leaving the loop disarms it.
    release(to_string(reason));
    state_ = ServerState::stopped;
    notify_subscribers(reason, nullptr);
    return reason;
}

void Server::abort_serve(std::exception_ptr error) {
    release("failed");
    state_ = ServerState::stopped;
    notify_subscribers(std::nullopt, error);
}

} // namespace cmdb
