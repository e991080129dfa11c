#pragma once
#include "object.hpp"
#include <string>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <memory>
#include <optional>
#include <chrono>
#include <cstdint>
#include <cstddef>

namespace cmdb {

// The values match the wire tags used by the storage layer. They are
// never combined.
enum class WatchEventType : uint8_t {
    create = 0x01,
    update = 0x02,
    remove = 0x04,
    error = 0x08,
};

// "CREATE", "UPDATE", "DELETE", "ERROR", or "<invalid>" for anything else.
std::string to_string(WatchEventType type);

enum class WatchMode {
    kind,   // every object of the kind (key prefix)
    name,   // one object (exact key)
};

struct WatchEvent {
    WatchEventType type = WatchEventType::error;
    std::string kind;
    std::string key;
    std::string value;   // JSON payload, empty for ERROR
};

// Parses the payload of event into target. Throws DecodeError.
void decode(const WatchEvent& event, Object& target);

constexpr std::size_t default_watch_channel_size = 100;

// ── Waker ───────────────────────────────────────────────────────────

// Lets one consumer sleep until any of several channels has data or a
// deadline passes.
class Waker {
public:
    void notify();

    // Returns true if woken by notify(), false on deadline. Clears the
    // pending flag either way.
    template <typename Clock, typename Duration>
    bool wait_until(const std::chrono::time_point<Clock, Duration>& deadline) {
        std::unique_lock<std::mutex> lock(mutex_);
        bool woken = cv_.wait_until(lock, deadline, [this] { return pending_; });
        pending_ = false;
        return woken;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool pending_ = false;
};

// ── WatchChannel ────────────────────────────────────────────────────

// Bounded single-consumer queue of watch events.
class WatchChannel {
public:
    explicit WatchChannel(std::size_t capacity = default_watch_channel_size)
        : capacity_(capacity) {}

    WatchChannel(const WatchChannel&) = delete;
    WatchChannel& operator=(const WatchChannel&) = delete;

    // False when the channel is full or no longer accepts events.
    bool try_push(WatchEvent event);

    // Producer side: enqueue a terminal event past capacity and refuse
    // any later push. Events already queued are still delivered.
    void fail(WatchEvent event);

    std::optional<WatchEvent> try_pop();
    std::optional<WatchEvent> pop_for(std::chrono::milliseconds timeout);

    // Consumer side: drop pending events and end the sequence.
    void close();

    bool closed() const;
    bool accepting() const;
    std::size_t size() const;

    void set_waker(std::shared_ptr<Waker> waker);

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<WatchEvent> queue_;
    std::shared_ptr<Waker> waker_;
    bool accepting_ = true;
    bool closed_ = false;

    void wake_locked();
};

// ── Watcher ─────────────────────────────────────────────────────────

class Watcher {
public:
    virtual ~Watcher() = default;
    // Idempotent. The output sequence ends for good.
    virtual void close() = 0;
    virtual WatchChannel& output() = 0;
};

using WatcherPtr = std::unique_ptr<Watcher>;

// Watcher backed by a shared channel. The producer keeps its own reference
// to the channel; on_close runs once on the first close() so the producer
// can unregister.
class ChannelWatcher : public Watcher {
public:
    ChannelWatcher(std::shared_ptr<WatchChannel> channel, std::function<void()> on_close = {})
        : channel_(std::move(channel)), on_close_(std::move(on_close)) {}

    ~ChannelWatcher() override { close(); }

    void close() override;
    WatchChannel& output() override { return *channel_; }

private:
    std::shared_ptr<WatchChannel> channel_;
    std::function<void()> on_close_;
    std::once_flag closed_;
};

} // namespace cmdb
