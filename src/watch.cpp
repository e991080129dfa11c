#include "watch.hpp"

namespace cmdb {

std::string to_string(WatchEventType type) {
    switch (type) {
        case WatchEventType::create: return "CREATE";
        case WatchEventType::update: return "UPDATE";
        case WatchEventType::remove: return "DELETE";
        case WatchEventType::error:  return "ERROR";
    }
    return "<invalid>";
}

void decode(const WatchEvent& event, Object& target) {
    if (event.type == WatchEventType::error) {
        throw DecodeError("ERROR event on " + event.key + " carries no payload");
    }
    decode_object(event.value, target);
}

// ── Waker ───────────────────────────────────────────────────────────

void Waker::notify() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_ = true;
    }
    cv_.notify_one();
}

// ── WatchChannel ────────────────────────────────────────────────────

void WatchChannel::wake_locked() {
    cv_.notify_one();
    if (waker_) waker_->notify();
}

bool WatchChannel::try_push(WatchEvent event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!accepting_ || queue_.size() >= capacity_) return false;
    queue_.push_back(std::move(event));
    wake_locked();
    return true;
}

void WatchChannel::fail(WatchEvent event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!accepting_) return;
    accepting_ = false;
    queue_.push_back(std::move(event));
    wake_locked();
}

std::optional<WatchEvent> WatchChannel::try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) return std::nullopt;
    WatchEvent ev = std::move(queue_.front());
    queue_.pop_front();
    return ev;
}

std::optional<WatchEvent> WatchChannel::pop_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) return std::nullopt;
    WatchEvent ev = std::move(queue_.front());
    queue_.pop_front();
    return ev;
}

void WatchChannel::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    accepting_ = false;
    queue_.clear();
    cv_.notify_all();
}

bool WatchChannel::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool WatchChannel::accepting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accepting_;
}

std::size_t WatchChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void WatchChannel::set_waker(std::shared_ptr<Waker> waker) {
    std::lock_guard<std::mutex> lock(mutex_);
    waker_ = std::move(waker);
    if (waker_ && !queue_.empty()) waker_->notify();
}

// ── ChannelWatcher ──────────────────────────────────────────────────

void ChannelWatcher::close() {
    std::call_once(closed_, [this] {
        channel_->close();
        if (on_close_) on_close_();
    });
}

} // namespace cmdb
