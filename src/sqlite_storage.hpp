#pragma once
#include "storage.hpp"
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <optional>
#include <cstdint>
#include <sqlite3.h>

namespace cmdb {

// Storage adapter over a single SQLite database. Objects are kept as JSON
// rows keyed by Object::key(); every mutation is fanned out to the
// watchers whose scope matches the key.
class SqliteStorage : public Storage {
public:
    // db_path may be ":memory:".
    explicit SqliteStorage(const std::string& db_path,
                           std::size_t watch_channel_size = default_watch_channel_size);
    ~SqliteStorage() override;

    SqliteStorage(const SqliteStorage&) = delete;
    SqliteStorage& operator=(const SqliteStorage&) = delete;

    void create(Object& obj) override;
    void get(Object& obj) override;
    void update(Object& obj) override;
    void remove(const Object& obj) override;
    void list(ObjectListBase& out, const std::vector<std::string>& namespaces = {}) override;
    WatcherPtr watch(const Object& target, WatchMode mode) override;
    void close() override;

    std::size_t watcher_count() const;

private:
    struct Registration {
        uint64_t id;
        WatchMode mode;
        std::string scope;    // key prefix or exact key
        std::shared_ptr<WatchChannel> channel;
    };

    // Shared with the watchers so they can unregister after the storage
    // itself is gone.
    struct Registry {
        std::mutex mutex;
        uint64_t next_id = 1;
        std::vector<Registration> entries;

        void remove(uint64_t id);
    };

    sqlite3* db_ = nullptr;
    mutable std::mutex mutex_;
    std::shared_ptr<Registry> registry_ = std::make_shared<Registry>();
    std::size_t watch_channel_size_;

    void init_db();
    void ensure_open() const;
    std::optional<std::string> load_value(const std::string& key);
    void publish(WatchEventType type, const Object& obj, const std::string& value);
};

} // namespace cmdb
