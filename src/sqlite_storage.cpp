#include "sqlite_storage.hpp"
#include "utils.hpp"
#include <algorithm>

namespace cmdb {

namespace {

// Finalizes the statement on every exit path.
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            throw StorageError(StorageErrorCode::internal,
                               std::string("Failed to prepare statement: ") + sqlite3_errmsg(db));
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int idx, const std::string& v) {
        check(sqlite3_bind_text(stmt_, idx, v.c_str(), -1, SQLITE_TRANSIENT));
    }
    void bind(int idx, int64_t v) {
        check(sqlite3_bind_int64(stmt_, idx, v));
    }

    // SQLITE_ROW or SQLITE_DONE; anything else throws.
    int step() {
        int rc = sqlite3_step(stmt_);
        if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
            StorageErrorCode code = (rc & 0xFF) == SQLITE_CONSTRAINT
                ? StorageErrorCode::already_exists : StorageErrorCode::internal;
            throw StorageError(code, std::string("SQLite step failed: ") + sqlite3_errmsg(db_));
        }
        return rc;
    }

    std::string column_text(int col) {
        const unsigned char* text = sqlite3_column_text(stmt_, col);
        return text ? reinterpret_cast<const char*>(text) : "";
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;

    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw StorageError(StorageErrorCode::internal,
                               std::string("SQLite bind failed: ") + sqlite3_errmsg(db_));
        }
    }
};

bool scope_matches(WatchMode mode, const std::string& scope, const std::string& key) {
    if (mode == WatchMode::name) return key == scope;
    return key.compare(0, scope.size(), scope) == 0;
}

} // namespace

SqliteStorage::SqliteStorage(const std::string& db_path, std::size_t watch_channel_size)
    : watch_channel_size_(watch_channel_size) {
    if (db_path != ":memory:") {
        fs::path parent = fs::path(db_path).parent_path();
        if (!parent.empty()) fs::create_directories(parent);
    }
    int rc = sqlite3_open_v2(db_path.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError(StorageErrorCode::internal, "Failed to open CMDB database: " + msg);
    }
    init_db();
}

SqliteStorage::~SqliteStorage() {
    close();
}

void SqliteStorage::init_db() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS objects (
            key TEXT PRIMARY KEY,
            kind TEXT NOT NULL,
            namespace TEXT NOT NULL DEFAULT '',
            name TEXT NOT NULL,
            guid TEXT NOT NULL UNIQUE,
            value TEXT NOT NULL,
            created_at INTEGER DEFAULT 0,
            updated_at INTEGER DEFAULT 0
        );
        CREATE INDEX IF NOT EXISTS objects_kind ON objects (kind, namespace);
    )";
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw StorageError(StorageErrorCode::internal, "Failed to init CMDB database: " + msg);
    }
}

void SqliteStorage::ensure_open() const {
    if (!db_) throw StorageError(StorageErrorCode::closed, "Storage is closed");
}

std::optional<std::string> SqliteStorage::load_value(const std::string& key) {
    Statement stmt(db_, "SELECT value FROM objects WHERE key = ?");
    stmt.bind(1, key);
    if (stmt.step() != SQLITE_ROW) return std::nullopt;
    return stmt.column_text(0);
}

void SqliteStorage::publish(WatchEventType type, const Object& obj, const std::string& value) {
    std::string key = obj.key();
    std::lock_guard<std::mutex> lock(registry_->mutex);
    auto& entries = registry_->entries;
    for (auto it = entries.begin(); it != entries.end();) {
        if (!scope_matches(it->mode, it->scope, key)) {
            ++it;
            continue;
        }
        if (!it->channel->try_push(WatchEvent{type, obj.kind, key, value})) {
            // Full or closed: the consumer can no longer trust the stream.
            it->channel->fail(WatchEvent{WatchEventType::error, obj.kind, it->scope, ""});
            it = entries.erase(it);
            continue;
        }
        ++it;
    }
}

void SqliteStorage::create(Object& obj) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_open();
    if (obj.name.empty()) {
        throw StorageError(StorageErrorCode::invalid, "Cannot create " + obj.kind + " without a name");
    }
    std::string key = obj.key();
    if (load_value(key)) {
        throw StorageError(StorageErrorCode::already_exists, key + " already exists");
    }
    if (obj.guid.empty()) obj.guid = new_guid();
    obj.creation_timestamp = epoch_ms_now();
    obj.updating_timestamp.reset();
    obj.deleting = false;
    std::string value = obj.to_json().dump();

    Statement stmt(db_, "INSERT INTO objects (key, kind, namespace, name, guid, value, created_at, updated_at) "
                        "VALUES (?, ?, ?, ?, ?, ?, ?, ?)");
    stmt.bind(1, key);
    stmt.bind(2, obj.kind);
    stmt.bind(3, obj.has_namespace() ? obj.ns : std::string());
    stmt.bind(4, obj.name);
    stmt.bind(5, obj.guid);
    stmt.bind(6, value);
    stmt.bind(7, obj.creation_timestamp);
    stmt.bind(8, obj.creation_timestamp);
    stmt.step();

    publish(WatchEventType::create, obj, value);
}

void SqliteStorage::get(Object& obj) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_open();
    std::string key = obj.key();
    auto value = load_value(key);
    if (!value) {
        throw StorageError(StorageErrorCode::not_found, key + " not found");
    }
    try {
        decode_object(*value, obj);
    } catch (const DecodeError& e) {
        throw StorageError(StorageErrorCode::internal, "Corrupted row " + key + ": " + e.what());
    }
}

void SqliteStorage::update(Object& obj) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_open();
    std::string key = obj.key();
    auto stored_value = load_value(key);
    if (!stored_value) {
        throw StorageError(StorageErrorCode::not_found, key + " not found");
    }
    Object stored(obj.kind);
    try {
        stored.from_json(nlohmann::json::parse(*stored_value));
    } catch (const std::exception& e) {
        throw StorageError(StorageErrorCode::internal, "Corrupted row " + key + ": " + e.what());
    }
    if (!obj.guid.empty() && obj.guid != stored.guid) {
        throw StorageError(StorageErrorCode::invalid,
                           "Identifier of " + key + " is immutable (" + stored.guid + ")");
    }
    obj.guid = stored.guid;
    obj.creation_timestamp = stored.creation_timestamp;
    obj.updating_timestamp = std::max(epoch_ms_now(), stored.creation_timestamp);
    std::string value = obj.to_json().dump();

    Statement stmt(db_, "UPDATE objects SET value = ?, updated_at = ? WHERE key = ?");
    stmt.bind(1, value);
    stmt.bind(2, *obj.updating_timestamp);
    stmt.bind(3, key);
    stmt.step();

    publish(WatchEventType::update, obj, value);
}

void SqliteStorage::remove(const Object& obj) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_open();
    std::string key = obj.key();
    auto value = load_value(key);
    if (!value) {
        throw StorageError(StorageErrorCode::not_found, key + " not found");
    }
    Statement stmt(db_, "DELETE FROM objects WHERE key = ?");
    stmt.bind(1, key);
    stmt.step();

    publish(WatchEventType::remove, obj, *value);
}

void SqliteStorage::list(ObjectListBase& out, const std::vector<std::string>& namespaces) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_open();
    std::vector<std::string> values;
    if (namespaces.empty() || !out.has_namespace()) {
        Statement stmt(db_, "SELECT value FROM objects WHERE kind = ? ORDER BY key");
        stmt.bind(1, out.kind());
        while (stmt.step() == SQLITE_ROW) values.push_back(stmt.column_text(0));
    } else {
        for (auto& ns : namespaces) {
            Statement stmt(db_, "SELECT value FROM objects WHERE kind = ? AND namespace = ? ORDER BY key");
            stmt.bind(1, out.kind());
            stmt.bind(2, ns);
            while (stmt.step() == SQLITE_ROW) values.push_back(stmt.column_text(0));
        }
    }
    for (auto& v : values) {
        try {
            out.append_raw(v);
        } catch (const DecodeError& e) {
            throw StorageError(StorageErrorCode::internal,
                               "Corrupted row in " + out.kind() + ": " + e.what());
        }
    }
}

WatcherPtr SqliteStorage::watch(const Object& target, WatchMode mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_open();
    std::string scope = mode == WatchMode::kind ? kind_prefix(target.kind) : target.key();
    auto channel = std::make_shared<WatchChannel>(watch_channel_size_);

    uint64_t id;
    {
        std::lock_guard<std::mutex> reg_lock(registry_->mutex);
        id = registry_->next_id++;
        registry_->entries.push_back(Registration{id, mode, scope, channel});
    }
    std::weak_ptr<Registry> registry = registry_;
    return std::make_unique<ChannelWatcher>(channel, [registry, id] {
        if (auto r = registry.lock()) r->remove(id);
    });
}

void SqliteStorage::Registry::remove(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex);
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [id](const Registration& r) { return r.id == id; }),
                  entries.end());
}

void SqliteStorage::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    {
        std::lock_guard<std::mutex> reg_lock(registry_->mutex);
        for (auto& r : registry_->entries) r.channel->close();
        registry_->entries.clear();
    }
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

std::size_t SqliteStorage::watcher_count() const {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    return registry_->entries.size();
}

} // namespace cmdb
