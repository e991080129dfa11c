#pragma once
#include "object.hpp"
#include "watch.hpp"
#include <string>
#include <vector>
#include <memory>
#include <stdexcept>

namespace cmdb {

enum class StorageErrorCode {
    not_found,
    already_exists,
    invalid,
    closed,
    internal,
};

const char* to_string(StorageErrorCode code);

class StorageError : public std::runtime_error {
public:
    StorageError(StorageErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    StorageErrorCode code() const { return code_; }

private:
    StorageErrorCode code_;
};

// True for failures the caller cannot fix by retrying or by switching
// between update and create.
bool is_internal_error(const StorageError& e);

inline bool is_not_found_error(const StorageError& e) {
    return e.code() == StorageErrorCode::not_found;
}

// Backing store of the CMDB. Every method may be called concurrently from
// several threads; implementations serialize internally.
class Storage {
public:
    virtual ~Storage() = default;

    // Assigns guid (if empty) and creation timestamp.
    virtual void create(Object& obj) = 0;
    // Looks obj up by key and overwrites it with the stored state.
    virtual void get(Object& obj) = 0;
    // Keeps the stored guid and creation timestamp, stamps the update time.
    virtual void update(Object& obj) = 0;
    virtual void remove(const Object& obj) = 0;
    // Empty namespaces means all of them.
    virtual void list(ObjectListBase& out, const std::vector<std::string>& namespaces = {}) = 0;
    virtual WatcherPtr watch(const Object& target, WatchMode mode) = 0;
    virtual void close() = 0;
};

using StoragePtr = std::shared_ptr<Storage>;

struct DatabaseConfig;

// Builds the adapter named by cfg.adapter. Throws StorageError(invalid)
// for unknown adapters.
StoragePtr make_storage(const DatabaseConfig& cfg);

} // namespace cmdb
