#include "storage.hpp"
#include "sqlite_storage.hpp"
#include "config.hpp"
#include "utils.hpp"

namespace cmdb {

const char* to_string(StorageErrorCode code) {
    switch (code) {
        case StorageErrorCode::not_found:      return "not_found";
        case StorageErrorCode::already_exists: return "already_exists";
        case StorageErrorCode::invalid:        return "invalid";
        case StorageErrorCode::closed:         return "closed";
        case StorageErrorCode::internal:       return "internal";
    }
    return "unknown";
}

bool is_internal_error(const StorageError& e) {
    return e.code() == StorageErrorCode::internal || e.code() == StorageErrorCode::closed;
}

StoragePtr make_storage(const DatabaseConfig& cfg) {
    if (cfg.adapter == "sqlite") {
        return std::make_shared<SqliteStorage>(expand_path(cfg.path));
    }
    throw StorageError(StorageErrorCode::invalid, "Unsupported database adapter: " + cfg.adapter);
}

} // namespace cmdb
