#pragma once
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace cmdb {

// Raised when a stored or watched payload does not match the shape of the
// object it is decoded into.
class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ── Generic object ──────────────────────────────────────────────────

struct Object {
    std::string guid;
    std::string kind;
    std::string name;
    std::string ns;                          // empty when not namespaced
    int64_t creation_timestamp = 0;          // epoch ms
    std::optional<int64_t> updating_timestamp;
    bool deleting = false;

    explicit Object(std::string kind_) : kind(std::move(kind_)) {}
    virtual ~Object() = default;

    virtual bool has_namespace() const { return false; }

    // Storage key: "<kind>/<name>" or "<kind>/<namespace>/<name>".
    std::string key() const;

    nlohmann::json to_json() const;
    // Throws DecodeError when a present field has the wrong type or the
    // payload names a different kind.
    void from_json(const nlohmann::json& j);

protected:
    virtual void write_fields(nlohmann::json&) const {}
    virtual void read_fields(const nlohmann::json&) {}
};

// Parses a JSON payload into target.
void decode_object(const std::string& payload, Object& target);

std::string kind_prefix(const std::string& kind);

// ── Kinds ───────────────────────────────────────────────────────────

namespace kinds {
inline constexpr const char* machine = "Machine";
inline constexpr const char* machine_digest = "MachineDigest";
inline constexpr const char* discovered_machines = "DiscoveredMachines";
} // namespace kinds

struct Machine : Object {
    std::string hostname;
    std::string zone;
    std::string os;
    std::vector<std::string> addresses;
    std::map<std::string, std::string> labels;

    Machine() : Object(kinds::machine) {}

protected:
    void write_fields(nlohmann::json& j) const override;
    void read_fields(const nlohmann::json& j) override;
};

namespace digest_state {
inline constexpr const char* pending = "Pending";
inline constexpr const char* processing = "Processing";
inline constexpr const char* completed = "Completed";
inline constexpr const char* failed = "Failed";
} // namespace digest_state

struct MachineDigest : Object {
    std::string state = digest_state::pending;
    std::vector<std::string> machines;   // guids captured by the snapshot
    std::string message;

    MachineDigest() : Object(kinds::machine_digest) {}

protected:
    void write_fields(nlohmann::json& j) const override;
    void read_fields(const nlohmann::json& j) override;
};

// A digest with a fresh identity, ready to be created.
MachineDigest new_machine_digest();

namespace discovery_state {
inline constexpr const char* started = "Started";
inline constexpr const char* finished = "Finished";
inline constexpr const char* failed = "Failed";
} // namespace discovery_state

struct DiscoveredMachines : Object {
    static constexpr const char* singleton_name = "discovered-machines";

    std::string state;
    std::vector<std::string> zones;
    std::vector<std::string> machines;
    std::string message;

    DiscoveredMachines() : Object(kinds::discovered_machines) { name = singleton_name; }

protected:
    void write_fields(nlohmann::json& j) const override;
    void read_fields(const nlohmann::json& j) override;
};

// ── Lists ───────────────────────────────────────────────────────────

class ObjectListBase {
public:
    virtual ~ObjectListBase() = default;
    virtual std::string kind() const = 0;
    virtual bool has_namespace() const = 0;
    virtual void append_raw(const std::string& payload) = 0;
};

template <typename T>
class ObjectList : public ObjectListBase {
public:
    std::vector<T> items;

    std::string kind() const override { return T().kind; }
    bool has_namespace() const override { return T().has_namespace(); }

    void append_raw(const std::string& payload) override {
        T obj;
        decode_object(payload, obj);
        items.push_back(std::move(obj));
    }
};

} // namespace cmdb
