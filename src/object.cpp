#include "object.hpp"
#include "utils.hpp"

namespace cmdb {

namespace {

template <typename T>
void read_if_present(const nlohmann::json& j, const char* field, T& out) {
    auto it = j.find(field);
    if (it == j.end() || it->is_null()) return;
    out = it->get<T>();
}

} // namespace

std::string kind_prefix(const std::string& kind) {
    return kind + "/";
}

std::string Object::key() const {
    if (has_namespace() && !ns.empty()) {
        return kind + "/" + ns + "/" + name;
    }
    return kind + "/" + name;
}

nlohmann::json Object::to_json() const {
    nlohmann::json j;
    j["guid"] = guid;
    j["kind"] = kind;
    j["name"] = name;
    if (has_namespace() && !ns.empty()) j["namespace"] = ns;
    j["creation_timestamp"] = creation_timestamp;
    if (updating_timestamp) j["updating_timestamp"] = *updating_timestamp;
    j["deleting"] = deleting;
    write_fields(j);
    return j;
}

void Object::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw DecodeError("expected a JSON object for kind " + kind);
    }
    try {
        std::string payload_kind;
        read_if_present(j, "kind", payload_kind);
        if (!payload_kind.empty() && payload_kind != kind) {
            throw DecodeError("payload of kind " + payload_kind + " cannot be decoded as " + kind);
        }
        read_if_present(j, "guid", guid);
        read_if_present(j, "name", name);
        read_if_present(j, "namespace", ns);
        read_if_present(j, "creation_timestamp", creation_timestamp);
        auto it = j.find("updating_timestamp");
        if (it != j.end() && !it->is_null()) {
            updating_timestamp = it->get<int64_t>();
        }
        read_if_present(j, "deleting", deleting);
        read_fields(j);
    } catch (const nlohmann::json::exception& e) {
        throw DecodeError("malformed " + kind + " payload: " + e.what());
    }
}

void decode_object(const std::string& payload, Object& target) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(payload);
    } catch (const nlohmann::json::parse_error& e) {
        throw DecodeError("invalid JSON in " + target.kind + " payload: " + e.what());
    }
    target.from_json(j);
}

// ── Machine ─────────────────────────────────────────────────────────

void Machine::write_fields(nlohmann::json& j) const {
    j["hostname"] = hostname;
    j["zone"] = zone;
    j["os"] = os;
    j["addresses"] = addresses;
    j["labels"] = labels;
}

void Machine::read_fields(const nlohmann::json& j) {
    read_if_present(j, "hostname", hostname);
    read_if_present(j, "zone", zone);
    read_if_present(j, "os", os);
    read_if_present(j, "addresses", addresses);
    read_if_present(j, "labels", labels);
}

// ── MachineDigest ───────────────────────────────────────────────────

void MachineDigest::write_fields(nlohmann::json& j) const {
    j["state"] = state;
    j["machines"] = machines;
    if (!message.empty()) j["message"] = message;
}

void MachineDigest::read_fields(const nlohmann::json& j) {
    read_if_present(j, "state", state);
    read_if_present(j, "machines", machines);
    read_if_present(j, "message", message);
}

MachineDigest new_machine_digest() {
    MachineDigest d;
    d.guid = new_guid();
    d.name = d.guid;
    return d;
}

// ── DiscoveredMachines ──────────────────────────────────────────────

void DiscoveredMachines::write_fields(nlohmann::json& j) const {
    j["state"] = state;
    j["zones"] = zones;
    j["machines"] = machines;
    if (!message.empty()) j["message"] = message;
}

void DiscoveredMachines::read_fields(const nlohmann::json& j) {
    read_if_present(j, "state", state);
    read_if_present(j, "zones", zones);
    read_if_present(j, "machines", machines);
    read_if_present(j, "message", message);
}

} // namespace cmdb
