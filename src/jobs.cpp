#include "jobs.hpp"
#include <algorithm>

namespace cmdb {

QueueExecutor::DigestJob make_digest_job(StoragePtr storage, LoggerPtr logger) {
    return [storage, logger](const MachineDigest& received) {
        MachineDigest digest = received;
        try {
            ObjectList<Machine> machines;
            storage->list(machines);
            digest.machines.clear();
            for (auto& m : machines.items) digest.machines.push_back(m.guid);
            digest.state = digest_state::completed;
            digest.message = std::to_string(digest.machines.size()) + " machine(s) captured";
            storage->update(digest);
            logger->info("digest", "Digest " + digest.guid + ": " + digest.message);
        } catch (const StorageError& e) {
            logger->error("digest", "Digest " + digest.guid + " failed: " + e.what());
            if (e.code() == StorageErrorCode::not_found) return;
            digest.state = digest_state::failed;
            digest.message = e.what();
            try {
                storage->update(digest);
            } catch (const StorageError& again) {
                logger->error("digest", std::string("Could not record failure: ") + again.what());
            }
        }
    };
}

QueueExecutor::DiscoveryJob make_discovery_job(StoragePtr storage, LoggerPtr logger) {
    return [storage, logger](const DiscoveredMachines& received) {
        if (received.state != discovery_state::started) {
            logger->debug("discovery", "Ignoring discovery record in state " + received.state);
            return;
        }
        DiscoveredMachines latest = received;
        try {
            ObjectList<Machine> machines;
            storage->list(machines);
            latest.machines.clear();
            for (auto& m : machines.items) {
                bool in_zone = latest.zones.empty() ||
                    std::find(latest.zones.begin(), latest.zones.end(), m.zone) != latest.zones.end();
                if (in_zone) latest.machines.push_back(m.hostname.empty() ? m.name : m.hostname);
            }
            latest.state = discovery_state::finished;
            latest.message.clear();
            storage->update(latest);
            logger->info("discovery", "Sweep finished, " + std::to_string(latest.machines.size()) +
                                      " machine(s) in " + std::to_string(latest.zones.size()) + " zone(s)");
        } catch (const StorageError& e) {
            logger->error("discovery", std::string("Sweep failed: ") + e.what());
            latest.state = discovery_state::failed;
            latest.message = e.what();
            try {
                storage->update(latest);
            } catch (const StorageError& again) {
                logger->error("discovery", std::string("Could not record failure: ") + again.what());
            }
        }
    };
}

} // namespace cmdb
