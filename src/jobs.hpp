#pragma once
#include "executor.hpp"
#include "storage.hpp"
#include "log.hpp"

namespace cmdb {

// Job bodies run by the executors of the `serve` command.

// Captures the machines currently stored into the digest and marks it
// Completed (Failed when storage refuses).
QueueExecutor::DigestJob make_digest_job(StoragePtr storage, LoggerPtr logger);

// For a record in state Started: collects the stored machines of the swept
// zones and marks the record Finished. Other states are ignored so the
// update it writes does not start another sweep.
QueueExecutor::DiscoveryJob make_discovery_job(StoragePtr storage, LoggerPtr logger);

} // namespace cmdb
