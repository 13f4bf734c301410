#pragma once
#include <string>
#include "types.hpp"

class MonotonicStateTracker;

// Passes every device and battery of a freshly polled snapshot through the
// tracker once, so cumulative counters carry their guarded values. Must run
// exactly once per completed cycle; stale snapshots never go through it.
Snapshot exposeSnapshot(const Snapshot& snapshot, MonotonicStateTracker& tracker);

// Serializes a snapshot for consumers. Values are written as they are.
std::string snapshotToJson(const Snapshot& snapshot);
