#include "SnapshotStore.hpp"

std::uint64_t SnapshotStore::replace(std::vector<VehicleState> vehicles, MonotonicTime receivedAt)
{
    TelemetrySnapshot next;
    next.vehicles   = std::move(vehicles);
    next.receivedAt = receivedAt;
    next.sequence   = latest.sequence + 1;

    latest = std::move(next);
    return latest.sequence;
}
