#pragma once
#include <cstdint>
#include <vector>
#include "Types.hpp"

// Holds the latest authoritative snapshot. Every update replaces the whole
// snapshot and bumps the sequence; readers never see a partial update.
class SnapshotStore
{
private:
    TelemetrySnapshot latest;

public:
    std::uint64_t replace(std::vector<VehicleState> vehicles, MonotonicTime receivedAt);

    TelemetrySnapshot const& current() const noexcept { return latest; }
    std::uint64_t sequence() const noexcept { return latest.sequence; }
    bool hasData() const noexcept { return latest.sequence != 0; }
};
