#pragma once
#include <cstdint>
#include <vector>
#include "Types.hpp"

class SnapshotStore;

// Dead reckoning between authoritative updates. Produces a per-tick display
// state; the stored snapshot is only read.
class MotionExtrapolator
{
private:
    SnapshotStore const& store;
    bool playing = true;

    std::vector<VehicleState> display;
    std::uint64_t displaySequence = 0;
    bool displayExtrapolated = false;

public:
    explicit MotionExtrapolator(SnapshotStore const& source);

    void setPlaying(bool value) noexcept { playing = value; }
    bool isPlaying() const noexcept { return playing; }

    std::vector<VehicleState> const& tick(MonotonicTime now);
    std::vector<VehicleState> const& displayState() const noexcept { return display; }
    std::uint64_t displayedSequence() const noexcept { return displaySequence; }

    static double extrapolateProgress(VehicleState const& vehicle, double elapsedSeconds);
};
