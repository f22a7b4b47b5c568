#include <algorithm>
#include <chrono>
#include "MotionExtrapolator.hpp"
#include "SnapshotStore.hpp"

MotionExtrapolator::MotionExtrapolator(SnapshotStore const& source)
    : store(source)
{
}

double MotionExtrapolator::extrapolateProgress(VehicleState const& vehicle, double elapsedSeconds)
{
    // Unknown edge lengths advance as if the edge were one metre long.
    double edgeLength = vehicle.edgeLengthMeters > 0.0 ? vehicle.edgeLengthMeters : 1.0;
    double speed      = std::max(0.0, vehicle.speedMetersPerSecond);
    double elapsed    = std::max(0.0, elapsedSeconds);

    return std::clamp(vehicle.progress + speed * elapsed / edgeLength, 0.0, 1.0);
}

std::vector<VehicleState> const& MotionExtrapolator::tick(MonotonicTime now)
{
    if (!store.hasData())
    {
        display.clear();
        displaySequence = 0;
        return display;
    }

    TelemetrySnapshot const& snap = store.current();

    if (!playing)
    {
        if (displaySequence == snap.sequence && !displayExtrapolated)
            return display;

        display = snap.vehicles;
        displaySequence = snap.sequence;
        displayExtrapolated = false;
        return display;
    }

    double elapsed = std::chrono::duration<double>(now - snap.receivedAt).count();

    display = snap.vehicles;
    for (auto& vehicle : display)
        vehicle.progress = extrapolateProgress(vehicle, elapsed);

    displaySequence = snap.sequence;
    displayExtrapolated = true;
    return display;
}
