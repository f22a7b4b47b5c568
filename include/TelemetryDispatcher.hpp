#pragma once
#include <cstddef>
#include <string>
#include "Types.hpp"

class SnapshotStore;
class AlertReconciler;
class SQLiteStore;
class SessionRecorder;

// Turns raw payloads into store, alert and overlay updates. One bad payload
// is logged and dropped; it never affects the next one.
class TelemetryDispatcher
{
private:
    SnapshotStore& store;
    AlertReconciler& reconciler;
    SQLiteStore* history = nullptr;
    SessionRecorder* recorder = nullptr;

    LiveOverlay overlay;
    std::string lastError;
    std::size_t dropped = 0;

    void applySnapshot(std::vector<VehicleState> vehicles, MonotonicTime now, WallTime wall, char const* source);

public:
    TelemetryDispatcher(SnapshotStore& snapshots, AlertReconciler& alerts);

    void attachHistory(SQLiteStore* store) noexcept { history = store; }
    void attachRecorder(SessionRecorder* sink) noexcept { recorder = sink; }

    // Each returns true when an authoritative snapshot was written.
    bool dispatchPush(std::string const& payload, bool acceptState, MonotonicTime now, WallTime wall);
    bool dispatchPoll(std::string const& payload, bool acceptState, MonotonicTime now, WallTime wall);

    // Overlay failures are not errors; false means the cycle was skipped.
    bool dispatchOverlay(std::string const& payload, WallTime wall);

    void recordError(std::string message);

    LiveOverlay const& liveOverlay() const noexcept { return overlay; }
    std::string const& mostRecentError() const noexcept { return lastError; }
    std::size_t droppedMessages() const noexcept { return dropped; }
};
