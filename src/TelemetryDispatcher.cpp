#include <iostream>
#include "TelemetryDispatcher.hpp"
#include "AlertReconciler.hpp"
#include "Parser.hpp"
#include "SQLiteStore.hpp"
#include "SessionClock.hpp"
#include "SessionRecorder.hpp"
#include "SnapshotStore.hpp"

TelemetryDispatcher::TelemetryDispatcher(SnapshotStore& snapshots, AlertReconciler& alerts)
    : store(snapshots)
    , reconciler(alerts)
{
}

void TelemetryDispatcher::recordError(std::string message)
{
    std::cerr << "[Transport] " << message << std::endl;
    lastError = std::move(message);
}

void TelemetryDispatcher::applySnapshot(std::vector<VehicleState> vehicles, MonotonicTime now, WallTime wall, char const* source)
{
    if (history)
        history->insertSnapshot(vehicles, SessionClock::toEpochMillis(wall), source);

    store.replace(std::move(vehicles), now);
}

bool TelemetryDispatcher::dispatchPush(std::string const& payload, bool acceptState, MonotonicTime now, WallTime wall)
{
    if (recorder)
        recorder->append(railsync::CHANNEL_PUSH, payload, SessionClock::toEpochMillis(wall));

    PushMessage message;
    try
    {
        message = Parser::parsePushMessage(payload);
    }
    catch (PayloadError const& e)
    {
        ++dropped;
        recordError(std::string("Dropped push message: ") + e.what());
        return false;
    }

    if (auto* state = std::get_if<StateMessage>(&message))
    {
        if (!acceptState)
            return false;

        applySnapshot(std::move(state->vehicles), now, wall, "push");
        return true;
    }

    if (auto* batch = std::get_if<AlertsMessage>(&message))
    {
        std::vector<AlertRecord> accepted = reconciler.ingest(batch->alerts, wall);
        if (history)
            history->insertAlerts(accepted, SessionClock::toEpochMillis(wall));
    }

    return false;
}

bool TelemetryDispatcher::dispatchPoll(std::string const& payload, bool acceptState, MonotonicTime now, WallTime wall)
{
    if (recorder)
        recorder->append(railsync::CHANNEL_POLL, payload, SessionClock::toEpochMillis(wall));

    if (!acceptState)
        return false;

    try
    {
        applySnapshot(Parser::parseTrains(payload), now, wall, "poll");
        return true;
    }
    catch (PayloadError const& e)
    {
        ++dropped;
        recordError(std::string("Dropped poll response: ") + e.what());
        return false;
    }
}

bool TelemetryDispatcher::dispatchOverlay(std::string const& payload, WallTime wall)
{
    if (recorder)
        recorder->append(railsync::CHANNEL_OVERLAY, payload, SessionClock::toEpochMillis(wall));

    try
    {
        LivePositionsResponse response = Parser::parseLivePositions(payload);
        if (!response.success)
            return false;

        overlay.positions = std::move(response.positions);
        if (response.routes)
            overlay.routes = std::move(*response.routes);
        return true;
    }
    catch (PayloadError const&)
    {
        return false;
    }
}
