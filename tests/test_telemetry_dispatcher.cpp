#include <gtest/gtest.h>

#include "AlertReconciler.hpp"
#include "SQLiteStore.hpp"
#include "SnapshotStore.hpp"
#include "TelemetryDispatcher.hpp"

namespace
{
    const std::string kState = R"({"type": "state", "data": {"trains": [
        {"id": "T1", "edge": {"u": "A", "v": "B"}, "progress": 0.25, "speed_mps": 10, "edge_length_m": 500, "status": "running"}
    ]}})";

    const std::string kAlerts = R"({"type": "alerts", "data": [
        {"pair": {"a": "T1", "b": "T2"}, "severity": "critical", "distance_m": 50}
    ]})";

    const std::string kTrains = R"({"trains": [{"id": "T1", "progress": 0.5}, {"id": "T2", "progress": 0.1}]})";

    struct DispatcherFixture : public ::testing::Test
    {
        SnapshotStore store;
        AlertReconciler reconciler;
        TelemetryDispatcher dispatcher{store, reconciler};
        MonotonicTime now = std::chrono::steady_clock::now();
        WallTime wall = WallTime(std::chrono::seconds(1700000000));
    };
}

TEST_F(DispatcherFixture, MalformedMessageIsDroppedAndTheNextOneApplies)
{
    EXPECT_FALSE(dispatcher.dispatchPush("{\"type\": \"state\", \"data\": ", true, now, wall));
    EXPECT_EQ(dispatcher.droppedMessages(), 1u);
    EXPECT_FALSE(dispatcher.mostRecentError().empty());
    EXPECT_FALSE(store.hasData());

    EXPECT_TRUE(dispatcher.dispatchPush(kState, true, now, wall));
    EXPECT_EQ(store.sequence(), 1u);
    EXPECT_EQ(store.current().vehicles[0].id, "T1");
}

TEST_F(DispatcherFixture, StateIgnoredWhenPushIsNotTheWriter)
{
    EXPECT_FALSE(dispatcher.dispatchPush(kState, false, now, wall));
    EXPECT_FALSE(store.hasData());
}

TEST_F(DispatcherFixture, AlertsAreMergedRegardlessOfWriter)
{
    dispatcher.dispatchPush(kAlerts, false, now, wall);

    ASSERT_EQ(reconciler.alerts().size(), 1u);
    EXPECT_TRUE(reconciler.visibleToast(wall).has_value());
    EXPECT_FALSE(store.hasData());
}

TEST_F(DispatcherFixture, UnknownTypeIsNotAnError)
{
    EXPECT_FALSE(dispatcher.dispatchPush(R"({"type": "ping"})", true, now, wall));
    EXPECT_EQ(dispatcher.droppedMessages(), 0u);
    EXPECT_TRUE(dispatcher.mostRecentError().empty());
}

TEST_F(DispatcherFixture, PollResponsesAreGated)
{
    EXPECT_FALSE(dispatcher.dispatchPoll(kTrains, false, now, wall));
    EXPECT_FALSE(store.hasData());

    EXPECT_TRUE(dispatcher.dispatchPoll(kTrains, true, now, wall));
    EXPECT_EQ(store.current().vehicles.size(), 2u);

    EXPECT_FALSE(dispatcher.dispatchPoll("<html>502</html>", true, now, wall));
    EXPECT_EQ(dispatcher.droppedMessages(), 1u);
    EXPECT_EQ(store.sequence(), 1u);
}

TEST_F(DispatcherFixture, OverlayKeepsRoutesWhenOmitted)
{
    EXPECT_TRUE(dispatcher.dispatchOverlay(R"({"success": true,
        "data": [{"train_id": "12951", "lat": 19.0, "lon": 72.8}],
        "routes": [{"coordinates": [[19.0, 72.8], [19.1, 72.9]], "color": "#0af"}]})", wall));
    EXPECT_EQ(dispatcher.liveOverlay().routes.size(), 1u);

    EXPECT_TRUE(dispatcher.dispatchOverlay(R"({"success": true, "data": [
        {"train_id": "12951", "lat": 19.05, "lon": 72.85},
        {"train_id": "12952", "lat": 28.6, "lon": 77.2}]})", wall));
    EXPECT_EQ(dispatcher.liveOverlay().positions.size(), 2u);
    EXPECT_EQ(dispatcher.liveOverlay().routes.size(), 1u);
}

TEST_F(DispatcherFixture, FailedOverlayCycleChangesNothing)
{
    dispatcher.dispatchOverlay(R"({"success": true, "data": [{"train_id": "1", "lat": 1, "lon": 2}]})", wall);

    EXPECT_FALSE(dispatcher.dispatchOverlay("garbage", wall));
    EXPECT_FALSE(dispatcher.dispatchOverlay(R"({"success": false})", wall));

    EXPECT_EQ(dispatcher.liveOverlay().positions.size(), 1u);
    EXPECT_TRUE(dispatcher.mostRecentError().empty());
}

TEST_F(DispatcherFixture, SnapshotsAndAlertsAreLogged)
{
    SQLiteStore history(":memory:");
    ASSERT_TRUE(history.isOpen());
    dispatcher.attachHistory(&history);

    dispatcher.dispatchPush(kState, true, now, wall);
    dispatcher.dispatchPoll(kTrains, true, now, wall);
    dispatcher.dispatchPush(kAlerts, true, now, wall);

    EXPECT_EQ(history.countSamples("T1"), 2);
    EXPECT_EQ(history.countSamples("T2"), 1);

    auto logged = history.getRecentAlerts(10);
    ASSERT_EQ(logged.size(), 1u);
    EXPECT_EQ(logged[0].pairKey, "T1|T2");
    EXPECT_EQ(logged[0].severity, "critical");
}
