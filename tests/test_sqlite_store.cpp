#include <gtest/gtest.h>

#include "SQLiteStore.hpp"

namespace
{
    constexpr std::int64_t kDayMs = 86400000LL;

    VehicleState vehicle(std::string id)
    {
        VehicleState v;
        v.id = std::move(id);
        v.edge = EdgeRef{"A", "B"};
        v.progress = 0.4;
        v.speedMetersPerSecond = 12.0;
        v.status = VehicleStatus::Running;
        return v;
    }

    AlertRecord alert(std::string a, std::string b, AlertSeverity severity, double distance)
    {
        AlertRecord r;
        r.participantA = std::move(a);
        r.participantB = std::move(b);
        r.severity = severity;
        r.distanceMeters = distance;
        return r;
    }
}

TEST(SQLiteStoreTest, StoresSnapshotSamples)
{
    SQLiteStore db(":memory:");
    ASSERT_TRUE(db.isOpen());

    db.insertSnapshot({vehicle("T1"), vehicle("T2")}, 1000, "push");
    db.insertSnapshot({vehicle("T1")}, 2000, "poll");

    EXPECT_EQ(db.countSamples("T1"), 2);
    EXPECT_EQ(db.countSamples("T2"), 1);
    EXPECT_EQ(db.countSamples("T9"), 0);
}

TEST(SQLiteStoreTest, RecentAlertsNewestFirst)
{
    SQLiteStore db(":memory:");
    db.insertAlerts({alert("T2", "T1", AlertSeverity::Warn, 80)}, 1000);
    db.insertAlerts({alert("T3", "T4", AlertSeverity::Critical, 20)}, 2000);

    auto recent = db.getRecentAlerts(10);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].pairKey, "T3|T4");
    EXPECT_EQ(recent[0].severity, "critical");
    EXPECT_EQ(recent[1].pairKey, "T1|T2");
    EXPECT_DOUBLE_EQ(recent[1].distanceMeters, 80.0);

    EXPECT_EQ(db.getRecentAlerts(1).size(), 1u);
}

TEST(SQLiteStoreTest, PruneDropsOldRows)
{
    SQLiteStore db(":memory:");
    std::int64_t now = 100 * kDayMs;

    db.insertSnapshot({vehicle("old")}, now - 10 * kDayMs, "poll");
    db.insertSnapshot({vehicle("new")}, now - kDayMs, "poll");
    db.insertAlerts({alert("A", "B", AlertSeverity::Info, 5)}, now - 10 * kDayMs);

    db.pruneOldData(7, now);

    EXPECT_EQ(db.countSamples("old"), 0);
    EXPECT_EQ(db.countSamples("new"), 1);
    EXPECT_TRUE(db.getRecentAlerts(10).empty());
}
