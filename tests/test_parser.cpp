#include <gtest/gtest.h>

#include "Parser.hpp"

TEST(ParserTest, NetworkNodesAndEdges)
{
    auto network = Parser::parseNetwork(R"json({
        "nodes": [
            {"id": "NDLS", "lat": 28.64, "lon": 77.22, "type": "station", "name": "New Delhi"},
            {"id": 42, "type": "junction"},
            {"name": "no id"}
        ],
        "edges": [
            {"source": "NDLS", "target": "42", "geometry_wkt": "LINESTRING(77.22 28.64, 77.3 28.7)", "length": 1200.5, "max_speed": 33.3},
            {"source": "42"}
        ]
    })json");

    ASSERT_EQ(network.nodes.size(), 2u);
    EXPECT_EQ(network.nodes[0].name, "New Delhi");
    EXPECT_TRUE(network.nodes[0].hasCoordinates());
    EXPECT_EQ(network.nodes[1].id, "42");
    EXPECT_FALSE(network.nodes[1].hasCoordinates());

    ASSERT_EQ(network.edges.size(), 1u);
    EXPECT_EQ(network.edges[0].pairKey(), "NDLS|42");
    ASSERT_TRUE(network.edges[0].geometryWkt.has_value());
    EXPECT_DOUBLE_EQ(*network.edges[0].lengthMeters, 1200.5);
}

TEST(ParserTest, TrainsDecodeAndClampProgress)
{
    auto trains = Parser::parseTrains(R"({"trains": [
        {"id": "T1", "type": "express", "edge": {"u": "A", "v": "B"}, "progress": 1.5,
         "speed_mps": 22.0, "edge_length_m": 900, "status": "running", "delay_min": 4},
        {"id": "T2", "edge": null, "progress": -0.2, "status": "held"}
    ]})");

    ASSERT_EQ(trains.size(), 2u);
    EXPECT_EQ(trains[0].edge->pairKey(), "A|B");
    EXPECT_DOUBLE_EQ(trains[0].progress, 1.0);
    EXPECT_DOUBLE_EQ(trains[0].speedMetersPerSecond, 22.0);
    EXPECT_EQ(trains[0].status, VehicleStatus::Running);
    EXPECT_EQ(trains[0].delayMinutes, 4);

    EXPECT_FALSE(trains[1].edge.has_value());
    EXPECT_DOUBLE_EQ(trains[1].progress, 0.0);
    EXPECT_EQ(trains[1].status, VehicleStatus::Held);
}

TEST(ParserTest, ExtremeDelayIsClamped)
{
    auto trains = Parser::parseTrains(R"({"trains": [
        {"id": "T1", "delay_min": 1e30},
        {"id": "T2", "delay_min": -1e30},
        {"id": "T3", "delay_min": 12.9}
    ]})");

    ASSERT_EQ(trains.size(), 3u);
    EXPECT_EQ(trains[0].delayMinutes, Parser::kMaxDelayMinutes);
    EXPECT_EQ(trains[1].delayMinutes, -Parser::kMaxDelayMinutes);
    EXPECT_EQ(trains[2].delayMinutes, 12);
}

TEST(ParserTest, MissingTrainsIsAnEmptySnapshot)
{
    EXPECT_TRUE(Parser::parseTrains(R"({"other": 1})").empty());
}

TEST(ParserTest, MalformedPayloadsThrow)
{
    EXPECT_THROW(Parser::parseTrains("{not json"), PayloadError);
    EXPECT_THROW(Parser::parseTrains(""), PayloadError);
    EXPECT_THROW(Parser::parseTrains("[1,2]"), PayloadError);
    EXPECT_THROW(Parser::parseTrains(R"({"trains": 5})"), PayloadError);
    EXPECT_THROW(Parser::parseTrains(R"({"trains": [5]})"), PayloadError);
}

TEST(ParserTest, PushStateMessage)
{
    auto message = Parser::parsePushMessage(R"({"type": "state", "data": {"trains": [{"id": "T9", "progress": 0.3}]}})");

    auto* state = std::get_if<StateMessage>(&message);
    ASSERT_NE(state, nullptr);
    ASSERT_EQ(state->vehicles.size(), 1u);
    EXPECT_EQ(state->vehicles[0].id, "T9");
}

TEST(ParserTest, PushAlertsMessage)
{
    auto message = Parser::parsePushMessage(R"({"type": "alerts", "data": [
        {"pair": {"a": "T1", "b": "T2"}, "severity": "critical", "distance_m": 50,
         "relative_speed_mps": 12.5, "same_edge": true, "opposite_edge": false,
         "suggestions": ["hold T1", 7, "slow T2"]}
    ]})");

    auto* alerts = std::get_if<AlertsMessage>(&message);
    ASSERT_NE(alerts, nullptr);
    ASSERT_EQ(alerts->alerts.size(), 1u);

    AlertRecord const& a = alerts->alerts[0];
    EXPECT_EQ(a.participantA, "T1");
    EXPECT_EQ(a.severity, AlertSeverity::Critical);
    EXPECT_DOUBLE_EQ(a.distanceMeters, 50.0);
    EXPECT_TRUE(a.sameEdge);
    EXPECT_FALSE(a.oppositeEdge);
    EXPECT_EQ(a.suggestions.size(), 2u);
}

TEST(ParserTest, UnknownPushTypeIsIgnored)
{
    auto message = Parser::parsePushMessage(R"({"type": "heartbeat"})");
    auto* ignored = std::get_if<IgnoredMessage>(&message);
    ASSERT_NE(ignored, nullptr);
    EXPECT_EQ(ignored->type, "heartbeat");
}

TEST(ParserTest, MalformedPushBodiesThrow)
{
    EXPECT_THROW(Parser::parsePushMessage(R"({"type": "state"})"), PayloadError);
    EXPECT_THROW(Parser::parsePushMessage(R"({"type": "state", "data": {}})"), PayloadError);
    EXPECT_THROW(Parser::parsePushMessage(R"({"type": "alerts", "data": {}})"), PayloadError);
}

TEST(ParserTest, LivePositionsWithAndWithoutRoutes)
{
    auto withRoutes = Parser::parseLivePositions(R"({"success": true,
        "data": [{"train_id": "12951", "lat": 19.0, "lon": 72.8, "color": "#f00", "progress": 0.4, "direction": -1},
                 {"train_id": "bad"}],
        "routes": [{"coordinates": [[19.0, 72.8], [19.1, 72.9]], "color": "#f00"}]})");

    EXPECT_TRUE(withRoutes.success);
    ASSERT_EQ(withRoutes.positions.size(), 1u);
    EXPECT_EQ(withRoutes.positions[0].direction, -1);
    ASSERT_TRUE(withRoutes.routes.has_value());
    ASSERT_EQ(withRoutes.routes->size(), 1u);
    EXPECT_EQ((*withRoutes.routes)[0].coordinates.size(), 2u);

    auto withoutRoutes = Parser::parseLivePositions(R"({"success": true, "data": []})");
    EXPECT_FALSE(withoutRoutes.routes.has_value());

    auto failed = Parser::parseLivePositions(R"({"success": false, "data": [{"train_id": "x", "lat": 1, "lon": 2}]})");
    EXPECT_FALSE(failed.success);
    EXPECT_TRUE(failed.positions.empty());
}

TEST(ParserTest, PositionFix)
{
    auto fix = Parser::parsePositionFix(R"({"success": true, "position": {"lat": 12.9, "lon": 77.5}})");
    ASSERT_TRUE(fix.has_value());
    EXPECT_DOUBLE_EQ(fix->lat, 12.9);

    EXPECT_FALSE(Parser::parsePositionFix(R"({"success": false})").has_value());
    EXPECT_FALSE(Parser::parsePositionFix(R"({"success": true, "position": {"lat": 1}})").has_value());
}

TEST(ParserTest, ControlResponses)
{
    auto ok = Parser::parseControlResult(R"({"success": true, "num_trains": 12})");
    EXPECT_TRUE(ok.success);
    EXPECT_TRUE(ok.error.empty());

    auto failed = Parser::parseControlResult(R"({"success": false, "error": "unknown train"})");
    EXPECT_FALSE(failed.success);
    EXPECT_EQ(failed.error, "unknown train");

    auto reseed = Parser::parseReseedResult(R"({"success": true, "num_trains": 12})");
    EXPECT_TRUE(reseed.result.success);
    EXPECT_EQ(reseed.trainCount, 12u);
    EXPECT_EQ(Parser::parseReseedResult(R"({"success": true, "num_trains": -3})").trainCount, 0u);

    auto sim = Parser::parseSimulationResult(R"({"success": true, "train_id": "SIM_12951",
        "route": ["BCT", "BVI", "ST"], "direction": "down"})");
    EXPECT_TRUE(sim.result.success);
    EXPECT_EQ(sim.trainId, "SIM_12951");
    EXPECT_EQ(sim.route.size(), 3u);
    EXPECT_EQ(sim.direction, "down");

    auto hits = Parser::parseSearchResults(R"({"trains": [{"Train_No": 12951, "Train_Name": "Rajdhani",
        "Source_Station_Name": "Mumbai Central", "Destination_Station_Name": "New Delhi"}]})");
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].trainNo, "12951");
    EXPECT_EQ(hits[0].destination, "New Delhi");
}
