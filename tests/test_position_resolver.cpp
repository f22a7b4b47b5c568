#include <gtest/gtest.h>

#include "GeometryCache.hpp"
#include "NodeRegistry.hpp"
#include "PositionResolver.hpp"

namespace
{
    NetworkNode node(std::string id, std::optional<double> lat, std::optional<double> lon)
    {
        NetworkNode n;
        n.id = std::move(id);
        n.lat = lat;
        n.lon = lon;
        n.kind = "station";
        return n;
    }

    // Arc length from the start of the polyline to a point lying on it.
    double arcLengthTo(std::vector<GeoPoint> const& line, GeoPoint const& p)
    {
        double acc = 0.0;
        for (std::size_t i = 1; i < line.size(); ++i)
        {
            double seg = PositionResolver::haversineMeters(line[i - 1], line[i]);
            double toP = PositionResolver::haversineMeters(line[i - 1], p);
            double fromP = PositionResolver::haversineMeters(p, line[i]);
            if (std::abs(toP + fromP - seg) < 1e-3)
                return acc + toP;
            acc += seg;
        }
        return acc;
    }
}

TEST(PositionResolverTest, MidpointOfShortSegment)
{
    std::vector<GeoPoint> line = {{0.0, 0.0}, {0.0, 0.001}};

    auto p = PositionResolver::interpolate(line, 0.5);
    ASSERT_TRUE(p.has_value());
    EXPECT_NEAR(p->lat, 0.0, 1e-9);
    EXPECT_NEAR(p->lon, 0.0005, 1e-9);
}

TEST(PositionResolverTest, EndpointsMatchVertices)
{
    std::vector<GeoPoint> line = {{28.60, 77.20}, {28.61, 77.21}, {28.62, 77.20}};

    auto start = PositionResolver::interpolate(line, 0.0);
    auto end = PositionResolver::interpolate(line, 1.0);
    ASSERT_TRUE(start && end);
    EXPECT_DOUBLE_EQ(start->lat, 28.60);
    EXPECT_DOUBLE_EQ(start->lon, 77.20);
    EXPECT_DOUBLE_EQ(end->lat, 28.62);
    EXPECT_DOUBLE_EQ(end->lon, 77.20);
}

TEST(PositionResolverTest, ProgressOutsideRangeIsClamped)
{
    std::vector<GeoPoint> line = {{0.0, 0.0}, {0.0, 0.001}};

    auto before = PositionResolver::interpolate(line, -0.5);
    auto after = PositionResolver::interpolate(line, 2.0);
    ASSERT_TRUE(before && after);
    EXPECT_DOUBLE_EQ(before->lon, 0.0);
    EXPECT_DOUBLE_EQ(after->lon, 0.001);
}

TEST(PositionResolverTest, ArcLengthIsProportionalToProgress)
{
    std::vector<GeoPoint> line = {{0.0, 0.0}, {0.0, 0.001}, {0.001, 0.001}, {0.001, 0.003}};
    double total = PositionResolver::polylineLength(line);
    ASSERT_GT(total, 0.0);

    for (double p : {0.05, 0.2, 0.25, 0.5, 0.6, 0.75, 0.95})
    {
        auto point = PositionResolver::interpolate(line, p);
        ASSERT_TRUE(point.has_value()) << "p=" << p;
        EXPECT_NEAR(arcLengthTo(line, *point), p * total, total * 1e-3) << "p=" << p;
    }
}

TEST(PositionResolverTest, DegenerateEdgesYieldNoPoint)
{
    EXPECT_FALSE(PositionResolver::interpolate({}, 0.5).has_value());
    EXPECT_FALSE(PositionResolver::interpolate({{1.0, 1.0}}, 0.5).has_value());
    EXPECT_FALSE(PositionResolver::interpolate({{1.0, 1.0}, {1.0, 1.0}}, 0.5).has_value());
}

TEST(PositionResolverTest, HaversineOneDegreeOfLongitudeAtEquator)
{
    EXPECT_NEAR(PositionResolver::haversineMeters({0.0, 0.0}, {0.0, 1.0}), 111194.93, 1.0);
}

TEST(PositionResolverTest, FallsBackFromCacheToNodesToSource)
{
    NodeRegistry registry({
        node("A", 0.0, 0.0),
        node("B", 0.0, 0.001),
        node("C", std::nullopt, std::nullopt)
    });

    NetworkEdge curved;
    curved.source = "A";
    curved.target = "B";
    curved.geometryWkt = "LINESTRING(0 0, 0.0005 0.0005, 0.001 0)";

    GeometryCache cache(registry, {curved});
    PositionResolver resolver(cache, registry);

    // Cached polyline: the midpoint is the apex of the bend.
    auto cached = resolver.resolve(EdgeRef{"A", "B"}, 0.5);
    ASSERT_TRUE(cached.has_value());
    EXPECT_NEAR(cached->lat, 0.0005, 1e-6);
    EXPECT_NEAR(cached->lon, 0.0005, 1e-6);

    // Reverse direction is not cached: straight line between the nodes.
    auto straight = resolver.resolve(EdgeRef{"B", "A"}, 0.5);
    ASSERT_TRUE(straight.has_value());
    EXPECT_NEAR(straight->lat, 0.0, 1e-9);
    EXPECT_NEAR(straight->lon, 0.0005, 1e-9);

    // Target without coordinates: stationary at the source.
    auto atSource = resolver.resolve(EdgeRef{"A", "C"}, 0.7);
    ASSERT_TRUE(atSource.has_value());
    EXPECT_DOUBLE_EQ(atSource->lat, 0.0);
    EXPECT_DOUBLE_EQ(atSource->lon, 0.0);

    EXPECT_FALSE(resolver.resolve(EdgeRef{"C", "A"}, 0.5).has_value());
    EXPECT_FALSE(resolver.resolve(EdgeRef{"X", "Y"}, 0.5).has_value());
}
