#include <algorithm>
#include <cmath>
#include "PositionResolver.hpp"
#include "GeometryCache.hpp"
#include "NodeRegistry.hpp"

namespace
{
    constexpr double kDegToRad = 3.14159265358979323846 / 180.0;
}

PositionResolver::PositionResolver(GeometryCache const& cache, NodeRegistry const& nodes)
    : geometry(cache)
    , registry(nodes)
{
}

std::optional<GeoPoint> PositionResolver::resolve(EdgeRef const& edge, double progress) const
{
    if (auto const* cached = geometry.find(edge.pairKey()))
        return interpolate(*cached, progress);

    auto a = registry.coordinate(edge.u);
    auto b = registry.coordinate(edge.v);
    if (a && b)
        return interpolate({*a, *b}, progress);

    // Rendered as stationary at the source node.
    if (a)
        return a;

    return std::nullopt;
}

double PositionResolver::haversineMeters(GeoPoint const& a, GeoPoint const& b)
{
    double dLat = (b.lat - a.lat) * kDegToRad;
    double dLon = (b.lon - a.lon) * kDegToRad;
    double lat1 = a.lat * kDegToRad;
    double lat2 = b.lat * kDegToRad;

    double h = std::sin(dLat / 2) * std::sin(dLat / 2)
             + std::cos(lat1) * std::cos(lat2) * std::sin(dLon / 2) * std::sin(dLon / 2);

    return 2.0 * kEarthRadiusMeters * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));
}

double PositionResolver::polylineLength(std::vector<GeoPoint> const& polyline)
{
    double total = 0.0;
    for (std::size_t i = 1; i < polyline.size(); ++i)
        total += haversineMeters(polyline[i - 1], polyline[i]);
    return total;
}

std::optional<GeoPoint> PositionResolver::interpolate(std::vector<GeoPoint> const& polyline, double progress)
{
    if (polyline.size() < 2)
        return std::nullopt;

    double total = polylineLength(polyline);
    if (!(total > 0.0))
        return std::nullopt;

    double p = std::clamp(progress, 0.0, 1.0);
    if (p >= 1.0)
        return polyline.back();

    double target = p * total;
    double acc = 0.0;

    for (std::size_t i = 1; i < polyline.size(); ++i)
    {
        GeoPoint const& a = polyline[i - 1];
        GeoPoint const& b = polyline[i];
        double d = haversineMeters(a, b);

        if (acc + d >= target)
        {
            double f = d > 0.0 ? (target - acc) / d : 0.0;
            return GeoPoint{a.lat + (b.lat - a.lat) * f, a.lon + (b.lon - a.lon) * f};
        }
        acc += d;
    }

    // Floating-point shortfall on the last segment.
    return polyline.back();
}
