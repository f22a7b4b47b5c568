#pragma once
#include <optional>
#include <vector>
#include "Types.hpp"

class GeometryCache;
class NodeRegistry;

// Maps (edge, progress) to a geographic point by walking the edge polyline.
class PositionResolver
{
private:
    GeometryCache const& geometry;
    NodeRegistry const& registry;

public:
    static constexpr double kEarthRadiusMeters = 6371000.0;

    PositionResolver(GeometryCache const& cache, NodeRegistry const& nodes);

    // Fallback order: cached polyline, straight line between the endpoint
    // nodes, the source node itself. nullopt drops the vehicle for the frame.
    std::optional<GeoPoint> resolve(EdgeRef const& edge, double progress) const;

    static std::optional<GeoPoint> interpolate(std::vector<GeoPoint> const& polyline, double progress);
    static double haversineMeters(GeoPoint const& a, GeoPoint const& b);
    static double polylineLength(std::vector<GeoPoint> const& polyline);
};
