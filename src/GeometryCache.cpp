#include "GeometryCache.hpp"
#include "NodeRegistry.hpp"
#include "Parser.hpp"

GeometryCache::GeometryCache(NodeRegistry const& registry, std::vector<NetworkEdge> const& edges)
{
    lines.reserve(edges.size());

    for (auto const& edge : edges)
    {
        std::vector<GeoPoint> points = resolveEdgeGeometry(edge, registry);
        if (points.size() < 2)
            continue;

        std::string key = edge.pairKey();
        if (!firstByKey.count(key))
            firstByKey[key] = lines.size();

        lines.push_back({std::move(key), std::move(points)});
    }
}

std::vector<GeoPoint> GeometryCache::resolveEdgeGeometry(NetworkEdge const& edge, NodeRegistry const& registry)
{
    // A LINESTRING is authoritative even when too little of it decodes.
    if (edge.geometryWkt && edge.geometryWkt->rfind("LINESTRING", 0) == 0)
        return Parser::decodeWktLineString(*edge.geometryWkt);

    auto a = registry.coordinate(edge.source);
    auto b = registry.coordinate(edge.target);
    if (a && b)
        return {*a, *b};

    return {};
}

std::vector<GeoPoint> const* GeometryCache::find(std::string const& pairKey) const
{
    auto it = firstByKey.find(pairKey);
    if (it == firstByKey.end())
        return nullptr;

    return &lines[it->second].points;
}
