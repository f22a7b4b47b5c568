#pragma once
#include <string>
#include <vector>
#include <unordered_map>
#include "Types.hpp"

class NodeRegistry;

struct EdgePolyline
{
    std::string pairKey;
    std::vector<GeoPoint> points;
};

// Decoded track geometry, indexed by the directed "source|target" key.
// Built once per network load; the first edge seen for a key wins lookups.
class GeometryCache
{
private:
    std::vector<EdgePolyline> lines;
    std::unordered_map<std::string, std::size_t> firstByKey;

public:
    GeometryCache() = default;
    GeometryCache(NodeRegistry const& registry, std::vector<NetworkEdge> const& edges);

    // LINESTRING geometry when present, else a straight line between the
    // endpoint nodes. Fewer than two points means the edge is unresolvable.
    static std::vector<GeoPoint> resolveEdgeGeometry(NetworkEdge const& edge, NodeRegistry const& registry);

    std::vector<GeoPoint> const* find(std::string const& pairKey) const;
    std::vector<EdgePolyline> const& polylines() const noexcept { return lines; }
    std::size_t size() const noexcept { return firstByKey.size(); }
};
