#include <algorithm>
#include "NodeRegistry.hpp"

NodeRegistry::NodeRegistry(std::vector<NetworkNode> const& loaded)
{
    nodes.reserve(loaded.size());

    for (auto const& node : loaded)
    {
        // Node ids are unique in a well-formed network; keep the first if not.
        if (indexOf.count(node.id))
            continue;

        indexOf[node.id] = nodes.size();
        nodes.push_back(node);

        if (!node.hasCoordinates())
            continue;

        double lat = *node.lat;
        double lon = *node.lon;
        if (!bounds)
        {
            bounds = BoundingBox{lat, lat, lon, lon};
        }
        else
        {
            bounds->minLat = std::min(bounds->minLat, lat);
            bounds->maxLat = std::max(bounds->maxLat, lat);
            bounds->minLon = std::min(bounds->minLon, lon);
            bounds->maxLon = std::max(bounds->maxLon, lon);
        }
    }
}

std::optional<GeoPoint> NodeRegistry::coordinate(std::string const& nodeId) const
{
    auto it = indexOf.find(nodeId);
    if (it == indexOf.end())
        return std::nullopt;

    NetworkNode const& node = nodes[it->second];
    if (!node.hasCoordinates())
        return std::nullopt;

    return GeoPoint{*node.lat, *node.lon};
}

std::string NodeRegistry::getName(std::string const& nodeId) const
{
    auto it = indexOf.find(nodeId);
    if (it != indexOf.end() && !nodes[it->second].name.empty())
        return nodes[it->second].name;

    return nodeId;
}

std::vector<NetworkNode> NodeRegistry::stations() const
{
    std::vector<NetworkNode> out;
    for (auto const& node : nodes)
    {
        if (node.kind == "station")
            out.push_back(node);
    }
    return out;
}
