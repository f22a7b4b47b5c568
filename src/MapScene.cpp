#include <algorithm>
#include "MapScene.hpp"
#include "NodeRegistry.hpp"
#include "PositionResolver.hpp"

MapScene::MapScene(PositionResolver const& positions)
    : resolver(positions)
{
}

std::vector<std::string> MapScene::routeEdgeKeys(std::vector<std::string> const& nodeIds)
{
    std::vector<std::string> route;
    for (auto const& id : nodeIds)
    {
        if (!id.empty())
            route.push_back(id);
    }

    std::vector<std::string> keys;
    for (std::size_t i = 0; i + 1 < route.size(); ++i)
        keys.push_back(route[i] + "|" + route[i + 1]);

    std::sort(keys.begin(), keys.end());
    keys.erase(std::unique(keys.begin(), keys.end()), keys.end());
    return keys;
}

std::vector<std::string> MapScene::occupiedEdgeKeys(std::vector<VehicleState> const& vehicles)
{
    std::vector<std::string> keys;
    for (auto const& v : vehicles)
    {
        if (v.edge)
            keys.push_back(v.edge->pairKey());
    }

    std::sort(keys.begin(), keys.end());
    keys.erase(std::unique(keys.begin(), keys.end()), keys.end());
    return keys;
}

void MapScene::setNetwork(NodeRegistry const& registry, GeometryCache const& geometry, std::uint64_t version)
{
    if (version == frame.networkVersion)
        return;

    frame.tracks = geometry.polylines();
    frame.stations.clear();
    for (auto const& node : registry.stations())
    {
        if (node.hasCoordinates())
            frame.stations.push_back({node.id, registry.getName(node.id), GeoPoint{*node.lat, *node.lon}});
    }
    frame.bounds = registry.boundingBox();
    frame.networkVersion = version;
}

void MapScene::highlightRoute(std::vector<std::string> const& nodeIds)
{
    highlighted = routeEdgeKeys(nodeIds);
}

void MapScene::setLocated(LocatedVehicle vehicle)
{
    located = std::move(vehicle);
}

RenderFrame const& MapScene::compose(std::vector<VehicleState> const& display,
                                     std::uint64_t snapshotSequence,
                                     LiveOverlay const& overlay,
                                     bool playing)
{
    // Edge assignment only changes with a new authoritative snapshot.
    if (snapshotSequence != occupiedSequence || snapshotSequence == 0)
    {
        occupied = occupiedEdgeKeys(display);
        occupiedSequence = snapshotSequence;
    }

    frame.vehicles.clear();
    frame.vehicles.reserve(display.size());
    frame.droppedVehicles = 0;

    for (auto const& v : display)
    {
        std::optional<GeoPoint> point;
        if (v.edge)
            point = resolver.resolve(*v.edge, v.progress);

        if (!point)
        {
            ++frame.droppedVehicles;
            continue;
        }

        frame.vehicles.push_back({v.id, *point, v.status, v.progress});
    }

    frame.occupiedEdges    = occupied;
    frame.highlightedEdges = highlighted;
    frame.overlay          = overlay;
    frame.located          = located;
    frame.playing          = playing;
    frame.snapshotSequence = snapshotSequence;

    return frame;
}
