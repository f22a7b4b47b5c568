#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "GeometryCache.hpp"
#include "Types.hpp"

class NodeRegistry;
class PositionResolver;

struct StationMarker
{
    std::string id;
    std::string name;
    GeoPoint position;
};

struct RenderFrame
{
    // Static layers, replaced on each network load.
    std::vector<EdgePolyline> tracks;
    std::vector<StationMarker> stations;
    std::optional<BoundingBox> bounds;
    std::uint64_t networkVersion = 0;

    std::vector<RenderedVehicle> vehicles;
    std::vector<std::string> occupiedEdges;
    std::vector<std::string> highlightedEdges;
    LiveOverlay overlay;
    std::optional<LocatedVehicle> located;
    bool playing = true;
    std::uint64_t snapshotSequence = 0;
    std::size_t droppedVehicles = 0;
};

// Builds the render set handed to the map consumer each frame.
class MapScene
{
private:
    PositionResolver const& resolver;

    std::vector<std::string> highlighted;
    std::optional<LocatedVehicle> located;

    std::vector<std::string> occupied;
    std::uint64_t occupiedSequence = 0;

    RenderFrame frame;

public:
    explicit MapScene(PositionResolver const& positions);

    void setNetwork(NodeRegistry const& registry, GeometryCache const& geometry, std::uint64_t version);
    void highlightRoute(std::vector<std::string> const& nodeIds);
    void setLocated(LocatedVehicle vehicle);

    RenderFrame const& compose(std::vector<VehicleState> const& display,
                               std::uint64_t snapshotSequence,
                               LiveOverlay const& overlay,
                               bool playing);

    RenderFrame const& currentFrame() const noexcept { return frame; }

    static std::vector<std::string> routeEdgeKeys(std::vector<std::string> const& nodeIds);
    static std::vector<std::string> occupiedEdgeKeys(std::vector<VehicleState> const& vehicles);
};
