#pragma once
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>
#include "Types.hpp"

class NodeRegistry
{
private:
    std::vector<NetworkNode> nodes;
    std::unordered_map<std::string, std::size_t> indexOf;
    std::optional<BoundingBox> bounds;

public:
    NodeRegistry() = default;
    explicit NodeRegistry(std::vector<NetworkNode> const& loaded);

    std::optional<GeoPoint> coordinate(std::string const& nodeId) const;
    std::string getName(std::string const& nodeId) const;
    std::vector<NetworkNode> stations() const;
    std::optional<BoundingBox> boundingBox() const noexcept { return bounds; }
    std::size_t size() const noexcept { return nodes.size(); }
};
