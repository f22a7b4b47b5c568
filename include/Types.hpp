#pragma once
#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstddef>
#include <cstdint>

using MonotonicTime = std::chrono::steady_clock::time_point;
using WallTime      = std::chrono::system_clock::time_point;

struct GeoPoint
{
    double lat = 0.0;
    double lon = 0.0;
};

struct BoundingBox
{
    double minLat;
    double maxLat;
    double minLon;
    double maxLon;
};

struct NetworkNode
{
    std::string id;
    std::optional<double> lat;
    std::optional<double> lon;
    std::string kind;         // "station", "junction", ...
    std::string name;

    bool hasCoordinates() const { return lat.has_value() && lon.has_value(); }
};

struct NetworkEdge
{
    std::string source;
    std::string target;
    std::optional<std::string> geometryWkt;   // LINESTRING(lon lat, ...)
    std::optional<double> lengthMeters;
    std::optional<double> maxSpeed;

    std::string pairKey() const { return source + "|" + target; }
};

struct Network
{
    std::vector<NetworkNode> nodes;
    std::vector<NetworkEdge> edges;
};

struct EdgeRef
{
    std::string u;
    std::string v;

    std::string pairKey() const { return u + "|" + v; }
};

enum class VehicleStatus
{
    Running,
    Stopped,
    Held,
    Unknown
};

// One train as reported by an authoritative update.
struct VehicleState
{
    std::string id;
    std::string kind;
    std::optional<EdgeRef> edge;   // absent until the train enters the network
    double progress = 0.0;         // clamped to [0,1] on decode
    double speedMetersPerSecond = 0.0;
    double edgeLengthMeters = 0.0;
    VehicleStatus status = VehicleStatus::Unknown;
    int delayMinutes = 0;
};

struct TelemetrySnapshot
{
    std::vector<VehicleState> vehicles;
    MonotonicTime receivedAt{};
    std::uint64_t sequence = 0;    // 0 = nothing received yet
};

enum class AlertSeverity
{
    Info = 0,
    Warn = 1,
    Critical = 2
};

struct AlertRecord
{
    std::string participantA;
    std::string participantB;
    AlertSeverity severity = AlertSeverity::Info;
    double distanceMeters = 0.0;
    double relativeSpeedMetersPerSecond = 0.0;
    bool sameEdge = false;
    bool oppositeEdge = false;
    std::vector<std::string> suggestions;

    std::string pairKey() const;
};

enum class TransportMode
{
    Connecting,
    Live,
    Degraded
};

// What the status indicator and error banner show.
struct TransportStatus
{
    TransportMode mode = TransportMode::Connecting;
    bool replay = false;
    bool pollingActive = false;
    int reconnectAttempts = 0;
    std::size_t overlayFailures = 0;
    std::size_t droppedMessages = 0;
    std::string lastError;
};

struct LivePosition
{
    std::string trainId;
    GeoPoint position;
    std::string color;
    double progress = 0.0;
    int direction = 1;
};

struct LiveRoute
{
    std::vector<GeoPoint> coordinates;
    std::string color;
};

// Secondary position set fed by the fast-poll feed.
struct LiveOverlay
{
    std::vector<LivePosition> positions;
    std::vector<LiveRoute> routes;
};

struct LocatedVehicle
{
    std::string id;
    GeoPoint position;
};

struct RenderedVehicle
{
    std::string id;
    GeoPoint position;
    VehicleStatus status = VehicleStatus::Unknown;
    double progress = 0.0;
};

struct ControlResult
{
    bool success = false;
    std::string error;
};

std::string toString(VehicleStatus status);
std::string toString(AlertSeverity severity);
std::string toString(TransportMode mode);
VehicleStatus vehicleStatusFromString(std::string const& text);
AlertSeverity alertSeverityFromString(std::string const& text);
