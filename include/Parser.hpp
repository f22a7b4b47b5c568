#pragma once
#include <string>
#include <vector>
#include <optional>
#include <variant>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "Types.hpp"

// Thrown for any payload that cannot be decoded. Callers drop the message.
class PayloadError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

struct StateMessage
{
    std::vector<VehicleState> vehicles;
};

struct AlertsMessage
{
    std::vector<AlertRecord> alerts;
};

struct IgnoredMessage
{
    std::string type;
};

using PushMessage = std::variant<StateMessage, AlertsMessage, IgnoredMessage>;

struct LivePositionsResponse
{
    bool success = false;
    std::vector<LivePosition> positions;
    std::optional<std::vector<LiveRoute>> routes;
};

struct SimulationResult
{
    ControlResult result;
    std::string trainId;
    std::vector<std::string> route;
    std::string direction;
};

struct ReseedResult
{
    ControlResult result;
    std::size_t trainCount = 0;
};

struct TrainSearchHit
{
    std::string trainNo;
    std::string name;
    std::string source;
    std::string destination;
};

class Parser
{
public:
    static constexpr int kMaxDelayMinutes = 7 * 24 * 60;

    static Network parseNetwork(std::string const& data);
    static std::vector<VehicleState> parseTrains(std::string const& data);
    static PushMessage parsePushMessage(std::string const& data);
    static LivePositionsResponse parseLivePositions(std::string const& data);
    static std::optional<GeoPoint> parsePositionFix(std::string const& data);

    static ControlResult parseControlResult(std::string const& data);
    static SimulationResult parseSimulationResult(std::string const& data);
    static ReseedResult parseReseedResult(std::string const& data);
    static std::vector<TrainSearchHit> parseSearchResults(std::string const& data);

    // "LINESTRING(lon lat, lon lat, ...)" -> ordered (lat, lon) vertices.
    // Vertices that do not parse to finite numbers are skipped.
    static std::vector<GeoPoint> decodeWktLineString(std::string const& wkt);

private:
    static nlohmann::json parseDocument(std::string const& data);
    static std::vector<VehicleState> parseVehicleArray(nlohmann::json const& trains);
    static VehicleState parseVehicle(nlohmann::json const& j);
    static AlertRecord parseAlert(nlohmann::json const& j);
    static ControlResult controlResultOf(nlohmann::json const& doc);
    static std::vector<GeoPoint> parseCoordinatePairs(nlohmann::json const& j);

    static std::string stringField(nlohmann::json const& j, char const* key);
    static double numberField(nlohmann::json const& j, char const* key, double fallback);
    static std::optional<double> optionalNumberField(nlohmann::json const& j, char const* key);
    static bool boolField(nlohmann::json const& j, char const* key);

    // Whole minutes, clamped to [-kMaxDelayMinutes, kMaxDelayMinutes].
    static int minutesField(nlohmann::json const& j, char const* key);
};
