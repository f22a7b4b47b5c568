#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include "Parser.hpp"

using nlohmann::json;

json Parser::parseDocument(std::string const& data)
{
    if (data.empty())
        throw PayloadError("empty payload");

    json doc = json::parse(data, nullptr, false);
    if (doc.is_discarded())
        throw PayloadError("payload is not valid JSON");
    if (!doc.is_object())
        throw PayloadError("payload is not a JSON object");

    return doc;
}

std::string Parser::stringField(json const& j, char const* key)
{
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return {};
    if (it->is_string())
        return it->get<std::string>();
    if (it->is_number())
        return it->dump();
    return {};
}

double Parser::numberField(json const& j, char const* key, double fallback)
{
    auto value = optionalNumberField(j, key);
    return value ? *value : fallback;
}

std::optional<double> Parser::optionalNumberField(json const& j, char const* key)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_number())
        return std::nullopt;

    double v = it->get<double>();
    if (!std::isfinite(v))
        return std::nullopt;
    return v;
}

bool Parser::boolField(json const& j, char const* key)
{
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (it->is_boolean())
        return it->get<bool>();
    if (it->is_number())
        return it->get<double>() != 0.0;
    return false;
}

int Parser::minutesField(json const& j, char const* key)
{
    double minutes = std::clamp(numberField(j, key, 0.0),
                                -static_cast<double>(kMaxDelayMinutes),
                                static_cast<double>(kMaxDelayMinutes));
    return static_cast<int>(minutes);
}

Network Parser::parseNetwork(std::string const& data)
{
    json doc = parseDocument(data);
    Network network;

    auto nodes = doc.find("nodes");
    if (nodes != doc.end() && nodes->is_array())
    {
        network.nodes.reserve(nodes->size());
        for (auto const& n : *nodes)
        {
            if (!n.is_object())
                continue;

            NetworkNode node;
            node.id   = stringField(n, "id");
            node.lat  = optionalNumberField(n, "lat");
            node.lon  = optionalNumberField(n, "lon");
            node.kind = stringField(n, "type");
            node.name = stringField(n, "name");

            if (node.id.empty())
                continue;
            network.nodes.push_back(std::move(node));
        }
    }

    auto edges = doc.find("edges");
    if (edges != doc.end() && edges->is_array())
    {
        network.edges.reserve(edges->size());
        for (auto const& e : *edges)
        {
            if (!e.is_object())
                continue;

            NetworkEdge edge;
            edge.source = stringField(e, "source");
            edge.target = stringField(e, "target");

            std::string wkt = stringField(e, "geometry_wkt");
            if (wkt.empty())
                wkt = stringField(e, "geometry");
            if (!wkt.empty())
                edge.geometryWkt = std::move(wkt);

            edge.lengthMeters = optionalNumberField(e, "length");
            edge.maxSpeed     = optionalNumberField(e, "max_speed");

            if (edge.source.empty() || edge.target.empty())
                continue;
            network.edges.push_back(std::move(edge));
        }
    }

    return network;
}

VehicleState Parser::parseVehicle(json const& j)
{
    if (!j.is_object())
        throw PayloadError("train entry is not an object");

    VehicleState v;
    v.id = stringField(j, "id");
    if (v.id.empty())
        v.id = stringField(j, "train_id");
    v.kind = stringField(j, "type");

    auto edge = j.find("edge");
    if (edge != j.end() && edge->is_object())
    {
        EdgeRef ref{stringField(*edge, "u"), stringField(*edge, "v")};
        if (!ref.u.empty() && !ref.v.empty())
            v.edge = std::move(ref);
    }

    v.progress             = std::clamp(numberField(j, "progress", 0.0), 0.0, 1.0);
    v.speedMetersPerSecond = numberField(j, "speed_mps", 0.0);
    v.edgeLengthMeters     = numberField(j, "edge_length_m", 0.0);
    v.status               = vehicleStatusFromString(stringField(j, "status"));
    v.delayMinutes         = minutesField(j, "delay_min");

    return v;
}

std::vector<VehicleState> Parser::parseVehicleArray(json const& trains)
{
    if (!trains.is_array())
        throw PayloadError("trains is not an array");

    std::vector<VehicleState> out;
    out.reserve(trains.size());
    for (auto const& t : trains)
        out.push_back(parseVehicle(t));
    return out;
}

std::vector<VehicleState> Parser::parseTrains(std::string const& data)
{
    json doc = parseDocument(data);

    auto trains = doc.find("trains");
    if (trains == doc.end() || trains->is_null())
        return {};

    return parseVehicleArray(*trains);
}

AlertRecord Parser::parseAlert(json const& j)
{
    if (!j.is_object())
        throw PayloadError("alert entry is not an object");

    AlertRecord a;
    auto pair = j.find("pair");
    if (pair != j.end() && pair->is_object())
    {
        a.participantA = stringField(*pair, "a");
        a.participantB = stringField(*pair, "b");
    }

    a.severity                     = alertSeverityFromString(stringField(j, "severity"));
    a.distanceMeters               = numberField(j, "distance_m", 0.0);
    a.relativeSpeedMetersPerSecond = numberField(j, "relative_speed_mps", 0.0);
    a.sameEdge                     = boolField(j, "same_edge");
    a.oppositeEdge                 = boolField(j, "opposite_edge");

    auto suggestions = j.find("suggestions");
    if (suggestions != j.end() && suggestions->is_array())
    {
        for (auto const& s : *suggestions)
        {
            if (s.is_string())
                a.suggestions.push_back(s.get<std::string>());
        }
    }

    return a;
}

PushMessage Parser::parsePushMessage(std::string const& data)
{
    json doc = parseDocument(data);
    std::string type = stringField(doc, "type");

    if (type == "state")
    {
        auto body = doc.find("data");
        if (body == doc.end() || !body->is_object())
            throw PayloadError("state message without data");

        auto trains = body->find("trains");
        if (trains == body->end())
            throw PayloadError("state message without trains");

        return StateMessage{parseVehicleArray(*trains)};
    }

    if (type == "alerts")
    {
        auto body = doc.find("data");
        if (body == doc.end() || !body->is_array())
            throw PayloadError("alerts message data is not an array");

        AlertsMessage msg;
        msg.alerts.reserve(body->size());
        for (auto const& a : *body)
            msg.alerts.push_back(parseAlert(a));
        return msg;
    }

    return IgnoredMessage{type};
}

std::vector<GeoPoint> Parser::parseCoordinatePairs(json const& j)
{
    std::vector<GeoPoint> out;
    if (!j.is_array())
        return out;

    for (auto const& c : j)
    {
        if (c.is_array() && c.size() >= 2 && c[0].is_number() && c[1].is_number())
        {
            out.push_back({c[0].get<double>(), c[1].get<double>()});
        }
        else if (c.is_object())
        {
            auto lat = optionalNumberField(c, "lat");
            auto lon = optionalNumberField(c, "lon");
            if (lat && lon)
                out.push_back({*lat, *lon});
        }
    }
    return out;
}

LivePositionsResponse Parser::parseLivePositions(std::string const& data)
{
    json doc = parseDocument(data);

    LivePositionsResponse response;
    response.success = boolField(doc, "success");
    if (!response.success)
        return response;

    auto rows = doc.find("data");
    if (rows != doc.end() && rows->is_array())
    {
        for (auto const& r : *rows)
        {
            if (!r.is_object())
                continue;

            auto lat = optionalNumberField(r, "lat");
            auto lon = optionalNumberField(r, "lon");
            if (!lat || !lon)
                continue;

            LivePosition p;
            p.trainId   = stringField(r, "train_id");
            p.position  = {*lat, *lon};
            p.color     = stringField(r, "color");
            p.progress  = std::clamp(numberField(r, "progress", 0.0), 0.0, 1.0);
            p.direction = numberField(r, "direction", 1.0) > 0.0 ? 1 : -1;
            response.positions.push_back(std::move(p));
        }
    }

    auto routes = doc.find("routes");
    if (routes != doc.end() && routes->is_array())
    {
        std::vector<LiveRoute> parsed;
        for (auto const& r : *routes)
        {
            if (!r.is_object())
                continue;

            LiveRoute route;
            auto coords = r.find("coordinates");
            if (coords != r.end())
                route.coordinates = parseCoordinatePairs(*coords);
            route.color = stringField(r, "color");
            parsed.push_back(std::move(route));
        }
        response.routes = std::move(parsed);
    }

    return response;
}

std::optional<GeoPoint> Parser::parsePositionFix(std::string const& data)
{
    json doc = parseDocument(data);
    if (!boolField(doc, "success"))
        return std::nullopt;

    auto position = doc.find("position");
    if (position == doc.end() || !position->is_object())
        return std::nullopt;

    auto lat = optionalNumberField(*position, "lat");
    auto lon = optionalNumberField(*position, "lon");
    if (!lat || !lon)
        return std::nullopt;

    return GeoPoint{*lat, *lon};
}

ControlResult Parser::parseControlResult(std::string const& data)
{
    return controlResultOf(parseDocument(data));
}

ControlResult Parser::controlResultOf(json const& doc)
{
    ControlResult result;
    result.success = boolField(doc, "success");
    result.error   = stringField(doc, "error");
    if (!result.success && result.error.empty())
        result.error = "request was not successful";
    return result;
}

SimulationResult Parser::parseSimulationResult(std::string const& data)
{
    json doc = parseDocument(data);

    SimulationResult sim;
    sim.result    = controlResultOf(doc);
    sim.trainId   = stringField(doc, "train_id");
    sim.direction = stringField(doc, "direction");

    auto route = doc.find("route");
    if (route != doc.end() && route->is_array())
    {
        for (auto const& stop : *route)
        {
            if (stop.is_string())
                sim.route.push_back(stop.get<std::string>());
        }
    }
    return sim;
}

ReseedResult Parser::parseReseedResult(std::string const& data)
{
    json doc = parseDocument(data);

    ReseedResult reseed;
    reseed.result = controlResultOf(doc);

    double count = numberField(doc, "num_trains", 0.0);
    if (count > 0.0 && count < 1e9)
        reseed.trainCount = static_cast<std::size_t>(count);
    return reseed;
}

std::vector<TrainSearchHit> Parser::parseSearchResults(std::string const& data)
{
    json doc = parseDocument(data);
    std::vector<TrainSearchHit> hits;

    auto trains = doc.find("trains");
    if (trains == doc.end() || !trains->is_array())
        return hits;

    for (auto const& t : *trains)
    {
        if (!t.is_object())
            continue;

        TrainSearchHit hit;
        hit.trainNo     = stringField(t, "Train_No");
        hit.name        = stringField(t, "Train_Name");
        hit.source      = stringField(t, "Source_Station_Name");
        hit.destination = stringField(t, "Destination_Station_Name");
        hits.push_back(std::move(hit));
    }
    return hits;
}

std::vector<GeoPoint> Parser::decodeWktLineString(std::string const& wkt)
{
    std::vector<GeoPoint> points;
    if (wkt.rfind("LINESTRING", 0) != 0)
        return points;

    auto open  = wkt.find('(');
    auto close = wkt.rfind(')');
    if (open == std::string::npos || close == std::string::npos || close <= open)
        return points;

    std::stringstream inside(wkt.substr(open + 1, close - open - 1));
    std::string part;

    while (std::getline(inside, part, ','))
    {
        std::stringstream coords(part);
        std::string lonStr, latStr;
        coords >> lonStr >> latStr;
        if (lonStr.empty() || latStr.empty())
            continue;

        char* endLon = nullptr;
        char* endLat = nullptr;
        double lon = std::strtod(lonStr.c_str(), &endLon);
        double lat = std::strtod(latStr.c_str(), &endLat);

        if (*endLon != '\0' || *endLat != '\0')
            continue;
        if (!std::isfinite(lat) || !std::isfinite(lon))
            continue;

        points.push_back({lat, lon});
    }

    return points;
}
