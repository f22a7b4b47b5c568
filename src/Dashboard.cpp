#include <cctype>
#include <sstream>
#include <iomanip>
#include <date/tz.h>
#include <nlohmann/json.hpp>
#include "Dashboard.hpp"
#include "SessionClock.hpp"
#include "TelemetryClient.hpp"

using namespace date;
using namespace std::chrono;

std::string Dashboard::formatClock(WallTime t, std::string const& zone)
{
    auto secs = date::floor<seconds>(t);
    try
    {
        zoned_time local{date::locate_zone(zone), secs};
        return date::format("%H:%M:%S %Z", local);
    }
    catch (std::runtime_error const&)
    {
        // Unknown zone name: show UTC rather than nothing.
        return date::format("%H:%M:%S UTC", secs);
    }
}

std::string Dashboard::htmlEscape(std::string const& text)
{
    std::string out;
    out.reserve(text.size());
    for (char c : text)
    {
        switch (c)
        {
            case '&':  out += "&amp;";  break;
            case '<':  out += "&lt;";   break;
            case '>':  out += "&gt;";   break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&#39;";  break;
            default:   out.push_back(c);
        }
    }
    return out;
}

std::string Dashboard::modeLabel(TransportStatus const& status)
{
    if (status.replay)
        return "Replay";

    switch (status.mode)
    {
        case TransportMode::Live:       return "Live";
        case TransportMode::Degraded:   return "Polling";
        case TransportMode::Connecting: break;
    }
    return status.pollingActive ? "Polling" : "Connecting";
}

std::string Dashboard::buildHtmlHead(DashboardView const& view)
{
    std::stringstream ss;

    ss << "<html><head><title>Railway Live Monitor</title>"
       << "<style>"
       << "body { font-family: sans-serif; background: #1a1a1a; color: #ddd; padding: 20px; }"
       << "h1 { color: #3498db; border-bottom: 2px solid #444; padding-bottom: 10px; }"
       << "h2 { color: #bbb; margin-top: 30px; }"
       << "table { width: 100%; border-collapse: collapse; margin-top: 10px; }"
       << "th { text-align: left; background: #333; padding: 8px; border-bottom: 2px solid #555; }"
       << "td { padding: 8px; border-bottom: 1px solid #333; }"
       << "tr:hover { background: #2c2c2c; }"
       << "a { color: #3498db; }"
       << ".mode { padding: 3px 8px; border-radius: 3px; font-weight: bold; }"
       << ".mode-live { background: #27ae60; color: #fff; }"
       << ".mode-polling { background: #f39c12; color: #111; }"
       << ".mode-connecting { background: #555; color: #fff; }"
       << ".mode-replay { background: #8e44ad; color: #fff; }"
       << ".banner { background: #5c1f1f; border-left: 5px solid #e74c3c; padding: 10px; margin: 10px 0; }"
       << ".toast { background: #e74c3c; color: #fff; padding: 12px; margin: 10px 0; font-weight: bold; }"
       << ".severity-critical { border-left: 5px solid #e74c3c; }"
       << ".severity-warn { border-left: 5px solid #f1c40f; }"
       << ".severity-info { border-left: 5px solid #3498db; }"
       << ".badge { background: #444; padding: 2px 5px; border-radius: 3px; "
                     "font-size: 0.8em; margin-right:5px;}"
       << ".bar { background: #333; width: 120px; height: 8px; display: inline-block; }"
       << ".bar span { background: #3498db; height: 8px; display: block; }"
       << "</style>"
       << "<meta charset='UTF-8'>"
       << "<meta http-equiv='refresh' content='2'>"
       << "</head><body>";

    ss << "<h1>Railway Live Monitor</h1>";
    ss << "<p>" << formatClock(view.now, view.timeZone) << " &middot; "
       << view.stationCount << " stations &middot; "
       << view.frame.vehicles.size() << " trains on map";
    if (view.frame.droppedVehicles > 0)
        ss << " (" << view.frame.droppedVehicles << " unplaced)";
    ss << " &middot; " << view.frame.overlay.positions.size() << " live positions</p>";

    return ss.str();
}

std::string Dashboard::buildStatusBar(DashboardView const& view)
{
    std::string label = modeLabel(view.transport);
    std::string css = label;
    for (auto& c : css)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    std::stringstream ss;
    ss << "<p>Feed: <span class='mode mode-" << css << "'>" << label << "</span>";
    if (view.transport.reconnectAttempts > 0)
        ss << " <span class='badge'>retry " << view.transport.reconnectAttempts << "</span>";
    ss << " &middot; Playback: " << (view.frame.playing ? "playing" : "paused")
       << " (<a href='/playback?playing=" << (view.frame.playing ? "0" : "1") << "'>"
       << (view.frame.playing ? "pause" : "play") << "</a>)";
    if (view.frame.located)
    {
        ss << " &middot; Located: <b>" << htmlEscape(view.frame.located->id) << "</b> at "
           << std::fixed << std::setprecision(5)
           << view.frame.located->position.lat << ", " << view.frame.located->position.lon;
    }
    ss << "</p>";

    if (!view.transport.lastError.empty())
    {
        ss << "<div class='banner'>" << htmlEscape(view.transport.lastError) << "</div>";
    }

    return ss.str();
}

std::string Dashboard::buildToast(CriticalToast const& toast, std::string const& zone)
{
    std::stringstream ss;
    ss << "<div class='toast'>CRITICAL: " << htmlEscape(toast.alert.participantA)
       << " &harr; " << htmlEscape(toast.alert.participantB)
       << " at " << std::fixed << std::setprecision(0) << toast.alert.distanceMeters << " m"
       << " <span style='font-weight:normal'>(" << formatClock(toast.raisedAt, zone) << ")</span>"
       << " <a style='color:#fff' href='/toast/dismiss'>hide</a></div>";
    return ss.str();
}

std::string Dashboard::buildAlertRow(AlertRecord const& a)
{
    std::string severity = toString(a.severity);

    std::stringstream ss;
    ss << "<tr class='severity-" << severity << "'>"
       << "<td><b>" << htmlEscape(a.participantA) << "</b> &harr; <b>" << htmlEscape(a.participantB) << "</b></td>"
       << "<td>" << severity << "</td>"
       << "<td>" << std::fixed << std::setprecision(0) << a.distanceMeters << " m</td>"
       << "<td>" << std::setprecision(1) << a.relativeSpeedMetersPerSecond << " m/s</td>"
       << "<td>";
    if (a.sameEdge)
        ss << "<span class='badge'>same edge</span>";
    if (a.oppositeEdge)
        ss << "<span class='badge'>opposite</span>";
    ss << "</td><td>";
    for (auto const& s : a.suggestions)
        ss << "<div>" << htmlEscape(s) << "</div>";
    ss << "</td>"
       << "<td><a href='/dismiss?pair=" << TelemetryClient::encodeComponent(a.pairKey()) << "'>dismiss</a></td>"
       << "</tr>";

    return ss.str();
}

std::string Dashboard::buildAlertTable(std::vector<AlertRecord> const& alerts)
{
    std::stringstream ss;
    ss << "<h2>Alerts (" << alerts.size() << ")</h2>";
    if (alerts.empty())
    {
        ss << "<p style='color:#777'>No active alerts.</p>";
        return ss.str();
    }

    ss << "<table><thead><tr>"
       << "<th>Pair</th><th>Severity</th><th>Distance</th><th>Closing</th>"
       << "<th>Edge</th><th>Suggestions</th><th></th>"
       << "</tr></thead><tbody>";
    for (auto const& a : alerts)
        ss << buildAlertRow(a);
    ss << "</tbody></table>";

    return ss.str();
}

std::string Dashboard::buildTimelineRow(VehicleState const& v)
{
    int percent = static_cast<int>(v.progress * 100.0 + 0.5);

    std::stringstream ss;
    ss << "<tr>"
       << "<td><b>" << htmlEscape(v.id) << "</b>";
    if (!v.kind.empty())
        ss << " <span class='badge'>" << htmlEscape(v.kind) << "</span>";
    ss << "</td>"
       << "<td>" << (v.edge ? htmlEscape(v.edge->u) + " &rarr; " + htmlEscape(v.edge->v) : "<span style='color:#777'>off network</span>") << "</td>"
       << "<td>" << toString(v.status) << "</td>"
       << "<td><div class='bar'><span style='width:" << percent << "%'></span></div> " << percent << "%</td>"
       << "<td>" << std::fixed << std::setprecision(1) << v.speedMetersPerSecond << " m/s</td>"
       << "<td>" << (v.delayMinutes > 0 ? "+" + std::to_string(v.delayMinutes) + "m" : "on time") << "</td>"
       << "<td><a href='/locate?train=" << TelemetryClient::encodeComponent(v.id) << "'>locate</a></td>"
       << "</tr>";

    return ss.str();
}

std::string Dashboard::buildTimeline(DashboardView const& view)
{
    std::stringstream ss;
    ss << "<h2>Timeline (" << view.display.size() << " trains)</h2>";
    ss << "<table><thead><tr>"
       << "<th>Train</th><th>Edge</th><th>Status</th><th>Progress</th>"
       << "<th>Speed</th><th>Delay</th><th></th>"
       << "</tr></thead><tbody>";
    for (auto const& v : view.display)
        ss << buildTimelineRow(v);
    ss << "</tbody></table>";

    return ss.str();
}

std::string Dashboard::buildHistory(std::vector<AlertLogEntry> const& history, std::string const& zone)
{
    std::stringstream ss;
    ss << "<h2>Alert history</h2>";
    if (history.empty())
    {
        ss << "<p style='color:#777'>Nothing logged yet.</p>";
        return ss.str();
    }

    ss << "<table><thead><tr><th>Time</th><th>Pair</th><th>Severity</th><th>Distance</th></tr></thead><tbody>";
    for (auto const& h : history)
    {
        WallTime at{milliseconds(h.timestampMs)};
        ss << "<tr class='severity-" << htmlEscape(h.severity) << "'>"
           << "<td>" << formatClock(at, zone) << "</td>"
           << "<td>" << htmlEscape(h.pairKey) << "</td>"
           << "<td>" << htmlEscape(h.severity) << "</td>"
           << "<td>" << std::fixed << std::setprecision(0) << h.distanceMeters << " m</td>"
           << "</tr>";
    }
    ss << "</tbody></table>";

    return ss.str();
}

std::string Dashboard::generate(DashboardView const& view)
{
    std::stringstream ss;
    ss << buildHtmlHead(view);
    ss << buildStatusBar(view);

    if (view.toast)
        ss << buildToast(*view.toast, view.timeZone);

    ss << buildAlertTable(view.alerts);
    ss << buildTimeline(view);
    ss << buildHistory(view.history, view.timeZone);

    ss << "<p style='color:#666; font-size:0.8em'>Feeds: ";
    for (auto const& f : view.feeds)
        ss << "<span class='badge'>" << htmlEscape(f.name) << " " << htmlEscape(f.url) << "</span>";
    ss << "</p></body></html>";

    return ss.str();
}

std::string Dashboard::sceneJson(DashboardView const& view)
{
    using nlohmann::json;

    auto point = [](GeoPoint const& p) { return json::array({p.lat, p.lon}); };

    json vehicles = json::array();
    for (auto const& v : view.frame.vehicles)
    {
        vehicles.push_back({
            {"id", v.id},
            {"position", point(v.position)},
            {"status", toString(v.status)},
            {"progress", v.progress}
        });
    }

    json overlay = json::array();
    for (auto const& p : view.frame.overlay.positions)
    {
        overlay.push_back({
            {"train_id", p.trainId},
            {"position", point(p.position)},
            {"color", p.color},
            {"progress", p.progress},
            {"direction", p.direction}
        });
    }

    json routes = json::array();
    for (auto const& r : view.frame.overlay.routes)
    {
        json coords = json::array();
        for (auto const& c : r.coordinates)
            coords.push_back(point(c));
        routes.push_back({{"coordinates", coords}, {"color", r.color}});
    }

    json tracks = json::array();
    for (auto const& line : view.frame.tracks)
    {
        json coords = json::array();
        for (auto const& c : line.points)
            coords.push_back(point(c));
        tracks.push_back({{"pair", line.pairKey}, {"coordinates", coords}});
    }

    json stations = json::array();
    for (auto const& st : view.frame.stations)
        stations.push_back({{"id", st.id}, {"name", st.name}, {"position", point(st.position)}});

    json alerts = json::array();
    for (auto const& a : view.alerts)
    {
        alerts.push_back({
            {"pair", a.pairKey()},
            {"severity", toString(a.severity)},
            {"distance_m", a.distanceMeters},
            {"relative_speed_mps", a.relativeSpeedMetersPerSecond},
            {"same_edge", a.sameEdge},
            {"opposite_edge", a.oppositeEdge},
            {"suggestions", a.suggestions}
        });
    }

    json doc = {
        {"mode", modeLabel(view.transport)},
        {"error", view.transport.lastError},
        {"playing", view.frame.playing},
        {"sequence", view.frame.snapshotSequence},
        {"vehicles", vehicles},
        {"dropped", view.frame.droppedVehicles},
        {"occupied_edges", view.frame.occupiedEdges},
        {"highlighted_edges", view.frame.highlightedEdges},
        {"overlay", {{"positions", overlay}, {"routes", routes}}},
        {"alerts", alerts},
        {"network_version", view.frame.networkVersion},
        {"tracks", tracks},
        {"stations", stations},
        {"time", formatClock(view.now, view.timeZone)}
    };

    if (auto const& b = view.frame.bounds)
        doc["bounds"] = {{"min_lat", b->minLat}, {"max_lat", b->maxLat}, {"min_lon", b->minLon}, {"max_lon", b->maxLon}};
    else
        doc["bounds"] = nullptr;

    if (view.frame.located)
        doc["located"] = {{"id", view.frame.located->id}, {"position", point(view.frame.located->position)}};
    else
        doc["located"] = nullptr;

    if (view.toast)
        doc["toast"] = {{"pair", view.toast->alert.pairKey()}, {"distance_m", view.toast->alert.distanceMeters}};
    else
        doc["toast"] = nullptr;

    // Ids and errors can carry raw bytes from a request URL.
    return doc.dump(-1, ' ', false, json::error_handler_t::replace);
}
