#pragma once
#include <optional>
#include <string>
#include <vector>
#include "AlertReconciler.hpp"
#include "ConfigurationManager.hpp"
#include "MapScene.hpp"
#include "SQLiteStore.hpp"
#include "Types.hpp"

// Everything one page render needs, captured at request time.
struct DashboardView
{
    TransportStatus transport;
    RenderFrame frame;
    std::vector<VehicleState> display;
    std::vector<AlertRecord> alerts;
    std::optional<CriticalToast> toast;
    std::vector<AlertLogEntry> history;
    std::vector<FeedEndpoint> feeds;
    std::size_t stationCount = 0;
    WallTime now;
    std::string timeZone;
};

class Dashboard
{
public:
    static std::string generate(DashboardView const& view);
    static std::string sceneJson(DashboardView const& view);

    static std::string modeLabel(TransportStatus const& status);
    static std::string formatClock(WallTime t, std::string const& zone);
    static std::string htmlEscape(std::string const& text);

private:
    static std::string buildHtmlHead(DashboardView const& view);
    static std::string buildStatusBar(DashboardView const& view);
    static std::string buildToast(CriticalToast const& toast, std::string const& zone);
    static std::string buildAlertTable(std::vector<AlertRecord> const& alerts);
    static std::string buildAlertRow(AlertRecord const& a);
    static std::string buildTimeline(DashboardView const& view);
    static std::string buildTimelineRow(VehicleState const& v);
    static std::string buildHistory(std::vector<AlertLogEntry> const& history, std::string const& zone);
};
