#pragma once
#include <chrono>
#include <functional>
#include <string>
#include <vector>
#include "TransportStateMachine.hpp"

struct FeedEndpoint
{
    std::string name;
    std::string url;
};

class ConfigurationManager
{
public:
    using EnvLookup = std::function<char const*(char const*)>;

    static inline const std::string NETWORK_PATH    = "/network";
    static inline const std::string TRAINS_PATH     = "/trains";
    static inline const std::string POSITIONS_PATH  = "/train_positions";
    static inline const std::string UPDATES_PATH    = "/updates";
    static inline const std::string TRAIN_PATH      = "/train/";     // + id + "/position"
    static inline const std::string RESET_PATH      = "/reset";
    static inline const std::string RESEED_PATH     = "/simulate/reseed";
    static inline const std::string DELAY_PATH      = "/delay";
    static inline const std::string SIMULATE_PATH   = "/simulate/by_train_no";
    static inline const std::string SEARCH_PATH     = "/train/search";

    ConfigurationManager();
    explicit ConfigurationManager(EnvLookup lookup);

    [[nodiscard]] std::string const& getHost() const noexcept { return host; }
    [[nodiscard]] std::string const& getPort() const noexcept { return port; }
    [[nodiscard]] bool useTls() const noexcept { return tls; }
    [[nodiscard]] std::string const& getAPIKey() const noexcept { return apiKey; }

    [[nodiscard]] std::chrono::milliseconds getPollInterval() const noexcept { return pollInterval; }
    [[nodiscard]] std::chrono::milliseconds getFastPollInterval() const noexcept { return fastPollInterval; }
    [[nodiscard]] std::chrono::milliseconds getFrameInterval() const noexcept { return frameInterval; }
    [[nodiscard]] std::chrono::milliseconds getToastWindow() const noexcept { return toastWindow; }
    [[nodiscard]] ReconnectPolicy const& getReconnectPolicy() const noexcept { return reconnect; }

    [[nodiscard]] unsigned short getDashboardPort() const noexcept { return dashboardPort; }
    [[nodiscard]] std::string const& getHistoryPath() const noexcept { return historyPath; }
    [[nodiscard]] int getHistoryDays() const noexcept { return historyDays; }
    [[nodiscard]] std::string const& getTimeZone() const noexcept { return timeZone; }
    [[nodiscard]] std::vector<FeedEndpoint> const& getFeeds() const noexcept { return feeds; }

private:
    std::string readString(char const* name, std::string fallback) const;
    long readNumber(char const* name, long fallback, long minValue, long maxValue) const;

    EnvLookup lookup;

    std::string host;
    std::string port;
    bool tls = false;
    std::string apiKey;

    std::chrono::milliseconds pollInterval{1000};
    std::chrono::milliseconds fastPollInterval{50};
    std::chrono::milliseconds frameInterval{16};
    std::chrono::milliseconds toastWindow{5000};
    ReconnectPolicy reconnect;

    unsigned short dashboardPort = 8080;
    std::string historyPath;
    int historyDays = 7;
    std::string timeZone;
    std::vector<FeedEndpoint> feeds;
};
