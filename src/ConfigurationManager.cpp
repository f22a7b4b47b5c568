#include <cstdlib>
#include <stdexcept>
#include "ConfigurationManager.hpp"

ConfigurationManager::ConfigurationManager()
    : ConfigurationManager([](char const* name) { return static_cast<char const*>(std::getenv(name)); })
{
}

ConfigurationManager::ConfigurationManager(EnvLookup env)
    : lookup(std::move(env))
{
    host   = readString("RAILSYNC_HOST", "localhost");
    port   = readString("RAILSYNC_PORT", "8000");
    tls    = readNumber("RAILSYNC_TLS", 0, 0, 1) == 1;
    apiKey = readString("RAILSYNC_API_KEY", "");

    if (host.empty())
        throw std::runtime_error("RAILSYNC_HOST must not be empty.");

    pollInterval     = std::chrono::milliseconds(readNumber("RAILSYNC_POLL_MS", 1000, 10, 600000));
    fastPollInterval = std::chrono::milliseconds(readNumber("RAILSYNC_FAST_POLL_MS", 50, 10, 600000));
    frameInterval    = std::chrono::milliseconds(readNumber("RAILSYNC_FRAME_MS", 16, 1, 1000));
    toastWindow      = std::chrono::milliseconds(readNumber("RAILSYNC_TOAST_MS", 5000, 0, 600000));

    reconnect.maxAttempts  = static_cast<int>(readNumber("RAILSYNC_RECONNECT_ATTEMPTS", 5, 0, 1000));
    reconnect.initialDelay = std::chrono::milliseconds(readNumber("RAILSYNC_RECONNECT_INITIAL_MS", 2000, 1, 3600000));
    reconnect.maxDelay     = std::chrono::milliseconds(readNumber("RAILSYNC_RECONNECT_MAX_MS", 30000, 1, 3600000));
    if (reconnect.maxDelay < reconnect.initialDelay)
        throw std::runtime_error("RAILSYNC_RECONNECT_MAX_MS is smaller than RAILSYNC_RECONNECT_INITIAL_MS.");

    dashboardPort = static_cast<unsigned short>(readNumber("RAILSYNC_DASHBOARD_PORT", 8080, 0, 65535));
    historyPath   = readString("RAILSYNC_HISTORY_DB", "railsync_history.db");
    historyDays   = static_cast<int>(readNumber("RAILSYNC_HISTORY_DAYS", 7, 1, 3650));
    timeZone      = readString("RAILSYNC_TIMEZONE", "Asia/Kolkata");

    feeds = {
        {"Network",        NETWORK_PATH},
        {"Push updates",   UPDATES_PATH},
        {"Fallback poll",  TRAINS_PATH},
        {"Live positions", POSITIONS_PATH}
    };
}

std::string ConfigurationManager::readString(char const* name, std::string fallback) const
{
    char const* value = lookup ? lookup(name) : nullptr;
    if (!value)
        return fallback;
    return value;
}

long ConfigurationManager::readNumber(char const* name, long fallback, long minValue, long maxValue) const
{
    char const* value = lookup ? lookup(name) : nullptr;
    if (!value || *value == '\0')
        return fallback;

    char* end = nullptr;
    long parsed = std::strtol(value, &end, 10);
    if (*end != '\0')
        throw std::runtime_error(std::string(name) + " is not a number: " + value);
    if (parsed < minValue || parsed > maxValue)
        throw std::runtime_error(std::string(name) + " is out of range: " + value);

    return parsed;
}
