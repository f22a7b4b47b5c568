#include "Types.hpp"

std::string toString(VehicleStatus status)
{
    switch (status)
    {
        case VehicleStatus::Running: return "running";
        case VehicleStatus::Stopped: return "stopped";
        case VehicleStatus::Held:    return "held";
        case VehicleStatus::Unknown: break;
    }
    return "unknown";
}

std::string toString(AlertSeverity severity)
{
    switch (severity)
    {
        case AlertSeverity::Critical: return "critical";
        case AlertSeverity::Warn:     return "warn";
        case AlertSeverity::Info:     break;
    }
    return "info";
}

std::string toString(TransportMode mode)
{
    switch (mode)
    {
        case TransportMode::Connecting: return "connecting";
        case TransportMode::Live:       return "live";
        case TransportMode::Degraded:   return "degraded";
    }
    return "connecting";
}

VehicleStatus vehicleStatusFromString(std::string const& text)
{
    if (text == "running") return VehicleStatus::Running;
    if (text == "stopped") return VehicleStatus::Stopped;
    if (text == "held")    return VehicleStatus::Held;
    return VehicleStatus::Unknown;
}

AlertSeverity alertSeverityFromString(std::string const& text)
{
    if (text == "critical") return AlertSeverity::Critical;
    if (text == "warn")     return AlertSeverity::Warn;
    return AlertSeverity::Info;
}
