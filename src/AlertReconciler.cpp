#include <algorithm>
#include <iostream>
#include <unordered_map>
#include "AlertReconciler.hpp"

std::string AlertRecord::pairKey() const
{
    return AlertReconciler::makePairKey(participantA, participantB);
}

AlertReconciler::AlertReconciler(std::chrono::milliseconds window)
    : toastWindow(window)
{
}

std::string AlertReconciler::makePairKey(std::string const& a, std::string const& b)
{
    return (b < a) ? b + "|" + a : a + "|" + b;
}

int AlertReconciler::severityRank(AlertSeverity severity) noexcept
{
    return static_cast<int>(severity);
}

std::vector<AlertRecord> AlertReconciler::merge(std::vector<AlertRecord> const& existing,
                                                std::vector<AlertRecord> const& incoming,
                                                DismissalSet const& dismissedKeys)
{
    std::vector<AlertRecord> merged;
    std::unordered_map<std::string, std::size_t> slotOf;
    merged.reserve(existing.size() + incoming.size());

    for (auto const& alert : existing)
    {
        std::string key = alert.pairKey();
        if (dismissedKeys.count(key))
            continue;

        auto it = slotOf.find(key);
        if (it != slotOf.end())
        {
            merged[it->second] = alert;
            continue;
        }
        slotOf[key] = merged.size();
        merged.push_back(alert);
    }

    for (auto const& alert : incoming)
    {
        std::string key = alert.pairKey();
        if (dismissedKeys.count(key))
            continue;

        auto it = slotOf.find(key);
        if (it != slotOf.end())
        {
            merged[it->second] = alert;
            continue;
        }
        slotOf[key] = merged.size();
        merged.push_back(alert);
    }

    std::stable_sort(merged.begin(), merged.end(), [](AlertRecord const& x, AlertRecord const& y)
    {
        int rx = severityRank(x.severity);
        int ry = severityRank(y.severity);
        if (rx != ry)
            return rx > ry;
        return x.distanceMeters < y.distanceMeters;
    });

    return merged;
}

std::vector<AlertRecord> AlertReconciler::ingest(std::vector<AlertRecord> const& batch, WallTime now)
{
    std::vector<AlertRecord> accepted;
    accepted.reserve(batch.size());
    for (auto const& alert : batch)
    {
        if (!dismissed.count(alert.pairKey()))
            accepted.push_back(alert);
    }

    current = merge(current, accepted, dismissed);

    auto critical = std::find_if(accepted.begin(), accepted.end(), [](AlertRecord const& a)
    {
        return a.severity == AlertSeverity::Critical;
    });

    if (critical != accepted.end())
    {
        lastCritical = CriticalToast{*critical, now};
        std::cout << "[Alerts] Critical: " << critical->participantA << " <-> " << critical->participantB
                  << " at " << critical->distanceMeters << " m" << std::endl;
    }

    return accepted;
}

void AlertReconciler::dismiss(std::string const& pairKey)
{
    dismissed.insert(pairKey);

    current.erase(std::remove_if(current.begin(), current.end(), [&pairKey](AlertRecord const& a)
    {
        return a.pairKey() == pairKey;
    }), current.end());

    if (lastCritical && lastCritical->alert.pairKey() == pairKey)
        lastCritical.reset();
}

void AlertReconciler::resetSession()
{
    current.clear();
    dismissed.clear();
    lastCritical.reset();
}

bool AlertReconciler::isDismissed(std::string const& pairKey) const
{
    return dismissed.count(pairKey) > 0;
}

std::optional<CriticalToast> AlertReconciler::visibleToast(WallTime now) const
{
    if (!lastCritical)
        return std::nullopt;

    if (now - lastCritical->raisedAt >= toastWindow)
        return std::nullopt;

    return lastCritical;
}
