#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include "Types.hpp"

using DismissalSet = std::unordered_set<std::string>;

struct CriticalToast
{
    AlertRecord alert;
    WallTime raisedAt;
};

// Owns the merged alert list, the session's dismissed pairs and the pointer
// to the most recent critical alert.
class AlertReconciler
{
private:
    std::vector<AlertRecord> current;
    DismissalSet dismissed;
    std::optional<CriticalToast> lastCritical;
    std::chrono::milliseconds toastWindow;

public:
    explicit AlertReconciler(std::chrono::milliseconds toastWindow = std::chrono::seconds(5));

    static std::string makePairKey(std::string const& a, std::string const& b);
    static int severityRank(AlertSeverity severity) noexcept;

    // Existing alerts stay until dismissed; incoming ones overwrite by pair.
    static std::vector<AlertRecord> merge(std::vector<AlertRecord> const& existing,
                                          std::vector<AlertRecord> const& incoming,
                                          DismissalSet const& dismissedKeys);

    // Returns the incoming alerts that survived the dismissal filter.
    std::vector<AlertRecord> ingest(std::vector<AlertRecord> const& batch, WallTime now);
    void dismiss(std::string const& pairKey);
    void dismissToast() noexcept { lastCritical.reset(); }
    void resetSession();

    std::vector<AlertRecord> const& alerts() const noexcept { return current; }
    DismissalSet const& dismissedKeys() const noexcept { return dismissed; }
    bool isDismissed(std::string const& pairKey) const;

    std::optional<CriticalToast> const& mostRecentCritical() const noexcept { return lastCritical; }
    std::optional<CriticalToast> visibleToast(WallTime now) const;
};
