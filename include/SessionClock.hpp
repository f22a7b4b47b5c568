#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include "Types.hpp"

// Monotonic time drives extrapolation; wall time only stamps alerts and
// the dashboard. Replay pins wall time to the recorded timestamps.
class SessionClock
{
public:
    static MonotonicTime steadyNow()
    {
        return std::chrono::steady_clock::now();
    }

    static void setWall(WallTime t)
    {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
        wallMillis.store(static_cast<std::int64_t>(ms), std::memory_order_relaxed);
        wallPinned.store(true, std::memory_order_relaxed);
    }

    static void releaseWall()
    {
        wallPinned.store(false, std::memory_order_relaxed);
    }

    static WallTime wallNow()
    {
        if (wallPinned.load(std::memory_order_relaxed))
            return WallTime(std::chrono::milliseconds(wallMillis.load(std::memory_order_relaxed)));
        return std::chrono::system_clock::now();
    }

    static std::int64_t toEpochMillis(WallTime t)
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
    }

private:
    static inline std::atomic<bool> wallPinned{false};
    static inline std::atomic<std::int64_t> wallMillis{0};
};
