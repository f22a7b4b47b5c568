#pragma once
#include <chrono>
#include <optional>
#include "Types.hpp"

struct ReconnectPolicy
{
    int maxAttempts = 5;                                  // 0 disables reconnection
    std::chrono::milliseconds initialDelay{2000};
    std::chrono::milliseconds maxDelay{30000};
};

// Push/poll failover rules, kept free of I/O so they can be driven directly.
//
//   Connecting --open--> Live
//   Connecting | Live --error/close--> Degraded (polling becomes the writer)
//   Degraded --retry--> Connecting (polling stays the writer until Live)
class TransportStateMachine
{
private:
    ReconnectPolicy policy;
    TransportMode current = TransportMode::Connecting;
    bool polling = false;
    int attempts = 0;

public:
    explicit TransportStateMachine(ReconnectPolicy reconnect = {});

    TransportMode mode() const noexcept { return current; }
    bool pollingActive() const noexcept { return polling; }
    int reconnectAttempts() const noexcept { return attempts; }

    void pushOpened() noexcept;

    // Returns true when the poll loop has to be started.
    bool pushFailed() noexcept;

    std::optional<std::chrono::milliseconds> nextReconnectDelay() const noexcept;
    void beginReconnect() noexcept;

    bool acceptsPushState() const noexcept { return current == TransportMode::Live; }
    bool acceptsPollState() const noexcept { return polling && current != TransportMode::Live; }
};
