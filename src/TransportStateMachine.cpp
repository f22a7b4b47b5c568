#include <algorithm>
#include "TransportStateMachine.hpp"

TransportStateMachine::TransportStateMachine(ReconnectPolicy reconnect)
    : policy(reconnect)
{
}

void TransportStateMachine::pushOpened() noexcept
{
    current  = TransportMode::Live;
    polling  = false;
    attempts = 0;
}

bool TransportStateMachine::pushFailed() noexcept
{
    current = TransportMode::Degraded;
    if (polling)
        return false;

    polling = true;
    return true;
}

std::optional<std::chrono::milliseconds> TransportStateMachine::nextReconnectDelay() const noexcept
{
    if (current != TransportMode::Degraded)
        return std::nullopt;
    if (policy.maxAttempts <= 0 || attempts >= policy.maxAttempts)
        return std::nullopt;

    auto delay = policy.initialDelay;
    for (int i = 0; i < attempts && delay < policy.maxDelay; ++i)
        delay *= 2;

    return std::min(delay, policy.maxDelay);
}

void TransportStateMachine::beginReconnect() noexcept
{
    if (current != TransportMode::Degraded)
        return;

    current = TransportMode::Connecting;
    ++attempts;
}
