#pragma once
#include <deque>
#include <functional>
#include <string>
#include <variant>
#include <vector>

struct SetPlayback
{
    bool playing = true;
};

struct HighlightRoute
{
    std::vector<std::string> nodeIds;
};

struct LocateVehicle
{
    std::string vehicleId;
};

using ControlMessage = std::variant<SetPlayback, HighlightRoute, LocateVehicle>;

// In-process channel between the control surface and the view. Subscribers
// are named and called in registration order; a publish issued from inside a
// handler is queued behind the message being delivered.
class ControlBus
{
public:
    using Handler = std::function<void(ControlMessage const&)>;
    using SubscriptionId = std::size_t;

    SubscriptionId subscribe(std::string name, Handler handler);
    void unsubscribe(SubscriptionId id);
    void publish(ControlMessage message);

    std::vector<std::string> subscribers() const;

private:
    struct Subscriber
    {
        SubscriptionId id;
        std::string name;
        Handler handler;
    };

    void deliver(ControlMessage const& message);

    std::vector<Subscriber> subs;
    std::deque<ControlMessage> pending;
    bool delivering = false;
    SubscriptionId nextId = 1;
};
