#include <algorithm>
#include <iostream>
#include "ControlBus.hpp"

ControlBus::SubscriptionId ControlBus::subscribe(std::string name, Handler handler)
{
    SubscriptionId id = nextId++;
    subs.push_back({id, std::move(name), std::move(handler)});
    return id;
}

void ControlBus::unsubscribe(SubscriptionId id)
{
    subs.erase(std::remove_if(subs.begin(), subs.end(), [id](Subscriber const& s)
    {
        return s.id == id;
    }), subs.end());
}

std::vector<std::string> ControlBus::subscribers() const
{
    std::vector<std::string> names;
    names.reserve(subs.size());
    for (auto const& s : subs)
        names.push_back(s.name);
    return names;
}

void ControlBus::publish(ControlMessage message)
{
    pending.push_back(std::move(message));
    if (delivering)
        return;

    delivering = true;
    while (!pending.empty())
    {
        ControlMessage next = std::move(pending.front());
        pending.pop_front();
        deliver(next);
    }
    delivering = false;
}

void ControlBus::deliver(ControlMessage const& message)
{
    // Handlers may unsubscribe while we iterate.
    std::vector<Subscriber> snapshot = subs;

    for (auto const& s : snapshot)
    {
        try
        {
            s.handler(message);
        }
        catch (std::exception const& e)
        {
            std::cerr << "[ControlBus] Subscriber " << s.name << " failed: " << e.what() << std::endl;
        }
    }
}
