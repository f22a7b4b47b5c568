#include <iostream>
#include <type_traits>
#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include "ConfigurationManager.hpp"
#include "LiveView.hpp"
#include "SessionClock.hpp"

LiveView::LiveView(boost::asio::io_context& ioc, ConfigurationManager const& configuration)
    : ioContext(ioc)
    , config(configuration)
    , resolver(geometry, registry)
    , motion(store)
    , reconciler(configuration.getToastWindow())
    , telemetry(store, reconciler)
    , scene(resolver)
    , frameTimer(ioc)
{
    subscription = bus.subscribe("view", [this](ControlMessage const& message)
    {
        onControl(message);
    });
}

LiveView::~LiveView()
{
    teardown();
}

void LiveView::applyNetwork(Network const& network)
{
    registry = NodeRegistry(network.nodes);
    geometry = GeometryCache(registry, network.edges);
    ++networkLoads;
    scene.setNetwork(registry, geometry, networkLoads);

    std::cout << "[System] Network ready: " << registry.size() << " nodes, "
              << geometry.size() << " edge geometries." << std::endl;
}

void LiveView::onControl(ControlMessage const& message)
{
    std::visit([this](auto const& m)
    {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, SetPlayback>)
        {
            motion.setPlaying(m.playing);
        }
        else if constexpr (std::is_same_v<T, HighlightRoute>)
        {
            scene.highlightRoute(m.nodeIds);
        }
        else if constexpr (std::is_same_v<T, LocateVehicle>)
        {
            if (locateHandler)
                locateHandler(m.vehicleId);
            else
                locateFromFrame(m.vehicleId);
        }
    }, message);
}

void LiveView::locateFromFrame(std::string const& vehicleId)
{
    for (auto const& v : scene.currentFrame().vehicles)
    {
        if (v.id == vehicleId)
        {
            scene.setLocated(LocatedVehicle{v.id, v.position});
            return;
        }
    }

    for (auto const& p : telemetry.liveOverlay().positions)
    {
        if (p.trainId == vehicleId)
        {
            scene.setLocated(LocatedVehicle{p.trainId, p.position});
            return;
        }
    }
}

RenderFrame const& LiveView::renderFrame(MonotonicTime now)
{
    auto const& display = motion.tick(now);
    return scene.compose(display, motion.displayedSequence(), telemetry.liveOverlay(), motion.isPlaying());
}

void LiveView::startFrameLoop()
{
    boost::asio::co_spawn(ioContext, frameLoop(), boost::asio::detached);
}

boost::asio::awaitable<void> LiveView::frameLoop()
{
    while (!closed)
    {
        renderFrame(SessionClock::steadyNow());

        frameTimer.expires_after(config.getFrameInterval());
        boost::system::error_code ec;
        co_await frameTimer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
}

void LiveView::teardown()
{
    if (closed)
        return;

    closed = true;
    frameTimer.cancel();
    bus.unsubscribe(subscription);
    reconciler.resetSession();
}
