#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include "AlertReconciler.hpp"
#include "ControlBus.hpp"
#include "GeometryCache.hpp"
#include "MapScene.hpp"
#include "MotionExtrapolator.hpp"
#include "NodeRegistry.hpp"
#include "PositionResolver.hpp"
#include "SnapshotStore.hpp"
#include "TelemetryDispatcher.hpp"
#include "Types.hpp"

class ConfigurationManager;

// The map view and everything scoped to it: snapshot, alerts, dismissals,
// scene and the frame loop. teardown() ends the session state.
class LiveView
{
public:
    using LocateHandler = std::function<void(std::string const&)>;

    LiveView(boost::asio::io_context& ioc, ConfigurationManager const& configuration);
    ~LiveView();
    LiveView(LiveView const&) = delete;
    LiveView& operator=(LiveView const&) = delete;

    void applyNetwork(Network const& network);
    std::uint64_t networkVersion() const noexcept { return networkLoads; }

    // Without a handler, a locate request is answered from the current frame.
    void setLocateHandler(LocateHandler handler) { locateHandler = std::move(handler); }
    void setLocated(LocatedVehicle vehicle) { scene.setLocated(std::move(vehicle)); }

    RenderFrame const& renderFrame(MonotonicTime now);

    void startFrameLoop();
    void teardown();

    NodeRegistry const& nodes() const noexcept { return registry; }
    GeometryCache const& geometryCache() const noexcept { return geometry; }
    SnapshotStore const& snapshots() const noexcept { return store; }
    MotionExtrapolator const& extrapolator() const noexcept { return motion; }
    MapScene const& mapScene() const noexcept { return scene; }

    AlertReconciler& alerts() noexcept { return reconciler; }
    TelemetryDispatcher& dispatcher() noexcept { return telemetry; }
    ControlBus& controls() noexcept { return bus; }

private:
    boost::asio::awaitable<void> frameLoop();
    void onControl(ControlMessage const& message);
    void locateFromFrame(std::string const& vehicleId);

    boost::asio::io_context& ioContext;
    ConfigurationManager const& config;

    NodeRegistry registry;
    GeometryCache geometry;
    PositionResolver resolver;
    SnapshotStore store;
    MotionExtrapolator motion;
    AlertReconciler reconciler;
    TelemetryDispatcher telemetry;
    MapScene scene;
    ControlBus bus;

    ControlBus::SubscriptionId subscription = 0;
    LocateHandler locateHandler;
    boost::asio::steady_timer frameTimer;
    std::uint64_t networkLoads = 0;
    bool closed = false;
};
