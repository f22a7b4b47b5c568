#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include "Types.hpp"
#include "TransportStateMachine.hpp"

class ConfigurationManager;
class TelemetryClient;
class TelemetryDispatcher;

// Owns the push channel, the fallback poll loop and the fast-poll overlay
// loop. Everything runs on one io_context; after shutdown() every loop
// finishes on its own and writes nothing further.
class TransportSession
{
public:
    using LocatedHandler = std::function<void(LocatedVehicle)>;

    TransportSession(boost::asio::io_context& ioc,
                     ConfigurationManager const& configuration,
                     TelemetryClient& http,
                     TelemetryDispatcher& sink);

    void onLocated(LocatedHandler handler) { locatedHandler = std::move(handler); }

    void start();
    void shutdown();

    // Asks the service for one train's position; the answer goes to the
    // located handler.
    void locateVehicle(std::string const& vehicleId);

    TransportStatus status() const;

private:
    boost::asio::awaitable<void> pushLoop();
    boost::asio::awaitable<void> runPlainChannel();
    boost::asio::awaitable<void> runTlsChannel();

    template <class WsStream>
    boost::asio::awaitable<void> readPushMessages(WsStream& ws);

    template <class WsStream>
    void prepareHandshake(WsStream& ws);

    boost::asio::awaitable<void> pollLoop();
    boost::asio::awaitable<void> fastPollLoop();
    boost::asio::awaitable<void> locateOnce(std::string vehicleId);

    void onPushOpened();
    void onPushFailure(std::string reason);

    boost::asio::io_context& ioContext;
    ConfigurationManager const& config;
    TelemetryClient& client;
    TelemetryDispatcher& dispatcher;

    TransportStateMachine state;
    boost::asio::steady_timer pollTimer;
    boost::asio::steady_timer fastPollTimer;
    boost::asio::steady_timer reconnectTimer;

    std::function<void()> closeChannel;
    LocatedHandler locatedHandler;

    bool cancelled = false;
    bool pollLoopRunning = false;
    std::size_t overlayFailures = 0;
};
