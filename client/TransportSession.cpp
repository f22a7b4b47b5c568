#include <iostream>
#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include "ConfigurationManager.hpp"
#include "Parser.hpp"
#include "SessionClock.hpp"
#include "TelemetryClient.hpp"
#include "TelemetryDispatcher.hpp"
#include "TransportSession.hpp"

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;

TransportSession::TransportSession(boost::asio::io_context& ioc,
                                   ConfigurationManager const& configuration,
                                   TelemetryClient& http,
                                   TelemetryDispatcher& sink)
    : ioContext(ioc)
    , config(configuration)
    , client(http)
    , dispatcher(sink)
    , state(configuration.getReconnectPolicy())
    , pollTimer(ioc)
    , fastPollTimer(ioc)
    , reconnectTimer(ioc)
{
}

void TransportSession::start()
{
    std::cout << "[Transport] Connecting push channel to " << client.hostHeader()
              << ConfigurationManager::UPDATES_PATH << std::endl;

    boost::asio::co_spawn(ioContext, pushLoop(), boost::asio::detached);
    boost::asio::co_spawn(ioContext, fastPollLoop(), boost::asio::detached);
}

void TransportSession::shutdown()
{
    if (cancelled)
        return;

    cancelled = true;
    if (closeChannel)
        closeChannel();

    pollTimer.cancel();
    fastPollTimer.cancel();
    reconnectTimer.cancel();

    std::cout << "[Transport] Session closed." << std::endl;
}

TransportStatus TransportSession::status() const
{
    TransportStatus s;
    s.mode = state.mode();
    s.pollingActive = state.pollingActive();
    s.reconnectAttempts = state.reconnectAttempts();
    s.overlayFailures = overlayFailures;
    s.droppedMessages = dispatcher.droppedMessages();
    s.lastError = dispatcher.mostRecentError();
    return s;
}

void TransportSession::onPushOpened()
{
    state.pushOpened();
    pollTimer.cancel();
    std::cout << "[Transport] Live: push channel open." << std::endl;
}

void TransportSession::onPushFailure(std::string reason)
{
    closeChannel = nullptr;
    dispatcher.recordError(std::move(reason));

    bool startPolling = state.pushFailed();
    if (startPolling && !pollLoopRunning)
    {
        pollLoopRunning = true;
        boost::asio::co_spawn(ioContext, pollLoop(), boost::asio::detached);
    }
}

template <class WsStream>
void TransportSession::prepareHandshake(WsStream& ws)
{
    ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));

    std::string apiKey = config.getAPIKey();
    ws.set_option(websocket::stream_base::decorator(
        [apiKey](websocket::request_type& req)
        {
            req.set(beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
            if (!apiKey.empty())
                req.set("X-API-Key", apiKey);
        }));
}

template <class WsStream>
boost::asio::awaitable<void> TransportSession::readPushMessages(WsStream& ws)
{
    beast::flat_buffer buffer;

    for (;;)
    {
        buffer.clear();
        co_await ws.async_read(buffer, boost::asio::use_awaitable);
        if (cancelled)
            co_return;

        std::string payload = beast::buffers_to_string(buffer.data());
        try
        {
            dispatcher.dispatchPush(payload, state.acceptsPushState(), SessionClock::steadyNow(), SessionClock::wallNow());
        }
        catch (std::exception const& e)
        {
            dispatcher.recordError(std::string("Push message failed: ") + e.what());
        }
    }
}

boost::asio::awaitable<void> TransportSession::runPlainChannel()
{
    auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::ip::tcp::resolver resolver(executor);
    auto results = co_await resolver.async_resolve(config.getHost(), config.getPort(), boost::asio::use_awaitable);

    websocket::stream<beast::tcp_stream> ws(executor);
    closeChannel = [&ws]()
    {
        boost::system::error_code ignore;
        beast::get_lowest_layer(ws).socket().close(ignore);
    };

    beast::get_lowest_layer(ws).expires_after(TelemetryClient::kRequestTimeout);
    co_await beast::get_lowest_layer(ws).async_connect(results, boost::asio::use_awaitable);
    beast::get_lowest_layer(ws).expires_never();

    prepareHandshake(ws);
    co_await ws.async_handshake(client.hostHeader(), ConfigurationManager::UPDATES_PATH, boost::asio::use_awaitable);
    if (cancelled)
        co_return;

    onPushOpened();
    co_await readPushMessages(ws);
}

boost::asio::awaitable<void> TransportSession::runTlsChannel()
{
    auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::ip::tcp::resolver resolver(executor);
    auto results = co_await resolver.async_resolve(config.getHost(), config.getPort(), boost::asio::use_awaitable);

    websocket::stream<beast::ssl_stream<beast::tcp_stream>> ws(executor, client.tlsContext());
    closeChannel = [&ws]()
    {
        boost::system::error_code ignore;
        beast::get_lowest_layer(ws).socket().close(ignore);
    };

    if (!SSL_set_tlsext_host_name(ws.next_layer().native_handle(), config.getHost().c_str()))
    {
        throw beast::system_error(boost::system::error_code(static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()), "Failed to set SNI");
    }
    ws.next_layer().set_verify_callback(boost::asio::ssl::host_name_verification(config.getHost()));

    beast::get_lowest_layer(ws).expires_after(TelemetryClient::kRequestTimeout);
    co_await beast::get_lowest_layer(ws).async_connect(results, boost::asio::use_awaitable);
    co_await ws.next_layer().async_handshake(boost::asio::ssl::stream_base::client, boost::asio::use_awaitable);
    beast::get_lowest_layer(ws).expires_never();

    prepareHandshake(ws);
    co_await ws.async_handshake(client.hostHeader(), ConfigurationManager::UPDATES_PATH, boost::asio::use_awaitable);
    if (cancelled)
        co_return;

    onPushOpened();
    co_await readPushMessages(ws);
}

boost::asio::awaitable<void> TransportSession::pushLoop()
{
    for (;;)
    {
        std::string failure;
        try
        {
            if (config.useTls())
                co_await runTlsChannel();
            else
                co_await runPlainChannel();

            failure = "Push channel closed by server";
        }
        catch (std::exception const& e)
        {
            failure = std::string("Push channel error: ") + e.what();
        }

        if (cancelled)
            co_return;

        onPushFailure(std::move(failure));

        auto delay = state.nextReconnectDelay();
        if (!delay)
        {
            std::cerr << "[Transport] Giving up on push channel after "
                      << state.reconnectAttempts() << " attempts; polling only." << std::endl;
            co_return;
        }

        reconnectTimer.expires_after(*delay);
        boost::system::error_code ec;
        co_await reconnectTimer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (cancelled)
            co_return;

        state.beginReconnect();
        std::cout << "[Transport] Reconnect attempt " << state.reconnectAttempts()
                  << " after " << delay->count() << "ms" << std::endl;
    }
}

boost::asio::awaitable<void> TransportSession::pollLoop()
{
    std::cout << "[Poll] Degraded: polling " << ConfigurationManager::TRAINS_PATH
              << " every " << config.getPollInterval().count() << "ms" << std::endl;

    while (!cancelled && state.pollingActive())
    {
        try
        {
            std::string body = co_await client.fetch(ConfigurationManager::TRAINS_PATH);
            if (cancelled)
                co_return;

            dispatcher.dispatchPoll(body, state.acceptsPollState(), SessionClock::steadyNow(), SessionClock::wallNow());
        }
        catch (std::exception const& e)
        {
            if (cancelled)
                co_return;
            dispatcher.recordError(std::string("Poll failed: ") + e.what());
        }

        if (!state.pollingActive())
            break;

        pollTimer.expires_after(config.getPollInterval());
        boost::system::error_code ec;
        co_await pollTimer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }

    pollLoopRunning = false;
}

boost::asio::awaitable<void> TransportSession::fastPollLoop()
{
    while (!cancelled)
    {
        try
        {
            std::string body = co_await client.fetch(ConfigurationManager::POSITIONS_PATH);
            if (cancelled)
                co_return;

            if (!dispatcher.dispatchOverlay(body, SessionClock::wallNow()))
                ++overlayFailures;
        }
        catch (std::exception const&)
        {
            // A failed overlay cycle is skipped; the next one replaces it.
            ++overlayFailures;
        }

        fastPollTimer.expires_after(config.getFastPollInterval());
        boost::system::error_code ec;
        co_await fastPollTimer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
}

void TransportSession::locateVehicle(std::string const& vehicleId)
{
    if (cancelled || vehicleId.empty())
        return;

    boost::asio::co_spawn(ioContext, locateOnce(vehicleId), boost::asio::detached);
}

boost::asio::awaitable<void> TransportSession::locateOnce(std::string vehicleId)
{
    std::string failure;
    try
    {
        std::string target = ConfigurationManager::TRAIN_PATH + TelemetryClient::encodeComponent(vehicleId) + "/position";
        std::string body = co_await client.fetch(target);
        if (cancelled)
            co_return;

        auto fix = Parser::parsePositionFix(body);
        if (!fix)
        {
            std::cout << "[Transport] No position for train " << vehicleId << std::endl;
            co_return;
        }

        if (locatedHandler)
            locatedHandler(LocatedVehicle{vehicleId, *fix});
        co_return;
    }
    catch (std::exception const& e)
    {
        failure = e.what();
    }

    if (!cancelled)
        dispatcher.recordError("Locate " + vehicleId + " failed: " + failure);
}
