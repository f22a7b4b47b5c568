#include <string>
#include <iostream>
#include <memory>
#include <functional>
#include <chrono>
#include <csignal>
#include <exception>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include "ConfigurationManager.hpp"
#include "ControlClient.hpp"
#include "Dashboard.hpp"
#include "DashboardServer.hpp"
#include "LiveView.hpp"
#include "Parser.hpp"
#include "ReplayEngine.hpp"
#include "SQLiteStore.hpp"
#include "SessionClock.hpp"
#include "SessionRecorder.hpp"
#include "TelemetryClient.hpp"
#include "TransportSession.hpp"

namespace
{
    constexpr int kNetworkAttempts = 5;
    constexpr std::chrono::seconds kNetworkRetryDelay{2};
    constexpr std::chrono::hours kPruneInterval{1};
    constexpr int kHistoryRows = 20;
}

struct CommandLineOptions
{
    bool recordMode = false;
    std::string recordFile;
    bool replayMode = false;
    std::string replayFile;
    std::string simulateTrain;
};

void parseCommandLineArgs(int argc, char* argv[], CommandLineOptions& options)
{
    options = {};

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--record" && i + 1 < argc)
        {
            options.recordMode = true;
            options.recordFile = argv[++i];
        }
        else if (arg == "--replay" && i + 1 < argc)
        {
            options.replayMode = true;
            options.replayFile = argv[++i];
        }
        else if (arg == "--simulate" && i + 1 < argc)
        {
            options.simulateTrain = argv[++i];
        }
        else
        {
            std::cerr << "Warning: ignoring unknown or malformed argument: " << arg << "\n";
        }
    }
}

boost::asio::awaitable<void> runHistoryMaintenance(SQLiteStore& db, int days, boost::asio::steady_timer& timer)
{
    for (;;)
    {
        timer.expires_after(kPruneInterval);
        boost::system::error_code ec;
        co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec)
            co_return;

        std::cout << "   [Maintenance] Pruning history older than " << days << " days..." << std::endl;
        db.pruneOldData(days, SessionClock::toEpochMillis(SessionClock::wallNow()));
    }
}

boost::asio::awaitable<Network> loadNetwork(TelemetryClient& client, SessionRecorder* recorder, boost::asio::steady_timer& retryTimer)
{
    for (int attempt = 1; ; ++attempt)
    {
        std::string failure;
        try
        {
            std::string body = co_await client.fetch(ConfigurationManager::NETWORK_PATH);
            if (recorder)
                recorder->append(railsync::CHANNEL_NETWORK, body, SessionClock::toEpochMillis(SessionClock::wallNow()));

            co_return Parser::parseNetwork(body);
        }
        catch (std::exception const& e)
        {
            failure = e.what();
        }

        std::cerr << "[System] Network load attempt " << attempt << "/" << kNetworkAttempts
                  << " failed: " << failure << std::endl;
        if (attempt >= kNetworkAttempts)
            throw std::runtime_error("Could not load network: " + failure);

        retryTimer.expires_after(kNetworkRetryDelay);
        boost::system::error_code ec;
        co_await retryTimer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec)
            throw std::runtime_error("Network load cancelled");
    }
}

boost::asio::awaitable<void> runLiveSession(TelemetryClient& client, SessionRecorder* recorder, boost::asio::steady_timer& retryTimer,
                                            LiveView& view, TransportSession& session, DashboardServer& dashboard,
                                            ControlClient& control, std::string simulateTrain,
                                            std::function<void()> shutdownAll, int& exitCode)
{
    try
    {
        Network network = co_await loadNetwork(client, recorder, retryTimer);
        view.applyNetwork(network);
    }
    catch (std::exception const& e)
    {
        std::cerr << "Main Error: " << e.what() << "\n";
        exitCode = 1;
        shutdownAll();
        co_return;
    }

    view.startFrameLoop();
    session.start();
    dashboard.start();

    if (simulateTrain.empty())
        co_return;

    std::string failure;
    try
    {
        co_await control.simulateByTrainNumber(simulateTrain);
        co_return;
    }
    catch (std::exception const& e)
    {
        failure = e.what();
    }
    view.dispatcher().recordError("Simulate " + simulateTrain + " failed: " + failure);
}

int main(int argc, char* argv[])
{
    try
    {
        CommandLineOptions options;
        parseCommandLineArgs(argc, argv, options);

        ConfigurationManager config;
        boost::asio::io_context io;

        std::unique_ptr<SQLiteStore> db;
        if (!config.getHistoryPath().empty())
        {
            db = std::make_unique<SQLiteStore>(config.getHistoryPath());
            if (db->isOpen())
            {
                std::cout << "[System] Running initial history cleanup..." << std::endl;
                db->pruneOldData(config.getHistoryDays(), SessionClock::toEpochMillis(SessionClock::wallNow()));
            }
            else
            {
                db.reset();
            }
        }

        std::unique_ptr<SessionRecorder> recorder;
        if (options.recordMode && !options.replayMode)
        {
            recorder = std::make_unique<SessionRecorder>(options.recordFile);
            if (!recorder->isOpen())
                throw std::runtime_error("Cannot open recording file: " + options.recordFile);
        }

        LiveView view(io, config);
        view.dispatcher().attachHistory(db.get());
        view.dispatcher().attachRecorder(recorder.get());

        TelemetryClient client(io, config);
        TransportSession session(io, config, client, view.dispatcher());
        ControlClient control(client, view.controls());
        ReplayEngine replay(io, view.dispatcher());

        session.onLocated([&view](LocatedVehicle located)
        {
            view.setLocated(std::move(located));
        });
        if (!options.replayMode)
        {
            view.setLocateHandler([&session](std::string const& id)
            {
                session.locateVehicle(id);
            });
        }

        auto provideView = [&]()
        {
            DashboardView page;
            if (options.replayMode)
            {
                page.transport.mode = TransportMode::Live;
                page.transport.replay = true;
                page.transport.droppedMessages = view.dispatcher().droppedMessages();
                page.transport.lastError = view.dispatcher().mostRecentError();
            }
            else
            {
                page.transport = session.status();
            }

            page.now = SessionClock::wallNow();
            page.frame = view.mapScene().currentFrame();
            page.display = view.extrapolator().displayState();
            page.alerts = view.alerts().alerts();
            page.toast = view.alerts().visibleToast(page.now);
            if (db)
                page.history = db->getRecentAlerts(kHistoryRows);
            page.feeds = config.getFeeds();
            page.stationCount = view.nodes().stations().size();
            page.timeZone = config.getTimeZone();
            return page;
        };

        DashboardServer dashboard(io, config.getDashboardPort(), view, provideView,
                                  options.replayMode ? nullptr : &control);

        boost::asio::steady_timer retryTimer(io);
        boost::asio::steady_timer maintenanceTimer(io);
        int exitCode = 0;

        boost::asio::signal_set signals(io, SIGINT, SIGTERM);

        std::function<void()> shutdownAll = [&]()
        {
            session.shutdown();
            replay.stop();
            dashboard.stop();
            view.teardown();
            retryTimer.cancel();
            maintenanceTimer.cancel();
            signals.cancel();
        };

        signals.async_wait([&](boost::system::error_code const& ec, int)
        {
            if (ec)
                return;

            std::cout << "\n[System] Shutting down..." << std::endl;
            shutdownAll();
        });

        if (db)
            boost::asio::co_spawn(io, runHistoryMaintenance(*db, config.getHistoryDays(), maintenanceTimer), boost::asio::detached);

        std::cout << "System Initialized.\n";

        if (options.replayMode)
        {
            auto networkBody = ReplayEngine::loadNetwork(options.replayFile);
            if (!networkBody)
                throw std::runtime_error("Replay file has no network: " + options.replayFile);

            view.applyNetwork(Parser::parseNetwork(*networkBody));
            view.startFrameLoop();
            dashboard.start();

            boost::asio::co_spawn(io, replay.run(options.replayFile), [](std::exception_ptr e)
            {
                if (!e)
                {
                    std::cout << "Replay Finished. Dashboard is static. Press Ctrl+C to exit." << std::endl;
                    return;
                }
                try
                {
                    std::rethrow_exception(e);
                }
                catch (std::exception const& ex)
                {
                    std::cerr << "[REPLAY] Error: " << ex.what() << std::endl;
                }
            });
        }
        else
        {
            boost::asio::co_spawn(io, runLiveSession(client, recorder.get(), retryTimer, view, session, dashboard,
                                                     control, options.simulateTrain, shutdownAll, exitCode),
                                  boost::asio::detached);
        }

        io.run();
        return exitCode;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Main Error: " << e.what() << "\n";
        return 1;
    }
}
