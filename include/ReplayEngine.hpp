#pragma once

#include <string>
#include <fstream>
#include <cstdint>
#include <optional>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include "session.pb.h"

class TelemetryDispatcher;

// Feeds a recorded session back through the dispatcher at the recorded pace.
class ReplayEngine
{
public:
    ReplayEngine(boost::asio::io_context& ioc, TelemetryDispatcher& sink);

    // The first network body in the file, if the session recorded one.
    static std::optional<std::string> loadNetwork(std::string const& filename);

    boost::asio::awaitable<void> run(std::string filename);
    void stop();

    bool isRunning() const noexcept { return running; }
    std::uint64_t framesReplayed() const noexcept { return replayed; }

private:
    boost::asio::awaitable<void> syncRealtime(std::uint64_t timestamp, std::uint64_t& replayStart,
                                              std::chrono::steady_clock::time_point realStart);
    void processFrame(railsync::SessionFrame const& frame);

    TelemetryDispatcher& dispatcher;
    boost::asio::steady_timer timer;
    bool running = false;
    bool stopped = false;
    std::uint64_t replayed = 0;
};
