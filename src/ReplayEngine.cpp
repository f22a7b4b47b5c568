#include "ReplayEngine.hpp"
#include <iostream>
#include <chrono>
#include <utility>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include "SessionClock.hpp"
#include "SessionRecorder.hpp"
#include "TelemetryDispatcher.hpp"

ReplayEngine::ReplayEngine(boost::asio::io_context& ioc, TelemetryDispatcher& sink)
    : dispatcher(sink)
    , timer(ioc)
{
}

std::optional<std::string> ReplayEngine::loadNetwork(std::string const& filename)
{
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open())
        return std::nullopt;

    railsync::SessionFrame frame;
    while (SessionRecorder::readFrame(file, frame))
    {
        if (frame.channel() == railsync::CHANNEL_NETWORK)
            return frame.payload();
    }
    return std::nullopt;
}

boost::asio::awaitable<void> ReplayEngine::syncRealtime(std::uint64_t timestamp, std::uint64_t& replayStart,
                                                        std::chrono::steady_clock::time_point realStart)
{
    if (replayStart == 0)
    {
        replayStart = timestamp;
    }

    auto due = realStart + std::chrono::milliseconds(timestamp >= replayStart ? timestamp - replayStart : 0);
    auto wait = due - std::chrono::steady_clock::now();

    if (wait > std::chrono::seconds(1))
    {
        std::cout << "[REPLAY] Syncing... sleeping for "
                  << std::chrono::duration_cast<std::chrono::seconds>(wait).count() << "s" << std::endl;
    }

    if (wait > std::chrono::steady_clock::duration::zero())
    {
        timer.expires_at(due);
        boost::system::error_code ec;
        co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
}

void ReplayEngine::processFrame(railsync::SessionFrame const& frame)
{
    WallTime recorded{std::chrono::milliseconds(static_cast<std::int64_t>(frame.received_at_ms()))};
    SessionClock::setWall(recorded);

    MonotonicTime now = SessionClock::steadyNow();

    switch (frame.channel())
    {
        case railsync::CHANNEL_PUSH:
            dispatcher.dispatchPush(frame.payload(), true, now, recorded);
            break;
        case railsync::CHANNEL_POLL:
            dispatcher.dispatchPoll(frame.payload(), true, now, recorded);
            break;
        case railsync::CHANNEL_OVERLAY:
            dispatcher.dispatchOverlay(frame.payload(), recorded);
            break;
        default:
            return;
    }

    ++replayed;
}

boost::asio::awaitable<void> ReplayEngine::run(std::string filename)
{
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open())
    {
        std::cerr << "Failed to open replay file: " << filename << std::endl;
        co_return;
    }

    std::cout << ">>> STARTING REPLAY MODE (1:1 SPEED) <<<" << std::endl;
    running = true;

    std::uint64_t replayStart = 0;
    auto realStart = std::chrono::steady_clock::now();

    railsync::SessionFrame frame;
    while (!stopped && SessionRecorder::readFrame(file, frame))
    {
        co_await syncRealtime(frame.received_at_ms(), replayStart, realStart);
        if (stopped)
            break;

        try
        {
            processFrame(frame);
        }
        catch (std::exception const& e)
        {
            dispatcher.recordError(std::string("Replay frame failed: ") + e.what());
        }
    }

    running = false;
    SessionClock::releaseWall();
    std::cout << ">>> REPLAY COMPLETE <<< (" << replayed << " frames)" << std::endl;
}

void ReplayEngine::stop()
{
    stopped = true;
    timer.cancel();
}
