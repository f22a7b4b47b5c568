#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

#include "AlertReconciler.hpp"
#include "ReplayEngine.hpp"
#include "SessionClock.hpp"
#include "SessionRecorder.hpp"
#include "SnapshotStore.hpp"
#include "TelemetryDispatcher.hpp"

namespace
{
    const std::string kNetwork = R"({"nodes": [{"id": "A", "lat": 0, "lon": 0}], "edges": []})";
    const std::string kState = R"({"type": "state", "data": {"trains": [{"id": "T1", "progress": 0.2}]}})";
    const std::string kAlerts = R"({"type": "alerts", "data": [{"pair": {"a": "T1", "b": "T2"}, "severity": "critical", "distance_m": 40}]})";

    class TempFile
    {
    public:
        explicit TempFile(std::string const& name)
            : path((std::filesystem::temp_directory_path() / name).string())
        {
            std::filesystem::remove(path);
        }
        ~TempFile()
        {
            std::error_code ignore;
            std::filesystem::remove(path, ignore);
        }

        std::string path;
    };
}

TEST(SessionRecorderTest, FramesReadBackInOrder)
{
    TempFile file("railsync_recorder_test.rec");
    {
        SessionRecorder recorder(file.path);
        ASSERT_TRUE(recorder.isOpen());
        recorder.append(railsync::CHANNEL_NETWORK, kNetwork, 1000);
        recorder.append(railsync::CHANNEL_PUSH, kState, 1250);
        EXPECT_EQ(recorder.frameCount(), 2u);
    }

    std::ifstream in(file.path, std::ios::binary);
    railsync::SessionFrame frame;

    ASSERT_TRUE(SessionRecorder::readFrame(in, frame));
    EXPECT_EQ(frame.channel(), railsync::CHANNEL_NETWORK);
    EXPECT_EQ(frame.received_at_ms(), 1000u);
    EXPECT_EQ(frame.payload(), kNetwork);

    ASSERT_TRUE(SessionRecorder::readFrame(in, frame));
    EXPECT_EQ(frame.channel(), railsync::CHANNEL_PUSH);
    EXPECT_EQ(frame.payload(), kState);

    EXPECT_FALSE(SessionRecorder::readFrame(in, frame));
}

TEST(SessionRecorderTest, TruncatedChunkEndsTheStream)
{
    railsync::SessionFrame written;
    written.set_received_at_ms(5);
    written.set_channel(railsync::CHANNEL_POLL);
    written.set_payload("{\"trains\": []}");
    std::string bytes = written.SerializeAsString();

    std::uint64_t timestamp = 5;
    std::uint32_t size = static_cast<std::uint32_t>(bytes.size());

    std::string chunk;
    chunk.append(reinterpret_cast<const char*>(&timestamp), sizeof(timestamp));
    chunk.append(reinterpret_cast<const char*>(&size), sizeof(size));
    chunk.append(bytes.substr(0, bytes.size() / 2));

    std::istringstream in(chunk);
    railsync::SessionFrame frame;
    EXPECT_FALSE(SessionRecorder::readFrame(in, frame));
}

TEST(SessionRecorderTest, OversizedChunkHeaderIsCorrupt)
{
    std::uint64_t timestamp = 5;
    std::uint32_t size = 0xFFFFFFF0u;

    std::string chunk;
    chunk.append(reinterpret_cast<const char*>(&timestamp), sizeof(timestamp));
    chunk.append(reinterpret_cast<const char*>(&size), sizeof(size));
    chunk.append("{}");

    std::istringstream in(chunk);
    railsync::SessionFrame frame;
    EXPECT_FALSE(SessionRecorder::readFrame(in, frame));
    EXPECT_GT(size, SessionRecorder::kMaxFrameBytes);
}

TEST(ReplayEngineTest, FindsTheRecordedNetwork)
{
    TempFile file("railsync_replay_network.rec");
    {
        SessionRecorder recorder(file.path);
        recorder.append(railsync::CHANNEL_PUSH, kState, 1000);
        recorder.append(railsync::CHANNEL_NETWORK, kNetwork, 1001);
    }

    auto network = ReplayEngine::loadNetwork(file.path);
    ASSERT_TRUE(network.has_value());
    EXPECT_EQ(*network, kNetwork);

    EXPECT_FALSE(ReplayEngine::loadNetwork(file.path + ".missing").has_value());
}

TEST(ReplayEngineTest, ReplaysFramesThroughTheDispatcher)
{
    TempFile file("railsync_replay_frames.rec");
    {
        SessionRecorder recorder(file.path);
        recorder.append(railsync::CHANNEL_NETWORK, kNetwork, 1700000000000);
        recorder.append(railsync::CHANNEL_PUSH, kState, 1700000000000);
        recorder.append(railsync::CHANNEL_PUSH, kAlerts, 1700000000010);
        recorder.append(railsync::CHANNEL_OVERLAY, R"({"success": true, "data": [{"train_id": "9", "lat": 1, "lon": 2}]})", 1700000000020);
    }

    SnapshotStore store;
    AlertReconciler reconciler;
    TelemetryDispatcher dispatcher(store, reconciler);

    boost::asio::io_context io;
    ReplayEngine replay(io, dispatcher);
    boost::asio::co_spawn(io, replay.run(file.path), boost::asio::detached);
    io.run();

    EXPECT_EQ(replay.framesReplayed(), 3u);
    EXPECT_FALSE(replay.isRunning());
    EXPECT_EQ(store.sequence(), 1u);
    EXPECT_EQ(reconciler.alerts().size(), 1u);
    EXPECT_EQ(dispatcher.liveOverlay().positions.size(), 1u);

    // The toast was stamped with the recorded wall time.
    ASSERT_TRUE(reconciler.mostRecentCritical().has_value());
    EXPECT_EQ(SessionClock::toEpochMillis(reconciler.mostRecentCritical()->raisedAt), 1700000000010);
}
