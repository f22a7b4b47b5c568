#include <iostream>
#include "SessionRecorder.hpp"

SessionRecorder::SessionRecorder(std::string const& path)
    : file(path, std::ios::binary | std::ios::app)
{
    if (!file.is_open())
    {
        std::cerr << "[Recorder] Failed to open " << path << " for writing." << std::endl;
        return;
    }
    std::cout << "[System] Recording activated. Saving to " << path << std::endl;
}

void SessionRecorder::append(railsync::Channel channel, std::string const& payload, std::int64_t wallMs)
{
    if (!file.is_open())
        return;

    railsync::SessionFrame frame;
    frame.set_received_at_ms(static_cast<std::uint64_t>(wallMs));
    frame.set_channel(channel);
    frame.set_payload(payload);

    std::string bytes;
    if (!frame.SerializeToString(&bytes))
    {
        std::cerr << "[Recorder] Failed to serialize frame." << std::endl;
        return;
    }
    if (bytes.size() > kMaxFrameBytes)
    {
        std::cerr << "[Recorder] Skipping oversized frame (" << bytes.size() << " bytes)." << std::endl;
        return;
    }

    std::uint64_t timestamp = static_cast<std::uint64_t>(wallMs);
    std::uint32_t size = static_cast<std::uint32_t>(bytes.size());
    file.write(reinterpret_cast<const char*>(&timestamp), sizeof(timestamp));
    file.write(reinterpret_cast<const char*>(&size), sizeof(size));
    file.write(bytes.data(), size);
    file.flush();

    ++framesWritten;
}

bool SessionRecorder::readFrame(std::istream& in, railsync::SessionFrame& frame)
{
    std::uint64_t timestamp = 0;
    std::uint32_t size = 0;

    in.read(reinterpret_cast<char*>(&timestamp), sizeof(timestamp));
    in.read(reinterpret_cast<char*>(&size), sizeof(size));
    if (!in.good() || size > kMaxFrameBytes)
        return false;

    std::string bytes(size, '\0');
    in.read(bytes.data(), size);
    if (static_cast<std::uint32_t>(in.gcount()) != size)
        return false;

    return frame.ParseFromString(bytes);
}
