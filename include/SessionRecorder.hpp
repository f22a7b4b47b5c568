#pragma once
#include <cstdint>
#include <fstream>
#include <istream>
#include <string>
#include "session.pb.h"

// Append-only session file: [uint64 wall ms][uint32 size][SessionFrame bytes]...
class SessionRecorder
{
private:
    std::ofstream file;
    std::uint64_t framesWritten = 0;

public:
    // Larger chunk sizes only come from a corrupt header.
    static constexpr std::uint32_t kMaxFrameBytes = 64u * 1024 * 1024;

    explicit SessionRecorder(std::string const& path);

    bool isOpen() const { return file.is_open(); }
    std::uint64_t frameCount() const noexcept { return framesWritten; }

    void append(railsync::Channel channel, std::string const& payload, std::int64_t wallMs);

    // false on clean end of file or on a truncated/corrupt chunk.
    static bool readFrame(std::istream& in, railsync::SessionFrame& frame);
};
