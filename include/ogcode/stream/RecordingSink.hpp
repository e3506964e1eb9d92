#pragma once

#include <chrono>
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include "ogcode/stream/ByteBuffer.hpp"
#include "ogcode/stream/FrameSink.hpp"

namespace ogcode::stream {

/// Recording file header: magic, format version, sample period in nanoseconds.
constexpr char RECORDING_MAGIC[4] = {'O', 'G', 'X', '2'};
constexpr std::uint16_t RECORDING_VERSION = 1;
constexpr std::size_t RECORDING_HEADER_SIZE = 4 + 2 + 8;

/**
 * @brief Writes frames to a binary file for offline inspection or replay.
 *
 * Frames are buffered and written in blocks; `flush()` writes the remainder
 * and fails if the stream went bad at any point.
 */
class RecordingSink : public FrameSink {
    // Only open() can name this, so it is the only way to get a sink.
    struct OpenedFile {
        explicit OpenedFile() = default;
    };

public:
    static expected<std::unique_ptr<RecordingSink>, core::SinkError>
    open(const std::string& path, std::chrono::nanoseconds samplePeriod);

    expected<void, core::SinkError> accept(xy2::XY2Frame frame) override;
    expected<void, core::SinkError> flush() override;

    std::uint64_t framesWritten() const { return frameCount; }

    RecordingSink(OpenedFile, std::ofstream file, std::string path);

private:

    expected<void, core::SinkError> writePending();

    std::ofstream file;
    std::string path;
    ByteBuffer pending;
    std::uint64_t frameCount = 0;
};

struct Recording {
    std::chrono::nanoseconds samplePeriod{0};
    std::vector<xy2::XY2Frame> frames;
};

/// Read back a file written by RecordingSink.
expected<Recording, core::SinkError> readRecording(const std::string& path);

} // namespace ogcode::stream
