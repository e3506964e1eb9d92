#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "ogcode/core/JobConfig.hpp"
#include "ogcode/net/TcpClient.hpp"
#include "ogcode/stream/ByteBuffer.hpp"
#include "ogcode/stream/FrameSink.hpp"

namespace ogcode::stream {

constexpr char TCP_BATCH_COMMAND = 'F';
constexpr std::size_t TCP_BATCH_HEADER_SIZE = 1 + 2 + 8;

/**
 * @brief Streams frames to a network bridge that drives the XY2-100 lines.
 *
 * Frames are grouped into batches:
 *
 *   'F' | uint16 frame count | uint64 first sample index | count * frame record
 *
 * (little-endian, frame records as in FrameRecord.hpp). Batch size and the
 * connect/write deadlines come from NetworkSettings; a timeout or socket error
 * becomes a SinkError and aborts the job.
 */
class TcpFrameSink : public FrameSink {
public:
    explicit TcpFrameSink(const config::NetworkSettings& settings = {});
    ~TcpFrameSink() override;

    expected<void, core::SinkError> connect(const std::string& host, std::uint16_t port);
    void close();

    expected<void, core::SinkError> accept(xy2::XY2Frame frame) override;
    expected<void, core::SinkError> flush() override;

    std::uint64_t batchesSent() const { return batchCount; }

private:
    expected<void, core::SinkError> sendBatch();

    net::TcpClient client;
    ByteBuffer batch;
    std::size_t batchLimit;
    std::size_t batchFrames = 0;
    std::uint64_t batchFirstIndex = 0;
    std::uint64_t batchCount = 0;
};

} // namespace ogcode::stream
