#include "ogcode/stream/TcpFrameSink.hpp"

#include "ogcode/log/Log.hpp"
#include "ogcode/stream/FrameRecord.hpp"

#include <algorithm>
#include <limits>

namespace ogcode::stream {

using core::SinkError;

TcpFrameSink::TcpFrameSink(const config::NetworkSettings& settings)
: client(settings.connectTimeout, settings.writeTimeout)
, batchLimit(std::clamp<std::size_t>(settings.batchFrames, 1, std::numeric_limits<std::uint16_t>::max())) {}

TcpFrameSink::~TcpFrameSink() {
    close();
}

expected<void, SinkError> TcpFrameSink::connect(const std::string& host, std::uint16_t port) {
    logInfo("[TcpFrameSink] connecting to ", host, ":", port, "\n");
    if (auto ec = client.connect(host, port)) {
        client.close();
        return unexpected(SinkError{"cannot connect to " + host + ":" + std::to_string(port), ec});
    }
    client.setLowLatency();
    return {};
}

void TcpFrameSink::close() {
    client.close();
}

expected<void, SinkError> TcpFrameSink::accept(xy2::XY2Frame frame) {
    if (!client.is_open()) {
        return unexpected(SinkError{"not connected", net::asio::error::not_connected});
    }
    if (batchFrames == 0) {
        batch.clear();
        batch.appendLE<std::uint8_t>(static_cast<std::uint8_t>(TCP_BATCH_COMMAND));
        batch.appendLE<std::uint16_t>(0);  // patched in sendBatch
        batch.appendLE<std::uint64_t>(frame.sampleIndex);
        batchFirstIndex = frame.sampleIndex;
    }
    appendFrameRecord(batch, frame);
    ++batchFrames;
    if (batchFrames >= batchLimit) {
        return sendBatch();
    }
    return {};
}

expected<void, SinkError> TcpFrameSink::sendBatch() {
    if (batchFrames == 0) {
        return {};
    }
    batch.patchLE(1, static_cast<std::uint16_t>(batchFrames));

    const auto ec = client.write_all(batch.data(), batch.size());
    batchFrames = 0;
    batch.clear();
    if (ec) {
        return unexpected(SinkError{"batch write failed at sample " + std::to_string(batchFirstIndex), ec});
    }
    ++batchCount;
    return {};
}

expected<void, SinkError> TcpFrameSink::flush() {
    if (!client.is_open()) {
        return unexpected(SinkError{"not connected", net::asio::error::not_connected});
    }
    return sendBatch();
}

} // namespace ogcode::stream
