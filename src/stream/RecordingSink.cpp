#include "ogcode/stream/RecordingSink.hpp"

#include "ogcode/log/Log.hpp"
#include "ogcode/stream/FrameRecord.hpp"

#include <cerrno>
#include <cstring>
#include <iterator>

namespace ogcode::stream {

using core::SinkError;

namespace {

constexpr std::size_t WRITE_BLOCK = 64 * 1024;

SinkError ioError(const std::string& what, const std::string& path) {
    const int err = errno != 0 ? errno : EIO;
    return SinkError{what + " '" + path + "'", std::error_code(err, std::generic_category())};
}

} // namespace

RecordingSink::RecordingSink(OpenedFile, std::ofstream file_, std::string path_)
: file(std::move(file_)), path(std::move(path_)), pending(WRITE_BLOCK + FRAME_RECORD_SIZE) {}

expected<std::unique_ptr<RecordingSink>, SinkError>
RecordingSink::open(const std::string& path, std::chrono::nanoseconds samplePeriod) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return unexpected(ioError("cannot open recording", path));
    }

    ByteBuffer header(RECORDING_HEADER_SIZE);
    header.appendBytes(std::string_view(RECORDING_MAGIC, sizeof(RECORDING_MAGIC)));
    header.appendLE<std::uint16_t>(RECORDING_VERSION);
    header.appendLE<std::uint64_t>(static_cast<std::uint64_t>(samplePeriod.count()));
    file.write(reinterpret_cast<const char*>(header.data()), static_cast<std::streamsize>(header.size()));
    if (!file) {
        return unexpected(ioError("cannot write recording header", path));
    }

    logInfo("[RecordingSink] recording frames to ", path, "\n");
    return std::make_unique<RecordingSink>(OpenedFile{}, std::move(file), path);
}

expected<void, SinkError> RecordingSink::accept(xy2::XY2Frame frame) {
    appendFrameRecord(pending, frame);
    ++frameCount;
    if (pending.size() >= WRITE_BLOCK) {
        return writePending();
    }
    return {};
}

expected<void, SinkError> RecordingSink::writePending() {
    if (!pending.empty()) {
        file.write(reinterpret_cast<const char*>(pending.data()), static_cast<std::streamsize>(pending.size()));
        pending.clear();
    }
    if (!file) {
        return unexpected(ioError("write failed for recording", path));
    }
    return {};
}

expected<void, SinkError> RecordingSink::flush() {
    if (auto written = writePending(); !written) {
        return written;
    }
    file.flush();
    if (!file) {
        return unexpected(ioError("flush failed for recording", path));
    }
    logInfo("[RecordingSink] ", frameCount, " frames written\n");
    return {};
}

expected<Recording, SinkError> readRecording(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(ioError("cannot open recording", path));
    }
    const std::vector<std::uint8_t> bytes{std::istreambuf_iterator<char>(file),
                                          std::istreambuf_iterator<char>()};
    if (bytes.size() < RECORDING_HEADER_SIZE ||
        std::memcmp(bytes.data(), RECORDING_MAGIC, sizeof(RECORDING_MAGIC)) != 0) {
        return unexpected(SinkError{"not a frame recording: '" + path + "'", {}});
    }
    if (readLE<std::uint16_t>(bytes.data() + 4) != RECORDING_VERSION) {
        return unexpected(SinkError{"unsupported recording version: '" + path + "'", {}});
    }
    const std::size_t body = bytes.size() - RECORDING_HEADER_SIZE;
    if (body % FRAME_RECORD_SIZE != 0) {
        return unexpected(SinkError{"truncated recording: '" + path + "'", {}});
    }

    Recording recording;
    recording.samplePeriod = std::chrono::nanoseconds(
        static_cast<std::int64_t>(readLE<std::uint64_t>(bytes.data() + 6)));
    const std::size_t count = body / FRAME_RECORD_SIZE;
    recording.frames.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const std::uint8_t* record = bytes.data() + RECORDING_HEADER_SIZE + i * FRAME_RECORD_SIZE;
        recording.frames.push_back(decodeFrameRecord(record, i));
    }
    return recording;
}

} // namespace ogcode::stream
