#include "ogcode/stream/FrameRecord.hpp"

namespace ogcode::stream {

void appendFrameRecord(ByteBuffer& buffer, const xy2::XY2Frame& frame) {
    buffer.appendLE<std::uint32_t>(frame.xWord);
    buffer.appendLE<std::uint32_t>(frame.yWord);
    buffer.appendLE<std::uint8_t>(frame.laserOn ? FRAME_FLAG_LASER_ON : 0);
    buffer.appendLE<std::uint16_t>(frame.laserPower);
    buffer.appendLE<std::uint8_t>(0);
}

xy2::XY2Frame decodeFrameRecord(const std::uint8_t* bytes, std::uint64_t sampleIndex) {
    xy2::XY2Frame frame;
    frame.xWord = readLE<std::uint32_t>(bytes);
    frame.yWord = readLE<std::uint32_t>(bytes + 4);
    frame.laserOn = (bytes[8] & FRAME_FLAG_LASER_ON) != 0;
    frame.laserPower = readLE<std::uint16_t>(bytes + 9);
    frame.sampleIndex = sampleIndex;
    return frame;
}

} // namespace ogcode::stream
