// FrameRecord.hpp
// -----------------------------------------------------------------------------
// Fixed-size little-endian record for one XY2 frame, shared by the recording
// file and the TCP batch format.
//
//   offset 0   uint32  X channel word
//   offset 4   uint32  Y channel word
//   offset 8   uint8   flags (bit 0: laser on)
//   offset 9   uint16  laser power (0..65535)
//   offset 11  uint8   reserved, 0

#pragma once

#include <cstddef>
#include <cstdint>

#include "ogcode/stream/ByteBuffer.hpp"
#include "ogcode/xy2/XY2Frame.hpp"

namespace ogcode::stream {

constexpr std::size_t FRAME_RECORD_SIZE = 12;
constexpr std::uint8_t FRAME_FLAG_LASER_ON = 0x01;

void appendFrameRecord(ByteBuffer& buffer, const xy2::XY2Frame& frame);

/// Decode one record; @p bytes must hold FRAME_RECORD_SIZE bytes.
xy2::XY2Frame decodeFrameRecord(const std::uint8_t* bytes, std::uint64_t sampleIndex);

} // namespace ogcode::stream
