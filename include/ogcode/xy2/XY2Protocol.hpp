// XY2Protocol.hpp
// -----------------------------------------------------------------------------
// Encoding helpers for the XY2-100 galvo protocol.
// Responsibilities:
//   * Provide protocol constants (word layout, data range, frame rate).
//   * Build and check 20-bit channel words from 16-bit positions.
//   * Keep bit twiddling out of the emitter so its sampling loop stays clear.
//
// Word layout, transmitted MSB first on each channel:
//   bit 19      sync/control, always 0
//   bits 18-17  status, always 0b01
//   bits 16-1   position, offset binary (0x8000 = centre of field)
//   bit 0       check bit, even parity over bits 19-1

#pragma once

#include <cstdint>
#include <optional>

#include "ogcode/core/Geometry.hpp"
#include "ogcode/xy2/XY2Frame.hpp"

namespace ogcode::xy2::protocol {

constexpr unsigned XY2_WORD_BITS = 20;
constexpr std::uint32_t XY2_WORD_MASK = (1u << XY2_WORD_BITS) - 1u;
constexpr std::uint32_t XY2_HEADER = 0b001;   // sync + two status bits
constexpr unsigned XY2_HEADER_SHIFT = 17;
constexpr unsigned XY2_DATA_SHIFT = 1;
constexpr std::uint32_t XY2_DATA_MAX = 0xFFFFu;
constexpr std::uint32_t XY2_FRAME_RATE = 100000; // frames per second at the 2 MHz clock
constexpr double XY2_POWER_SCALE = 65535.0;

/// Even-parity check bit for the upper 19 bits of @p word.
[[nodiscard]] std::uint32_t checkBit(std::uint32_t word) noexcept;

/// Wrap a 16-bit position in header and check bit.
[[nodiscard]] std::uint32_t encodeChannelWord(std::uint16_t data) noexcept;

/// Extract the position from a channel word; empty if header or check bit is wrong.
[[nodiscard]] std::optional<std::uint16_t> decodeChannelWord(std::uint32_t word) noexcept;

/// Laser power percentage to the 16-bit laser line value (clamped to 0..100 %).
[[nodiscard]] std::uint16_t encodePower(double percent) noexcept;

/// Scanner position carried by a frame, if both words are valid.
[[nodiscard]] std::optional<core::Point2> framePosition(const XY2Frame& frame) noexcept;

} // namespace ogcode::xy2::protocol
