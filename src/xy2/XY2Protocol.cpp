// XY2Protocol.cpp
// -----------------------------------------------------------------------------
// Implements the XY2-100 word helpers declared in XY2Protocol.hpp.

#include "ogcode/xy2/XY2Protocol.hpp"

#include <algorithm>
#include <bitset>
#include <cmath>

namespace ogcode::xy2::protocol {

std::uint32_t checkBit(std::uint32_t word) noexcept {
    const std::bitset<XY2_WORD_BITS - 1> upper((word & XY2_WORD_MASK) >> 1);
    return static_cast<std::uint32_t>(upper.count() & 1u);
}

std::uint32_t encodeChannelWord(std::uint16_t data) noexcept {
    const std::uint32_t word = (XY2_HEADER << XY2_HEADER_SHIFT)
                             | (static_cast<std::uint32_t>(data) << XY2_DATA_SHIFT);
    return word | checkBit(word);
}

std::optional<std::uint16_t> decodeChannelWord(std::uint32_t word) noexcept {
    if ((word & ~XY2_WORD_MASK) != 0) {
        return std::nullopt;
    }
    if ((word >> XY2_HEADER_SHIFT) != XY2_HEADER) {
        return std::nullopt;
    }
    if ((word & 1u) != checkBit(word)) {
        return std::nullopt;
    }
    return static_cast<std::uint16_t>((word >> XY2_DATA_SHIFT) & XY2_DATA_MAX);
}

std::uint16_t encodePower(double percent) noexcept {
    if (!std::isfinite(percent)) {
        return 0;
    }
    const double scaled = std::clamp(percent, 0.0, 100.0) / 100.0 * XY2_POWER_SCALE;
    return static_cast<std::uint16_t>(std::lround(scaled));
}

std::optional<core::Point2> framePosition(const XY2Frame& frame) noexcept {
    const auto x = decodeChannelWord(frame.xWord);
    const auto y = decodeChannelWord(frame.yWord);
    if (!x || !y) {
        return std::nullopt;
    }
    return core::Point2{static_cast<double>(*x), static_cast<double>(*y)};
}

} // namespace ogcode::xy2::protocol
