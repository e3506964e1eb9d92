#pragma once

#include <cstdint>

namespace ogcode::xy2 {

/**
 * @brief One XY2-100 sample period: both channel words plus the laser line.
 *
 * Produced by the FrameEmitter and moved through the queue into a sink; no
 * component keeps frames after handing them on.
 */
struct XY2Frame {
    std::uint32_t xWord = 0;      // 20-bit channel word, see XY2Protocol.hpp
    std::uint32_t yWord = 0;
    bool laserOn = false;
    std::uint16_t laserPower = 0; // 0..65535 full scale
    std::uint64_t sampleIndex = 0;
};

} // namespace ogcode::xy2
