#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>

#include "ogcode/core/Geometry.hpp"
#include "ogcode/timing/Timeline.hpp"

namespace ogcode::xy2 {

using core::Point2;

/// Machine position of the mirrors at one sample instant.
struct TimedPoint {
    static constexpr std::size_t kHold = std::numeric_limits<std::size_t>::max();

    Point2 position{};
    std::chrono::nanoseconds timestamp{0};
    std::size_t segmentIndex = kHold; // kHold while the mirrors are held still
};

/**
 * @brief Walks a timeline at a fixed sample period.
 *
 * Sample k sits at exactly `k * period`; timestamps are integer nanoseconds
 * so spacing never drifts. Positions are evaluated directly from the segment
 * profiles, not by integrating velocity. The last sample lands at or after the
 * end of the timeline, where the mirrors are at their final rest position.
 */
class TimelineSampler {
public:
    TimelineSampler(const timing::Timeline& timeline, std::chrono::nanoseconds period);

    bool done() const { return index >= count; }
    std::uint64_t sampleCount() const { return count; }
    std::uint64_t nextIndex() const { return index; }

    /// Next sample; call only while `!done()`.
    TimedPoint next();

private:
    const timing::Timeline& timeline;
    std::chrono::nanoseconds period;
    std::uint64_t count = 0;
    std::uint64_t index = 0;
    std::size_t cursor = 0; // current timeline entry, only ever moves forward
};

} // namespace ogcode::xy2
