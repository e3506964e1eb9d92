#pragma once

#include <cstddef>
#include <vector>

#include "ogcode/core/Geometry.hpp"
#include "ogcode/planner/PlannedSegment.hpp"

namespace ogcode::timing {

using core::Point2;

enum class LaserEventKind { On, Off, Power };

struct LaserEvent {
    double time = 0.0;   // seconds from job start
    LaserEventKind kind = LaserEventKind::Off;
    bool on = false;     // laser state after the event
    double power = 0.0;  // percent
};

/**
 * @brief One stretch of the job clock: either a planned segment in motion or
 * the mirrors held still at a position (settle, delays, dwell).
 */
struct TimelineEntry {
    enum class Kind { Motion, Hold };

    Kind kind = Kind::Hold;
    double startTime = 0.0;
    double duration = 0.0;
    std::size_t segmentIndex = 0; // Motion only
    Point2 position{};            // Hold only

    double endTime() const { return startTime + duration; }
};

/// Motion and laser schedule for a whole job, ready for resampling.
struct Timeline {
    std::vector<planner::PlannedSegment> segments;
    std::vector<TimelineEntry> entries;  // contiguous, ordered by startTime
    std::vector<LaserEvent> laserEvents; // ordered by time
    Point2 startPosition{};
    double totalDuration = 0.0;
};

} // namespace ogcode::timing
