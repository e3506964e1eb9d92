#pragma once

#include <cstddef>

#include "ogcode/core/Geometry.hpp"

namespace ogcode::planner {

using core::Point2;

/**
 * @brief One straight piece of the motion path with its velocity profile.
 *
 * Lines map to one segment, arcs to a run of chords. The profile is a
 * trapezoid (accelerate, cruise, decelerate); short segments collapse to a
 * triangle with `cruiseTime == 0`. All velocities are path speeds in mm/s.
 */
struct PlannedSegment {
    Point2 start{};
    Point2 end{};
    Point2 direction{};          // unit vector start -> end
    double length = 0.0;         // mm

    double entryVelocity = 0.0;
    double cruiseVelocity = 0.0; // peak velocity actually reached
    double exitVelocity = 0.0;
    double acceleration = 0.0;   // mm/s^2, used for both ramps

    double accelTime = 0.0;
    double cruiseTime = 0.0;
    double decelTime = 0.0;
    double duration = 0.0;       // accelTime + cruiseTime + decelTime
    double startTime = 0.0;      // cumulative, seconds from job start

    std::size_t commandIndex = 0; // index into the command list that produced it
    bool rapid = false;
    bool arcChord = false;

    /// Distance travelled along the segment after @p t seconds (clamped).
    double distanceAt(double t) const;

    /// Path speed after @p t seconds (clamped).
    double velocityAt(double t) const;

    /// Position after @p t seconds of local time.
    Point2 positionAt(double t) const;

    double endTime() const { return startTime + duration; }
};

} // namespace ogcode::planner
