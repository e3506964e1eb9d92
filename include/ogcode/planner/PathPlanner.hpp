// PathPlanner.hpp
// -----------------------------------------------------------------------------
// Turns the parsed command list into a time-parameterized path.
// Responsibilities:
//   * Subdivide arcs into chords within a chordal error bound.
//   * Bound every segment boundary by feed, mirror slew and junction deviation.
//   * Relax boundary speeds backward and forward against the acceleration
//     limit, then fit a trapezoidal (or triangular) profile per segment.

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "ogcode/core/Errors.hpp"
#include "ogcode/core/Expected.hpp"
#include "ogcode/core/JobConfig.hpp"
#include "ogcode/gcode/Command.hpp"
#include "ogcode/planner/PlannedSegment.hpp"

namespace ogcode::planner {

/// Signed angle swept by @p arc starting at @p start (positive = CCW).
/// Coincident start and target yield a full turn.
double arcSweep(Point2 start, const gcode::Arc& arc);

/// Minimum chord count keeping the sagitta of every chord within @p tolerance.
std::size_t arcChordCount(double radius, double sweep, double tolerance);

/// Chord end points of @p arc, excluding @p start. The last point is the arc
/// target itself.
std::vector<Point2> subdivideArc(Point2 start, const gcode::Arc& arc, double tolerance);

struct PlanResult {
    std::vector<PlannedSegment> segments;
    std::vector<std::string> warnings;
    double totalDuration = 0.0;
    Point2 finalPosition{};
};

class PathPlanner {
public:
    explicit PathPlanner(config::MotionLimits limits = {});

    /// Reject non-positive or non-finite limits.
    expected<void, core::PlanningError> validateLimits() const;

    /**
     * @brief Plan the whole command list.
     * @param commands Parsed program.
     * @param origin Machine position before the first command.
     */
    expected<PlanResult, core::PlanningError>
    plan(const gcode::CommandList& commands, Point2 origin = {}) const;

    /// Highest speed allowed through the corner between two unit directions.
    double junctionVelocity(Point2 incoming, Point2 outgoing) const;

    /// Highest speed the mirrors can sustain along a unit direction.
    double slewLimitedVelocity(Point2 direction) const;

    const config::MotionLimits& motionLimits() const { return limits; }

private:
    config::MotionLimits limits;
};

} // namespace ogcode::planner
