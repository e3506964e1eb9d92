/**
 * @brief Implements arc subdivision and the look-ahead velocity planner.
 */
#include "ogcode/planner/PathPlanner.hpp"

#include "ogcode/log/Log.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace ogcode::planner {

using core::PlanningError;

namespace {

constexpr double PI = 3.14159265358979323846;
constexpr double TWO_PI = 2.0 * PI;
constexpr double MIN_SEGMENT_LENGTH = 1e-9; // mm
constexpr double SWEEP_EPSILON = 1e-9;      // rad
constexpr double COLINEAR_COSINE = 0.999999;
constexpr double INFINITE_VELOCITY = std::numeric_limits<double>::infinity();

// Fit the trapezoid for one segment. Boundary speeds must already be
// reachable within the segment length.
void applyProfile(PlannedSegment& segment, double entry, double exit, double target, double accel) {
    const double length = segment.length;
    double peak = std::max({target, entry, exit});

    double accelDistance = (peak * peak - entry * entry) / (2.0 * accel);
    double decelDistance = (peak * peak - exit * exit) / (2.0 * accel);
    if (accelDistance + decelDistance > length) {
        // Cruise speed is out of reach: accelerate straight into deceleration.
        peak = std::sqrt((2.0 * accel * length + entry * entry + exit * exit) / 2.0);
        peak = std::max({peak, entry, exit});
        accelDistance = std::max(0.0, (peak * peak - entry * entry) / (2.0 * accel));
        decelDistance = std::max(0.0, length - accelDistance);
    }
    const double cruiseDistance = std::max(0.0, length - accelDistance - decelDistance);

    segment.entryVelocity = entry;
    segment.exitVelocity = exit;
    segment.cruiseVelocity = peak;
    segment.acceleration = accel;
    segment.accelTime = (peak - entry) / accel;
    segment.decelTime = (peak - exit) / accel;
    segment.cruiseTime = peak > 0.0 ? cruiseDistance / peak : 0.0;
    segment.duration = segment.accelTime + segment.cruiseTime + segment.decelTime;
}

} // namespace

double arcSweep(Point2 start, const gcode::Arc& arc) {
    const double a0 = std::atan2(start.y - arc.center.y, start.x - arc.center.x);
    const double a1 = std::atan2(arc.target.y - arc.center.y, arc.target.x - arc.center.x);
    double sweep = a1 - a0;
    if (arc.direction == gcode::ArcDirection::CounterClockwise) {
        if (sweep <= SWEEP_EPSILON) {
            sweep += TWO_PI;
        }
    } else if (sweep >= -SWEEP_EPSILON) {
        sweep -= TWO_PI;
    }
    return sweep;
}

std::size_t arcChordCount(double radius, double sweep, double tolerance) {
    if (radius <= 0.0 || tolerance <= 0.0) {
        return 1;
    }
    // Sagitta of a chord spanning angle a is r * (1 - cos(a / 2)).
    const double ratio = std::min(tolerance / radius, 1.0);
    const double maxAngle = 2.0 * std::acos(1.0 - ratio);
    const double chords = std::ceil(std::abs(sweep) / maxAngle - 1e-9);
    return std::max<std::size_t>(1, static_cast<std::size_t>(chords));
}

std::vector<Point2> subdivideArc(Point2 start, const gcode::Arc& arc, double tolerance) {
    const double radius = core::distance(start, arc.center);
    const double sweep = arcSweep(start, arc);
    const std::size_t count = arcChordCount(radius, sweep, tolerance);
    const double a0 = std::atan2(start.y - arc.center.y, start.x - arc.center.x);

    std::vector<Point2> points;
    points.reserve(count);
    for (std::size_t k = 1; k < count; ++k) {
        const double angle = a0 + sweep * static_cast<double>(k) / static_cast<double>(count);
        points.push_back(arc.center + Point2{radius * std::cos(angle), radius * std::sin(angle)});
    }
    points.push_back(arc.target);
    return points;
}

PathPlanner::PathPlanner(config::MotionLimits motionLimits)
: limits(motionLimits) {}

expected<void, PlanningError> PathPlanner::validateLimits() const {
    auto positive = [](double value) { return std::isfinite(value) && value > 0.0; };
    if (!positive(limits.maxAcceleration)) {
        return unexpected(PlanningError{PlanningError::kNoSegment, "max acceleration must be positive"});
    }
    if (!positive(limits.rapidVelocity)) {
        return unexpected(PlanningError{PlanningError::kNoSegment, "rapid velocity must be positive"});
    }
    if (!positive(limits.mirrorSlewRate)) {
        return unexpected(PlanningError{PlanningError::kNoSegment, "mirror slew rate must be positive"});
    }
    if (!positive(limits.focalLength)) {
        return unexpected(PlanningError{PlanningError::kNoSegment, "focal length must be positive"});
    }
    if (!positive(limits.arcTolerance)) {
        return unexpected(PlanningError{PlanningError::kNoSegment, "arc tolerance must be positive"});
    }
    if (!std::isfinite(limits.junctionDeviation) || limits.junctionDeviation < 0.0) {
        return unexpected(PlanningError{PlanningError::kNoSegment, "junction deviation must not be negative"});
    }
    return {};
}

double PathPlanner::junctionVelocity(Point2 incoming, Point2 outgoing) const {
    if (limits.junctionDeviation <= 0.0) {
        return 0.0; // cornering disabled: exact stop
    }
    const double cosTheta = -core::dot(incoming, outgoing);
    if (cosTheta < -COLINEAR_COSINE) {
        return INFINITE_VELOCITY;
    }
    if (cosTheta > COLINEAR_COSINE) {
        return 0.0;
    }
    const double sinHalf = std::sqrt(0.5 * (1.0 - cosTheta));
    return std::sqrt(limits.maxAcceleration * limits.junctionDeviation * sinHalf / (1.0 - sinHalf));
}

double PathPlanner::slewLimitedVelocity(Point2 direction) const {
    const double axisLimit = limits.axisVelocityLimit();
    double velocity = INFINITE_VELOCITY;
    if (std::abs(direction.x) > 1e-12) {
        velocity = std::min(velocity, axisLimit / std::abs(direction.x));
    }
    if (std::abs(direction.y) > 1e-12) {
        velocity = std::min(velocity, axisLimit / std::abs(direction.y));
    }
    return velocity;
}

expected<PlanResult, PlanningError>
PathPlanner::plan(const gcode::CommandList& commands, Point2 origin) const {
    if (auto valid = validateLimits(); !valid) {
        logError("[PathPlanner] ", valid.error().describe(), "\n");
        return unexpected(valid.error());
    }

    PlanResult result;
    auto& segments = result.segments;
    std::vector<double> targetVelocity;
    std::vector<bool> stopBefore;

    Point2 position = origin;
    bool laserIntent = false;
    bool stopPending = true;

    auto addSegment = [&](Point2 from, Point2 to, bool rapid, double feed, bool arcChord,
                          std::size_t commandIndex) -> expected<void, PlanningError> {
        const double length = core::distance(from, to);
        if (length < MIN_SEGMENT_LENGTH) {
            return {};
        }
        PlannedSegment segment;
        segment.start = from;
        segment.end = to;
        segment.length = length;
        segment.direction = (to - from) * (1.0 / length);
        segment.rapid = rapid;
        segment.arcChord = arcChord;
        segment.commandIndex = commandIndex;

        const double requested = rapid ? limits.rapidVelocity : feed / 60.0;
        if (!std::isfinite(requested) || requested <= 0.0) {
            return unexpected(PlanningError{segments.size(), "feed rate must be positive"});
        }
        const double velocity = std::min(requested, slewLimitedVelocity(segment.direction));
        if (!std::isfinite(velocity) || velocity <= 0.0) {
            return unexpected(PlanningError{segments.size(), "no feasible velocity for segment"});
        }

        if (!segments.empty() && segments.back().rapid != rapid) {
            stopPending = true;
        }
        stopBefore.push_back(stopPending);
        stopPending = false;
        targetVelocity.push_back(velocity);
        segments.push_back(segment);
        return {};
    };

    auto warnZeroLength = [&](const gcode::Command& command) {
        std::ostringstream os;
        os << "line " << command.lineNumber << ": zero-length move dropped";
        logWarning("[PathPlanner] ", os.str(), "\n");
        result.warnings.push_back(os.str());
    };

    for (std::size_t index = 0; index < commands.size(); ++index) {
        const auto& command = commands[index];
        expected<void, PlanningError> status{};

        std::visit(gcode::Overloaded{
            [&](const gcode::Move& move) {
                if (core::distance(position, move.target) < MIN_SEGMENT_LENGTH) {
                    warnZeroLength(command);
                    return;
                }
                status = addSegment(position, move.target, move.rapid, move.feed, false, index);
                position = move.target;
            },
            [&](const gcode::Arc& arc) {
                Point2 from = position;
                for (const auto& point : subdivideArc(position, arc, limits.arcTolerance)) {
                    status = addSegment(from, point, false, arc.feed, true, index);
                    if (!status) {
                        return;
                    }
                    from = point;
                }
                position = arc.target;
            },
            [&](const gcode::LaserSet& laser) {
                if (laser.on != laserIntent) {
                    stopPending = true;
                    laserIntent = laser.on;
                }
            },
            [&](const gcode::Dwell&) { stopPending = true; },
            [&](const gcode::ProgramEnd&) {
                stopPending = true;
                laserIntent = false;
            },
            [&](const gcode::UnitChange&) {},
        }, command.kind);

        if (!status) {
            logError("[PathPlanner] ", status.error().describe(), "\n");
            return unexpected(status.error());
        }
    }

    const std::size_t count = segments.size();
    const double accel = limits.maxAcceleration;

    // boundary[i] is the speed between segment i-1 and i; the path starts and
    // ends at rest.
    std::vector<double> boundary(count + 1, 0.0);
    for (std::size_t i = 1; i < count; ++i) {
        if (stopBefore[i]) {
            continue;
        }
        boundary[i] = std::min({junctionVelocity(segments[i - 1].direction, segments[i].direction),
                                targetVelocity[i - 1], targetVelocity[i]});
    }

    for (std::size_t i = count; i-- > 0;) {
        const double reachable = std::sqrt(boundary[i + 1] * boundary[i + 1] + 2.0 * accel * segments[i].length);
        boundary[i] = std::min(boundary[i], reachable);
    }
    for (std::size_t i = 0; i < count; ++i) {
        const double reachable = std::sqrt(boundary[i] * boundary[i] + 2.0 * accel * segments[i].length);
        boundary[i + 1] = std::min(boundary[i + 1], reachable);
    }

    double clock = 0.0;
    for (std::size_t i = 0; i < count; ++i) {
        auto& segment = segments[i];
        applyProfile(segment, boundary[i], boundary[i + 1], targetVelocity[i], accel);
        if (!std::isfinite(segment.duration) || segment.duration <= 0.0) {
            PlanningError error{i, "infeasible velocity profile"};
            logError("[PathPlanner] ", error.describe(), "\n");
            return unexpected(error);
        }
        segment.startTime = clock;
        clock += segment.duration;
    }

    result.totalDuration = clock;
    result.finalPosition = position;
    logInfo("[PathPlanner] planned ", count, " segments, ", clock * 1000.0, " ms of motion\n");
    return result;
}

} // namespace ogcode::planner
