#include "ogcode/gcode/GCodeParser.hpp"
#include "ogcode/log/Log.hpp"
#include "ogcode/planner/PathPlanner.hpp"

#include <cmath>
#include <string>

using namespace ogcode;
using namespace ogcode::planner;

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { ogcode::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { ogcode::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", +_va, " != ", +_vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_NEAR(a,b,tol,msg) \
    do { double _va=(a); double _vb=(b); if (!(std::abs(_va-_vb) <= (tol))) { ogcode::logError("ASSERT NEAR FAILED: ", (msg), \
        "  (", _va, " vs ", _vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

static constexpr double PI = 3.14159265358979323846;

static expected<PlanResult, core::PlanningError> planProgram(const std::string& text,
                                                             config::MotionLimits limits = {}) {
    auto parsed = gcode::GCodeParser{}.parseProgram(text);
    if (!parsed) {
        ogcode::logError("test program failed to parse: ", parsed.error().describe(), "\n");
        return unexpected(core::PlanningError{core::PlanningError::kNoSegment, "parse"});
    }
    return PathPlanner(limits).plan(parsed->commands);
}

static void checkContinuity(const PlanResult& plan, const char* label) {
    double clock = 0.0;
    for (std::size_t i = 0; i < plan.segments.size(); ++i) {
        const auto& segment = plan.segments[i];
        ASSERT_NEAR(segment.startTime, clock, 1e-12, label);
        clock += segment.duration;
        ASSERT_TRUE(segment.positionAt(segment.duration) == segment.end, label);
        if (i + 1 < plan.segments.size()) {
            const auto& next = plan.segments[i + 1];
            ASSERT_TRUE(segment.end == next.start, label);
            ASSERT_EQ(segment.exitVelocity, next.entryVelocity, label);
        }
    }
    ASSERT_NEAR(plan.totalDuration, clock, 1e-12, label);
    if (!plan.segments.empty()) {
        ASSERT_EQ(plan.segments.front().entryVelocity, 0.0, "path starts at rest");
        ASSERT_EQ(plan.segments.back().exitVelocity, 0.0, "path ends at rest");
    }
}

static void testChordalDeviation() {
    const double radii[] = {0.5, 5.0, 40.0};
    const double tolerances[] = {0.001, 0.01, 0.2};
    for (double radius : radii) {
        for (double tolerance : tolerances) {
            gcode::Arc arc;
            arc.center = Point2{0.0, 0.0};
            arc.target = Point2{-radius, 0.0};
            arc.direction = gcode::ArcDirection::CounterClockwise;
            const Point2 start{radius, 0.0};

            const auto points = subdivideArc(start, arc, tolerance);
            ASSERT_TRUE(!points.empty(), "arc has chords");
            ASSERT_TRUE(points.back() == arc.target, "last chord ends on the target");

            Point2 from = start;
            for (const auto& to : points) {
                const Point2 mid = (from + to) * 0.5;
                const double deviation = radius - core::distance(mid, arc.center);
                ASSERT_TRUE(deviation <= tolerance + 1e-12, "chord deviation within tolerance");
                ASSERT_NEAR(core::distance(to, arc.center), radius, 1e-9, "chord end on the circle");
                from = to;
            }
        }
    }
    ASSERT_EQ(arcChordCount(5.0, 2.0 * PI, 100.0), std::size_t{2}, "tolerance beyond the radius still splits a full turn");
}

static void testFullCircle() {
    config::MotionLimits limits;
    limits.arcTolerance = 0.01;
    auto plan = planProgram("G0 X5 Y0\nG2 X5 Y0 I-5 J0 F600", limits);
    ASSERT_TRUE(plan.has_value(), "full circle plans");
    if (!plan) return;

    gcode::Arc arc;
    arc.center = Point2{0.0, 0.0};
    arc.target = Point2{5.0, 0.0};
    arc.direction = gcode::ArcDirection::Clockwise;
    ASSERT_NEAR(arcSweep(Point2{5.0, 0.0}, arc), -2.0 * PI, 1e-12, "coincident end points sweep a full turn");

    std::size_t chords = 0;
    const PlannedSegment* first = nullptr;
    const PlannedSegment* last = nullptr;
    for (const auto& segment : plan->segments) {
        if (!segment.arcChord) continue;
        ++chords;
        if (!first) first = &segment;
        last = &segment;
        const Point2 mid = (segment.start + segment.end) * 0.5;
        ASSERT_TRUE(5.0 - core::distance(mid, arc.center) <= 0.01 + 1e-12, "circle chord within 0.01 mm");
    }
    ASSERT_EQ(chords, std::size_t{50}, "chord count for r=5, eps=0.01");
    ASSERT_TRUE(first && last && first->start == last->end, "circle closes on its start point");
    checkContinuity(*plan, "full circle continuity");
}

static void testJunctionVelocity() {
    config::MotionLimits limits;
    limits.junctionDeviation = 0.05;
    PathPlanner planner(limits);

    auto plan = planProgram("G1 X10 Y0 F60000\nG1 X0 Y1", limits);
    ASSERT_TRUE(plan.has_value(), "sharp corner plans");
    if (!plan || plan->segments.size() != 2) return;

    const auto& in = plan->segments[0];
    const auto& out = plan->segments[1];
    const double limit = planner.junctionVelocity(in.direction, out.direction);
    ASSERT_TRUE(in.exitVelocity <= limit + 1e-9, "corner speed within the junction limit");
    ASSERT_NEAR(in.exitVelocity, limit, 1e-6, "corner speed reaches the junction limit");
    ASSERT_TRUE(in.exitVelocity > 0.0, "corner is taken without stopping");
    ASSERT_TRUE(in.cruiseVelocity <= 1000.0 + 1e-9, "feed limit respected");
    checkContinuity(*plan, "corner continuity");

    ASSERT_TRUE(std::isinf(planner.junctionVelocity(Point2{1.0, 0.0}, Point2{1.0, 0.0})), "colinear is unbounded");
    ASSERT_EQ(planner.junctionVelocity(Point2{1.0, 0.0}, Point2{-1.0, 0.0}), 0.0, "reversal stops");

    auto colinear = planProgram("G1 X10 F600\nG1 X20");
    ASSERT_TRUE(colinear && colinear->segments.size() == 2, "colinear moves plan");
    if (colinear && colinear->segments.size() == 2) {
        ASSERT_NEAR(colinear->segments[0].exitVelocity, 10.0, 1e-9, "colinear join keeps the feed");
    }
}

static void testSquareWithoutCornering() {
    config::MotionLimits limits;
    limits.junctionDeviation = 0.0;
    auto plan = planProgram("M3 S1000\nG1 X10 F6000\nG1 Y10\nG1 X0\nG1 Y0\nM5\nM2", limits);
    ASSERT_TRUE(plan.has_value(), "square plans");
    if (!plan) return;
    ASSERT_EQ(plan->segments.size(), std::size_t{4}, "four sides");
    for (const auto& segment : plan->segments) {
        ASSERT_EQ(segment.entryVelocity, 0.0, "side starts at rest");
        ASSERT_EQ(segment.exitVelocity, 0.0, "side ends at rest");
        ASSERT_NEAR(segment.cruiseVelocity, 100.0, 1e-9, "side cruises at the feed");
        ASSERT_NEAR(segment.distanceAt(segment.duration), 10.0, 1e-12, "side length covered");
    }
    checkContinuity(*plan, "square continuity");
}

static void testForcedStops() {
    auto plan = planProgram("G0 X10\nG1 X20 F600");
    ASSERT_TRUE(plan && plan->segments.size() == 2, "rapid then feed plans");
    if (plan && plan->segments.size() == 2) {
        ASSERT_EQ(plan->segments[0].exitVelocity, 0.0, "rapid to feed stops");
        ASSERT_TRUE(plan->segments[0].rapid && !plan->segments[1].rapid, "rapid flags");
    }

    auto laser = planProgram("G1 X10 F600\nM3 S100\nG1 X20\nM5");
    ASSERT_TRUE(laser && laser->segments.size() == 2, "laser switch plans");
    if (laser && laser->segments.size() == 2) {
        ASSERT_EQ(laser->segments[0].exitVelocity, 0.0, "laser-on switch stops the mirrors");
    }

    auto dwell = planProgram("G1 X10 F600\nG4 P0.1\nG1 X20");
    ASSERT_TRUE(dwell && dwell->segments.size() == 2, "dwell plans");
    if (dwell && dwell->segments.size() == 2) {
        ASSERT_EQ(dwell->segments[0].exitVelocity, 0.0, "dwell stops the mirrors");
    }
}

static void testSlewLimit() {
    config::MotionLimits limits;
    limits.mirrorSlewRate = 1.0;
    limits.focalLength = 100.0;
    PathPlanner planner(limits);
    ASSERT_NEAR(planner.slewLimitedVelocity(Point2{1.0, 0.0}), 200.0, 1e-9, "axis limit along x");

    auto axis = planProgram("G0 X50", limits);
    ASSERT_TRUE(axis && axis->segments.size() == 1, "rapid plans");
    if (axis && axis->segments.size() == 1) {
        ASSERT_NEAR(axis->segments[0].cruiseVelocity, 200.0, 1e-9, "rapid capped by slew");
    }

    auto diagonal = planProgram("G0 X50 Y50", limits);
    ASSERT_TRUE(diagonal && diagonal->segments.size() == 1, "diagonal rapid plans");
    if (diagonal && diagonal->segments.size() == 1) {
        ASSERT_NEAR(diagonal->segments[0].cruiseVelocity, 200.0 * std::sqrt(2.0), 1e-6,
                    "diagonal shares the load between both mirrors");
    }
}

static void testShortSegmentProfile() {
    auto plan = planProgram("G1 X0.001 F60000");
    ASSERT_TRUE(plan && plan->segments.size() == 1, "short move plans");
    if (!plan || plan->segments.size() != 1) return;
    const auto& segment = plan->segments[0];
    ASSERT_NEAR(segment.cruiseTime, 0.0, 1e-15, "triangle profile has no cruise");
    ASSERT_NEAR(segment.cruiseVelocity, std::sqrt(1.0e6 * 0.001), 1e-9, "peak of the triangle");
    ASSERT_NEAR(segment.distanceAt(segment.duration / 2.0), 0.0005, 1e-12, "half way at half time");
    ASSERT_NEAR(segment.velocityAt(segment.duration / 2.0), segment.cruiseVelocity, 1e-9, "peak at half time");
}

static void testRejections() {
    auto zero = planProgram("G1 X0 Y0 F600");
    ASSERT_TRUE(zero.has_value(), "zero-length move is not fatal");
    if (zero) {
        ASSERT_TRUE(zero->segments.empty(), "zero-length move dropped");
        ASSERT_EQ(zero->warnings.size(), std::size_t{1}, "zero-length move warned");
    }

    config::MotionLimits bad;
    bad.maxAcceleration = 0.0;
    auto rejected = planProgram("G1 X1 F600", bad);
    ASSERT_TRUE(!rejected.has_value(), "zero acceleration rejected");
    if (!rejected) {
        ASSERT_EQ(rejected.error().segmentIndex, core::PlanningError::kNoSegment, "configuration error has no segment");
    }

    config::MotionLimits negative;
    negative.junctionDeviation = -1.0;
    ASSERT_TRUE(!PathPlanner(negative).validateLimits().has_value(), "negative junction deviation rejected");
}

int main() {
    ogcode::setLogLevel(ogcode::LogLevel::Error);

    testChordalDeviation();
    testFullCircle();
    testJunctionVelocity();
    testSquareWithoutCornering();
    testForcedStops();
    testSlewLimit();
    testShortSegmentProfile();
    testRejections();

    ogcode::setLogLevel(ogcode::LogLevel::Info);
    if (g_failures) {
        ogcode::logError("Tests failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    ogcode::logInfo("PathPlanner tests passed.\n");
    return 0;
}
