#include "ogcode/gcode/GCodeParser.hpp"
#include "ogcode/log/Log.hpp"
#include "ogcode/planner/PathPlanner.hpp"
#include "ogcode/timing/LaserTimingCoordinator.hpp"
#include "ogcode/xy2/FrameEmitter.hpp"
#include "ogcode/xy2/XY2Protocol.hpp"

#include <cmath>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace ogcode;
using namespace ogcode::xy2;

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

namespace {

std::optional<timing::Timeline> buildTimeline(const std::string& text) {
    auto parsed = gcode::GCodeParser{}.parseProgram(text);
    if (!parsed) return std::nullopt;
    auto plan = planner::PathPlanner{}.plan(parsed->commands);
    if (!plan) return std::nullopt;
    auto timeline = timing::LaserTimingCoordinator{}.coordinate(parsed->commands, std::move(plan->segments));
    if (!timeline) return std::nullopt;
    return std::move(*timeline);
}

FrameEmitter defaultEmitter() {
    return FrameEmitter(calibration::CalibrationTransform{}, config::EmitterSettings{});
}

Point2 positionOf(const XY2Frame& frame) {
    return protocol::framePosition(frame).value_or(Point2{-1.0, -1.0});
}

} // namespace

static void testSampling() {
    auto timeline = buildTimeline("M3 S1000\nG1 X10 F6000\nM5\nM2");
    ASSERT_TRUE(timeline.has_value(), "line job builds a timeline");
    if (!timeline) return;

    const std::chrono::nanoseconds period{10000};
    TimelineSampler sampler(*timeline, period);
    const auto expectedCount = static_cast<std::uint64_t>(
        std::ceil(timeline->totalDuration / 1e-5 - 1e-9)) + 1;
    ASSERT_EQ(sampler.sampleCount(), expectedCount, "samples cover the whole timeline");

    std::uint64_t k = 0;
    bool timestampsExact = true;
    while (!sampler.done()) {
        const TimedPoint point = sampler.next();
        if (point.timestamp.count() != static_cast<std::int64_t>(k) * 10000) {
            timestampsExact = false;
        }
        ++k;
    }
    ASSERT_TRUE(timestampsExact, "sample k sits at exactly k periods");
    ASSERT_EQ(k, expectedCount, "sampler yields sampleCount points");
}

static void testEmit() {
    auto timeline = buildTimeline("M3 S1000\nG1 X10 F6000\nM5\nM2");
    if (!timeline) {
        ASSERT_TRUE(false, "line job builds a timeline");
        return;
    }

    std::vector<XY2Frame> frames;
    auto summary = defaultEmitter().emit(*timeline, [&](XY2Frame&& frame) {
        frames.push_back(frame);
        return true;
    });
    ASSERT_TRUE(summary.has_value(), "emission succeeds");
    if (!summary || frames.size() < 12) return;

    TimelineSampler sampler(*timeline, std::chrono::nanoseconds{10000});
    ASSERT_EQ(summary->framesEmitted, sampler.sampleCount(), "one frame per sample");
    ASSERT_EQ(frames.size(), static_cast<std::size_t>(sampler.sampleCount()), "frames pushed");
    ASSERT_TRUE(!summary->stopped, "not stopped");

    bool contiguous = true;
    bool offMeansZeroPower = true;
    bool monotonic = true;
    for (std::size_t k = 0; k < frames.size(); ++k) {
        if (frames[k].sampleIndex != k) contiguous = false;
        if (!frames[k].laserOn && frames[k].laserPower != 0) offMeansZeroPower = false;
        if (k > 0 && positionOf(frames[k]).x < positionOf(frames[k - 1]).x) monotonic = false;
    }
    ASSERT_TRUE(contiguous, "sample indices are contiguous from zero");
    ASSERT_TRUE(offMeansZeroPower, "laser-off frames carry zero power");
    ASSERT_TRUE(monotonic, "x never moves backwards on a straight mark");

    ASSERT_EQ(frames.front().xWord, protocol::encodeChannelWord(0x8000), "origin maps to the field centre");
    ASSERT_EQ(frames.front().yWord, protocol::encodeChannelWord(0x8000), "origin maps to the field centre (y)");
    ASSERT_TRUE(!frames.front().laserOn, "laser starts off");

    // Laser-on is scheduled after the 100 us mark delay: sample 10.
    ASSERT_TRUE(!frames[9].laserOn, "laser still off before the mark delay ends");
    ASSERT_TRUE(frames[10].laserOn, "laser on once the mark delay ends");
    ASSERT_EQ(frames[10].laserPower, std::uint16_t{65535}, "full power");

    const Point2 last = positionOf(frames.back());
    ASSERT_NEAR(last.x, 39322.0, 0.5, "ends at 10 mm in scanner units");
    ASSERT_NEAR(last.y, 32768.0, 0.5, "y untouched");
    ASSERT_TRUE(!frames.back().laserOn, "laser ends off");
}

static void testEncodingErrors() {
    auto timeline = buildTimeline("G0 X1\nM2");
    if (!timeline) {
        ASSERT_TRUE(false, "rapid job builds a timeline");
        return;
    }

    calibration::CalibrationProfile shifted;
    shifted.x.offset = 70000.0;
    FrameEmitter emitter(calibration::CalibrationTransform(
                             std::make_shared<const calibration::CalibrationProfile>(shifted)),
                         config::EmitterSettings{});
    std::size_t pushed = 0;
    auto result = emitter.emit(*timeline, [&](XY2Frame&&) { ++pushed; return true; });
    ASSERT_TRUE(!result.has_value(), "out-of-range sample fails");
    if (!result) {
        ASSERT_EQ(result.error().sampleIndex, std::uint64_t{0}, "failure names the first sample");
    }
    ASSERT_EQ(pushed, std::size_t{0}, "nothing pushed before the failure");

    TimedPoint point;
    point.position = Point2{std::nan(""), 0.0};
    ASSERT_TRUE(!defaultEmitter().encodeSample(point, false, 0.0, 3).has_value(), "non-finite sample fails");

    config::EmitterSettings zeroPeriod;
    zeroPeriod.samplePeriod = std::chrono::nanoseconds{0};
    FrameEmitter stalled(calibration::CalibrationTransform{}, zeroPeriod);
    ASSERT_TRUE(!stalled.emit(*timeline, [](XY2Frame&&) { return true; }).has_value(), "zero period fails");
}

static void testStoppedByConsumer() {
    auto timeline = buildTimeline("G0 X1\nM2");
    if (!timeline) {
        ASSERT_TRUE(false, "rapid job builds a timeline");
        return;
    }
    std::size_t accepted = 0;
    auto summary = defaultEmitter().emit(*timeline, [&](XY2Frame&&) {
        if (accepted == 5) return false;
        ++accepted;
        return true;
    });
    ASSERT_TRUE(summary.has_value(), "refusal is not an error");
    if (summary) {
        ASSERT_TRUE(summary->stopped, "summary records the refusal");
        ASSERT_EQ(summary->framesEmitted, std::uint64_t{5}, "frames before the refusal");
    }
}

static void testEmergencyStop() {
    config::EmitterSettings settings;
    settings.parkPosition = Point2{1000.0, 1000.0};
    settings.parkStepLimit = 512.0;
    FrameEmitter emitter(calibration::CalibrationTransform{}, settings);

    auto frames = emitter.emergencyStopFrames(Point2{40000.0, 32768.0}, 100);
    // 39000 units on the longer axis at 512 per sample.
    ASSERT_EQ(frames.size(), std::size_t{1 + 77}, "hold frame plus ramp");
    if (frames.empty()) return;

    ASSERT_NEAR(positionOf(frames.front()).x, 40000.0, 0.5, "ramp starts at the last position");
    bool allOff = true;
    bool withinStep = true;
    bool contiguous = true;
    for (std::size_t k = 0; k < frames.size(); ++k) {
        if (frames[k].laserOn || frames[k].laserPower != 0) allOff = false;
        if (frames[k].sampleIndex != 100 + k) contiguous = false;
        if (k > 0) {
            const Point2 a = positionOf(frames[k - 1]);
            const Point2 b = positionOf(frames[k]);
            if (std::abs(b.x - a.x) > 512.0 || std::abs(b.y - a.y) > 512.0) withinStep = false;
        }
    }
    ASSERT_TRUE(allOff, "every stop frame has the laser off");
    ASSERT_TRUE(withinStep, "ramp respects the per-sample step limit");
    ASSERT_TRUE(contiguous, "stop frames continue the sample index");
    ASSERT_EQ(positionOf(frames.back()).x, 1000.0, "ramp ends at park (x)");
    ASSERT_EQ(positionOf(frames.back()).y, 1000.0, "ramp ends at park (y)");

    auto atPark = emitter.emergencyStopFrames(Point2{1000.0, 1000.0}, 0);
    ASSERT_EQ(atPark.size(), std::size_t{2}, "already parked: hold frame plus one park frame");

    auto unknown = emitter.emergencyStopFrames(std::nullopt, 7);
    ASSERT_EQ(unknown.size(), std::size_t{1}, "unknown position gives a single frame");
    if (!unknown.empty()) {
        ASSERT_EQ(unknown.front().sampleIndex, std::uint64_t{7}, "single frame index");
        ASSERT_EQ(positionOf(unknown.front()).x, 1000.0, "single frame at park");
        ASSERT_TRUE(!unknown.front().laserOn, "single frame laser off");
    }
}

int main() {
    ogcode::setLogLevel(ogcode::LogLevel::Error);

    testSampling();
    testEmit();
    testEncodingErrors();
    testStoppedByConsumer();
    testEmergencyStop();

    ogcode::setLogLevel(ogcode::LogLevel::Info);
    if (g_failures) {
        ogcode::logError("Tests failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    ogcode::logInfo("FrameEmitter tests passed.\n");
    return 0;
}
