#include "ogcode/timing/LaserTimingCoordinator.hpp"

#include "ogcode/log/Log.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace ogcode::timing {

using core::TimingError;
using planner::PlannedSegment;

namespace {

constexpr double REST_VELOCITY = 1e-9;  // mm/s
constexpr double TIME_EPSILON = 1e-15;  // s

} // namespace

LaserTimingCoordinator::LaserTimingCoordinator(config::LaserTiming laserTiming)
: timing(laserTiming) {}

double LaserTimingCoordinator::settleDuration(double peakVelocity) const {
    const double tau = config::toSeconds(timing.settleTimeConstant);
    if (tau <= 0.0 || peakVelocity <= 0.0) {
        return 0.0;
    }
    const double initialError = tau * peakVelocity;
    if (initialError <= timing.settleTolerance) {
        return 0.0;
    }
    return tau * std::log(initialError / timing.settleTolerance);
}

expected<Timeline, TimingError>
LaserTimingCoordinator::coordinate(const gcode::CommandList& commands,
                                   std::vector<PlannedSegment> segments,
                                   Point2 origin) const {
    if (timing.markDelay.count() < 0 || timing.jumpDelay.count() < 0 ||
        timing.leadTime.count() < 0 || timing.settleTimeConstant.count() < 0) {
        return unexpected(TimingError{"laser delays must not be negative"});
    }
    if (!(timing.settleTolerance > 0.0)) {
        return unexpected(TimingError{"settle tolerance must be positive"});
    }

    const double markDelay = config::toSeconds(timing.markDelay);
    const double jumpDelay = config::toSeconds(timing.jumpDelay);
    const double leadTime = config::toSeconds(timing.leadTime);

    Timeline timeline;
    timeline.segments = std::move(segments);
    timeline.startPosition = origin;
    auto& entries = timeline.entries;
    auto& events = timeline.laserEvents;

    double clock = 0.0;
    Point2 position = origin;

    bool intentOn = false;
    double power = 0.0;
    bool laserOn = false;

    double resumeNotBefore = 0.0; // earliest motion start after a laser-off
    double restSince = 0.0;       // when the mirrors were last commanded to rest
    double arrivalPeak = 0.0;     // peak speed of the run that ended at restSince
    double runPeak = 0.0;
    bool afterJump = false;

    auto holdUntil = [&](double until) {
        if (until > clock + TIME_EPSILON) {
            TimelineEntry entry;
            entry.kind = TimelineEntry::Kind::Hold;
            entry.startTime = clock;
            entry.duration = until - clock;
            entry.position = position;
            entries.push_back(entry);
            clock = until;
        }
    };
    auto emit = [&](LaserEventKind kind, bool on) {
        events.push_back(LaserEvent{clock, kind, on, power});
    };
    auto switchOff = [&] {
        emit(LaserEventKind::Off, false);
        laserOn = false;
        resumeNotBefore = clock + leadTime;
    };
    auto switchOnAtRest = [&] {
        double onAt = restSince + settleDuration(arrivalPeak) + markDelay;
        if (afterJump) {
            onAt += jumpDelay;
        }
        holdUntil(onAt);
        emit(LaserEventKind::On, true);
        laserOn = true;
        afterJump = false;
    };

    std::size_t cursor = 0;
    for (std::size_t index = 0; index < commands.size(); ++index) {
        const auto& command = commands[index];
        expected<void, TimingError> status{};

        auto runSegments = [&] {
            while (cursor < timeline.segments.size() &&
                   timeline.segments[cursor].commandIndex == index) {
                const PlannedSegment& segment = timeline.segments[cursor];
                const bool marking = intentOn && !segment.rapid;

                if (marking && !laserOn) {
                    if (segment.entryVelocity > REST_VELOCITY) {
                        std::ostringstream os;
                        os << "laser-on requested while the mirrors are moving (segment " << cursor
                           << ", line " << command.lineNumber << ")";
                        status = unexpected(TimingError{os.str()});
                        return;
                    }
                    switchOnAtRest();
                } else if (!marking && laserOn) {
                    switchOff();
                }
                holdUntil(resumeNotBefore);

                TimelineEntry entry;
                entry.kind = TimelineEntry::Kind::Motion;
                entry.startTime = clock;
                entry.duration = segment.duration;
                entry.segmentIndex = cursor;
                entries.push_back(entry);
                clock += segment.duration;
                position = segment.end;
                runPeak = std::max(runPeak, segment.cruiseVelocity);

                if (segment.exitVelocity <= REST_VELOCITY) {
                    restSince = clock;
                    arrivalPeak = runPeak;
                    runPeak = 0.0;
                    afterJump = segment.rapid;
                    if (laserOn) {
                        switchOff();
                    }
                }
                ++cursor;
            }
        };

        std::visit(gcode::Overloaded{
            [&](const gcode::Move&) { runSegments(); },
            [&](const gcode::Arc&) { runSegments(); },
            [&](const gcode::LaserSet& laser) {
                const bool powerChanged = laser.power != power;
                intentOn = laser.on;
                power = laser.power;
                if (laserOn && !intentOn) {
                    switchOff();
                } else if (laserOn && powerChanged) {
                    emit(LaserEventKind::Power, true);
                }
            },
            [&](const gcode::Dwell& dwell) {
                if (intentOn && !laserOn) {
                    switchOnAtRest();
                }
                holdUntil(clock + dwell.duration);
            },
            [&](const gcode::ProgramEnd&) {
                intentOn = false;
                if (laserOn) {
                    switchOff();
                }
            },
            [&](const gcode::UnitChange&) {},
        }, command.kind);

        if (!status) {
            logError("[LaserTiming] ", status.error().describe(), "\n");
            return unexpected(status.error());
        }
    }

    if (cursor != timeline.segments.size()) {
        TimingError error{"planned segments do not match the command list"};
        logError("[LaserTiming] ", error.describe(), "\n");
        return unexpected(error);
    }
    if (intentOn) {
        TimingError error{"job ends with the laser left on"};
        logError("[LaserTiming] ", error.describe(), "\n");
        return unexpected(error);
    }
    if (laserOn) {
        switchOff();
    }

    timeline.totalDuration = clock;
    logInfo("[LaserTiming] ", events.size(), " laser events over ", clock * 1000.0, " ms\n");
    return timeline;
}

} // namespace ogcode::timing
