// LaserTimingCoordinator.hpp
// -----------------------------------------------------------------------------
// Merges laser intent from the command list with the planned motion.
// Policy:
//   * Laser-on waits for the mirrors to settle at rest, then the mark delay
//     (plus the jump delay after a rapid). Motion holds until the laser is on.
//   * Marking motion is switched off at every exact stop and before any
//     non-marking motion; the next motion waits the lead time after the off.
//   * Power changes while on are emitted where they occur in the program.

#pragma once

#include "ogcode/core/Errors.hpp"
#include "ogcode/core/Expected.hpp"
#include "ogcode/core/JobConfig.hpp"
#include "ogcode/gcode/Command.hpp"
#include "ogcode/timing/Timeline.hpp"

namespace ogcode::timing {

class LaserTimingCoordinator {
public:
    explicit LaserTimingCoordinator(config::LaserTiming timing = {});

    expected<Timeline, core::TimingError>
    coordinate(const gcode::CommandList& commands,
               std::vector<planner::PlannedSegment> segments,
               Point2 origin = {}) const;

    /**
     * @brief Time for the mirrors to settle after being commanded to rest.
     *
     * The mirror is modelled as a first-order follower with time constant tau:
     * at speed v it lags by tau * v, and that error decays as exp(-t / tau)
     * until it is inside the settle tolerance.
     */
    double settleDuration(double peakVelocity) const;

private:
    config::LaserTiming timing;
};

} // namespace ogcode::timing
