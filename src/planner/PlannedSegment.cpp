#include "ogcode/planner/PlannedSegment.hpp"

#include <algorithm>

namespace ogcode::planner {

double PlannedSegment::distanceAt(double t) const {
    if (t <= 0.0) {
        return 0.0;
    }
    if (t >= duration) {
        return length;
    }

    if (t < accelTime) {
        return entryVelocity * t + 0.5 * acceleration * t * t;
    }
    const double accelDistance = entryVelocity * accelTime + 0.5 * acceleration * accelTime * accelTime;
    if (t < accelTime + cruiseTime) {
        return accelDistance + cruiseVelocity * (t - accelTime);
    }
    const double tau = t - accelTime - cruiseTime;
    const double decelStart = accelDistance + cruiseVelocity * cruiseTime;
    return std::min(length, decelStart + cruiseVelocity * tau - 0.5 * acceleration * tau * tau);
}

double PlannedSegment::velocityAt(double t) const {
    if (t <= 0.0) {
        return entryVelocity;
    }
    if (t >= duration) {
        return exitVelocity;
    }
    if (t < accelTime) {
        return entryVelocity + acceleration * t;
    }
    if (t < accelTime + cruiseTime) {
        return cruiseVelocity;
    }
    return std::max(exitVelocity, cruiseVelocity - acceleration * (t - accelTime - cruiseTime));
}

Point2 PlannedSegment::positionAt(double t) const {
    if (t >= duration) {
        return end; // exact, so consecutive segments join without drift
    }
    return start + direction * distanceAt(t);
}

} // namespace ogcode::planner
