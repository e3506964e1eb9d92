#pragma once

#include <vector>

#include "ogcode/calibration/CalibrationProfile.hpp"
#include "ogcode/planner/PlannedSegment.hpp"

namespace ogcode::calibration {

/**
 * @brief Stateless evaluator for a loaded CalibrationProfile.
 *
 * The affine stage (rotate, scale, offset) runs first; the lens correction is
 * evaluated at the affine result and added to it. Copies are cheap and share
 * the immutable profile.
 */
class CalibrationTransform {
public:
    CalibrationTransform();
    explicit CalibrationTransform(SharedProfile profile);

    /// Map a machine point (mm) to scanner units, failing outside 0..65535.
    expected<Point2, core::CalibrationError> evaluate(Point2 machine) const;

    /// Same mapping without the range check.
    Point2 map(Point2 machine) const;

    /// Rotation, scale and offset only, before the lens correction.
    Point2 affine(Point2 machine) const;

    /**
     * @brief Check every point of the straight line from @p from to @p to.
     *
     * Along a line the mapped coordinates are piecewise polynomials of degree
     * at most three (one piece per grid cell, a single piece for the
     * polynomial correction), so each piece is checked at its ends and at the
     * interior extrema of both axes. Returns the mapped end point.
     */
    expected<Point2, core::CalibrationError> evaluateLine(Point2 from, Point2 to) const;

    const CalibrationProfile& profile() const { return *sharedProfile; }

private:
    Point2 correction(Point2 scanner) const;

    SharedProfile sharedProfile;
};

/// Scanner-space end points of a calibrated segment.
struct CalibratedSegment {
    Point2 start{};
    Point2 end{};
};

/**
 * @brief Check a planned path against the scanner range before anything is emitted.
 *
 * Every segment is checked along its whole length, so a lens correction that
 * bulges between two in-range end points is still caught. The first point out
 * of range aborts the job with its machine coordinate.
 */
expected<std::vector<CalibratedSegment>, core::CalibrationError>
calibrateSegments(const std::vector<planner::PlannedSegment>& segments,
                  const CalibrationTransform& transform);

} // namespace ogcode::calibration
