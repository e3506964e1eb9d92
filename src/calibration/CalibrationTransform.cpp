#include "ogcode/calibration/CalibrationTransform.hpp"

#include "ogcode/log/Log.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace ogcode::calibration {

using core::CalibrationError;

namespace {

Point2 interpolateGrid(const CorrectionGrid& grid, Point2 scanner) {
    const double gx = std::clamp(scanner.x, SCANNER_MIN, SCANNER_MAX) / SCANNER_MAX
                    * static_cast<double>(grid.columns - 1);
    const double gy = std::clamp(scanner.y, SCANNER_MIN, SCANNER_MAX) / SCANNER_MAX
                    * static_cast<double>(grid.rows - 1);
    const std::size_t c0 = std::min(static_cast<std::size_t>(gx), grid.columns - 2);
    const std::size_t r0 = std::min(static_cast<std::size_t>(gy), grid.rows - 2);
    const double fx = gx - static_cast<double>(c0);
    const double fy = gy - static_cast<double>(r0);

    auto node = [&grid](std::size_t c, std::size_t r) { return grid.offsets[r * grid.columns + c]; };
    const Point2 bottom = node(c0, r0) * (1.0 - fx) + node(c0 + 1, r0) * fx;
    const Point2 top = node(c0, r0 + 1) * (1.0 - fx) + node(c0 + 1, r0 + 1) * fx;
    return bottom * (1.0 - fy) + top * fy;
}

Point2 evaluatePolynomial(const CorrectionPolynomial& poly, Point2 scanner) {
    const double u = (scanner.x - SCANNER_CENTER) / SCANNER_CENTER;
    const double v = (scanner.y - SCANNER_CENTER) / SCANNER_CENTER;
    const std::array<double, CorrectionPolynomial::kTerms> terms{
        1.0, u, v, u * u, u * v, v * v, u * u * u, u * u * v, u * v * v, v * v * v};

    Point2 delta{};
    for (std::size_t k = 0; k < terms.size(); ++k) {
        delta.x += poly.x[k] * terms[k];
        delta.y += poly.y[k] * terms[k];
    }
    return delta;
}

// Parameters in (0, 1) where the affine line crosses a grid line of one axis.
void gridCrossings(double a0, double a1, std::size_t nodes, std::vector<double>& out) {
    if (nodes < 2 || a0 == a1) {
        return;
    }
    const double spacing = SCANNER_MAX / static_cast<double>(nodes - 1);
    for (std::size_t k = 0; k < nodes; ++k) {
        const double s = (static_cast<double>(k) * spacing - a0) / (a1 - a0);
        if (s > 0.0 && s < 1.0) {
            out.push_back(s);
        }
    }
}

// Stationary points in (0, 1) of the cubic through f(0), f(1/3), f(2/3), f(1).
void cubicExtrema(const double f[4], std::vector<double>& out) {
    const double d1 = f[1] - f[0];
    const double d2 = f[2] - 2.0 * f[1] + f[0];
    const double d3 = f[3] - 3.0 * f[2] + 3.0 * f[1] - f[0];
    // Newton form in x = 3t; derivative is A x^2 + B x + C.
    const double a = d3 / 2.0;
    const double b = d2 - d3;
    const double c = d1 - d2 / 2.0 + d3 / 3.0;
    auto keep = [&out](double x) {
        if (x > 0.0 && x < 3.0) {
            out.push_back(x / 3.0);
        }
    };
    if (std::abs(a) < 1e-12 * (std::abs(b) + std::abs(c) + 1.0)) {
        if (b != 0.0) {
            keep(-c / b);
        }
        return;
    }
    const double disc = b * b - 4.0 * a * c;
    if (disc < 0.0) {
        return;
    }
    const double root = std::sqrt(disc);
    keep((-b + root) / (2.0 * a));
    keep((-b - root) / (2.0 * a));
}

} // namespace

CalibrationTransform::CalibrationTransform()
: sharedProfile(std::make_shared<const CalibrationProfile>()) {}

CalibrationTransform::CalibrationTransform(SharedProfile profile)
: sharedProfile(profile ? std::move(profile) : std::make_shared<const CalibrationProfile>()) {}

Point2 CalibrationTransform::correction(Point2 scanner) const {
    const auto& lens = sharedProfile->correction;
    if (const auto* grid = std::get_if<CorrectionGrid>(&lens)) {
        return interpolateGrid(*grid, scanner);
    }
    if (const auto* poly = std::get_if<CorrectionPolynomial>(&lens)) {
        return evaluatePolynomial(*poly, scanner);
    }
    return {};
}

Point2 CalibrationTransform::affine(Point2 machine) const {
    const auto& p = *sharedProfile;
    const double c = std::cos(p.rotation);
    const double s = std::sin(p.rotation);
    const Point2 rotated{machine.x * c - machine.y * s, machine.x * s + machine.y * c};
    return Point2{rotated.x * p.x.scale + p.x.offset, rotated.y * p.y.scale + p.y.offset};
}

Point2 CalibrationTransform::map(Point2 machine) const {
    const Point2 base = affine(machine);
    return base + correction(base);
}

expected<Point2, CalibrationError> CalibrationTransform::evaluate(Point2 machine) const {
    const Point2 scanner = map(machine);
    if (!core::isFinite(scanner)) {
        return unexpected(CalibrationError{machine, "mapping is not finite"});
    }
    if (scanner.x < SCANNER_MIN || scanner.x > SCANNER_MAX ||
        scanner.y < SCANNER_MIN || scanner.y > SCANNER_MAX) {
        return unexpected(CalibrationError{machine, "maps outside the scanner's digital range"});
    }
    return scanner;
}

expected<Point2, CalibrationError> CalibrationTransform::evaluateLine(Point2 from, Point2 to) const {
    if (auto start = evaluate(from); !start) {
        return start;
    }
    auto end = evaluate(to);
    if (!end || std::holds_alternative<std::monostate>(sharedProfile->correction)) {
        return end; // affine only: the line maps to a line
    }

    auto pointAt = [&](double s) { return from + (to - from) * s; };

    std::vector<double> breaks{0.0, 1.0};
    if (const auto* grid = std::get_if<CorrectionGrid>(&sharedProfile->correction)) {
        const Point2 a0 = affine(from);
        const Point2 a1 = affine(to);
        gridCrossings(a0.x, a1.x, grid->columns, breaks);
        gridCrossings(a0.y, a1.y, grid->rows, breaks);
    }
    std::sort(breaks.begin(), breaks.end());

    std::vector<double> candidates;
    for (std::size_t k = 0; k + 1 < breaks.size(); ++k) {
        const double s0 = breaks[k];
        const double width = breaks[k + 1] - s0;
        if (width <= 0.0) {
            continue;
        }
        double fx[4];
        double fy[4];
        for (int i = 0; i < 4; ++i) {
            const Point2 mapped = map(pointAt(s0 + width * i / 3.0));
            fx[i] = mapped.x;
            fy[i] = mapped.y;
        }
        candidates.clear();
        candidates.push_back(0.0);
        cubicExtrema(fx, candidates);
        cubicExtrema(fy, candidates);
        for (double t : candidates) {
            if (auto checked = evaluate(pointAt(s0 + width * t)); !checked) {
                return unexpected(checked.error());
            }
        }
    }
    return end;
}

expected<std::vector<CalibratedSegment>, CalibrationError>
calibrateSegments(const std::vector<planner::PlannedSegment>& segments,
                  const CalibrationTransform& transform) {
    if (auto valid = transform.profile().validate(); !valid) {
        logError("[Calibration] ", valid.error().describe(), "\n");
        return unexpected(valid.error());
    }

    std::vector<CalibratedSegment> calibrated;
    calibrated.reserve(segments.size());
    for (const auto& segment : segments) {
        auto start = transform.evaluate(segment.start);
        if (!start) {
            logError("[Calibration] ", start.error().describe(), "\n");
            return unexpected(start.error());
        }
        auto end = transform.evaluateLine(segment.start, segment.end);
        if (!end) {
            logError("[Calibration] ", end.error().describe(), "\n");
            return unexpected(end.error());
        }
        calibrated.push_back(CalibratedSegment{*start, *end});
    }
    return calibrated;
}

} // namespace ogcode::calibration
