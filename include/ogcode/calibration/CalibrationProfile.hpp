#pragma once

#include <array>
#include <cstddef>
#include <memory>
#include <variant>
#include <vector>

#include "ogcode/core/Errors.hpp"
#include "ogcode/core/Expected.hpp"
#include "ogcode/core/Geometry.hpp"

namespace ogcode::calibration {

using core::Point2;

/// Addressable XY2-100 range in scanner digital units.
constexpr double SCANNER_MIN = 0.0;
constexpr double SCANNER_MAX = 65535.0;
constexpr double SCANNER_CENTER = 32768.0;

struct AxisCalibration {
    double scale = 655.36;          // digital units per mm (100 mm field)
    double offset = SCANNER_CENTER; // digital units
};

/**
 * @brief Lens correction table sampled on a regular grid over the scanner field.
 *
 * Node (c, r) sits at scanner position
 * `(c * 65535 / (columns - 1), r * 65535 / (rows - 1))` and stores the
 * correction (in digital units) added at that position. Rows are stored one
 * after the other, `columns` entries each.
 */
struct CorrectionGrid {
    std::size_t columns = 0;
    std::size_t rows = 0;
    std::vector<Point2> offsets;
};

/**
 * @brief Polynomial lens correction in normalized field coordinates.
 *
 * With u = (x - centre) / centre and v = (y - centre) / centre, the correction
 * is `sum c[k] * u^i * v^j` over the terms 1, u, v, u^2, uv, v^2, u^3, u^2v,
 * uv^2, v^3 (graded order), one coefficient array per axis, in digital units.
 */
struct CorrectionPolynomial {
    static constexpr std::size_t kTerms = 10;
    std::array<double, kTerms> x{};
    std::array<double, kTerms> y{};
};

using LensCorrection = std::variant<std::monostate, CorrectionGrid, CorrectionPolynomial>;

/**
 * @brief Machine-to-scanner mapping for one scan head and lens.
 *
 * Loaded once per job and never mutated during a run; share it between jobs
 * and threads through `std::shared_ptr<const CalibrationProfile>`.
 */
struct CalibrationProfile {
    AxisCalibration x{};
    AxisCalibration y{};
    double rotation = 0.0; // radians, applied before scaling
    LensCorrection correction{};

    /// Check scales, grid dimensions and table sizes.
    expected<void, core::CalibrationError> validate() const;
};

using SharedProfile = std::shared_ptr<const CalibrationProfile>;

} // namespace ogcode::calibration
