#include "ogcode/calibration/CalibrationProfile.hpp"

#include <cmath>
#include <sstream>

namespace ogcode::calibration {

using core::CalibrationError;

expected<void, CalibrationError> CalibrationProfile::validate() const {
    auto validScale = [](double value) { return std::isfinite(value) && value > 0.0; };
    if (!validScale(x.scale) || !validScale(y.scale)) {
        return unexpected(CalibrationError{{}, "axis scale must be positive"});
    }
    if (!std::isfinite(x.offset) || !std::isfinite(y.offset) || !std::isfinite(rotation)) {
        return unexpected(CalibrationError{{}, "offset and rotation must be finite"});
    }

    if (const auto* grid = std::get_if<CorrectionGrid>(&correction)) {
        if (grid->columns < 2 || grid->rows < 2) {
            return unexpected(CalibrationError{{}, "correction grid needs at least 2x2 nodes"});
        }
        if (grid->offsets.size() != grid->columns * grid->rows) {
            std::ostringstream os;
            os << "correction grid has " << grid->offsets.size() << " entries, expected "
               << grid->columns * grid->rows;
            return unexpected(CalibrationError{{}, os.str()});
        }
        for (const auto& node : grid->offsets) {
            if (!core::isFinite(node)) {
                return unexpected(CalibrationError{node, "correction grid entry is not finite"});
            }
        }
    } else if (const auto* poly = std::get_if<CorrectionPolynomial>(&correction)) {
        for (std::size_t k = 0; k < CorrectionPolynomial::kTerms; ++k) {
            if (!std::isfinite(poly->x[k]) || !std::isfinite(poly->y[k])) {
                return unexpected(CalibrationError{{}, "polynomial coefficient is not finite"});
            }
        }
    }
    return {};
}

} // namespace ogcode::calibration
