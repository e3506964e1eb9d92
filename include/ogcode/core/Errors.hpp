// Errors.hpp
// -----------------------------------------------------------------------------
// Error payloads returned through ogcode::expected by each compiler stage.
// Every payload carries enough context (line, segment, coordinate) for the
// caller to report the failure to an operator.

#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <system_error>
#include <variant>

#include "ogcode/core/Geometry.hpp"

namespace ogcode::core {

/// Malformed or unsupported G-code line.
struct ParseError {
    std::size_t lineNumber = 0;
    std::string reason;

    std::string describe() const;
};

/// Infeasible kinematics, degenerate input, or an invalid motion configuration.
struct PlanningError {
    static constexpr std::size_t kNoSegment = std::numeric_limits<std::size_t>::max();

    std::size_t segmentIndex = kNoSegment; // kNoSegment for configuration errors
    std::string reason;

    std::string describe() const;
};

/// A point that maps outside the scanner's addressable range, or a bad profile.
struct CalibrationError {
    Point2 point{};
    std::string reason;

    std::string describe() const;
};

/// Laser events that cannot be placed against the motion timeline.
struct TimingError {
    std::string reason;

    std::string describe() const;
};

/// A resampled value that does not fit the XY2-100 data field.
struct EncodingError {
    std::string reason;
    std::uint64_t sampleIndex = 0;

    std::string describe() const;
};

/// Transport-level failure reported by a frame sink.
struct SinkError {
    std::string reason;
    std::error_code code{};

    std::string describe() const;
};

/// Raised when a job is cancelled by the operator.
struct CancelledError {
    std::string describe() const { return "job cancelled"; }
};

using JobError = std::variant<ParseError,
                              PlanningError,
                              CalibrationError,
                              TimingError,
                              EncodingError,
                              SinkError,
                              CancelledError>;

std::string describe(const JobError& error);

} // namespace ogcode::core
