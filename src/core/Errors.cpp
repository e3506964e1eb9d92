#include "ogcode/core/Errors.hpp"

#include <sstream>

namespace ogcode::core {

std::string ParseError::describe() const {
    std::ostringstream os;
    os << "parse error at line " << lineNumber << ": " << reason;
    return os.str();
}

std::string PlanningError::describe() const {
    std::ostringstream os;
    os << "planning error";
    if (segmentIndex != kNoSegment) {
        os << " at segment " << segmentIndex;
    }
    os << ": " << reason;
    return os.str();
}

std::string CalibrationError::describe() const {
    std::ostringstream os;
    os << "calibration error at (" << point.x << ", " << point.y << "): " << reason;
    return os.str();
}

std::string TimingError::describe() const {
    return "timing error: " + reason;
}

std::string EncodingError::describe() const {
    std::ostringstream os;
    os << "encoding error at sample " << sampleIndex << ": " << reason;
    return os.str();
}

std::string SinkError::describe() const {
    std::ostringstream os;
    os << "sink error: " << reason;
    if (code) {
        os << " (" << code.category().name() << ":" << code.value()
           << " " << code.message() << ")";
    }
    return os.str();
}

std::string describe(const JobError& error) {
    return std::visit([](const auto& e) { return e.describe(); }, error);
}

} // namespace ogcode::core
