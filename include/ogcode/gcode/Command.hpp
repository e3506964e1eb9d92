#pragma once

#include <cstddef>
#include <variant>
#include <vector>

#include "ogcode/core/Geometry.hpp"

namespace ogcode::gcode {

using core::Point2;

enum class Units { Millimetres, Inches };
enum class ArcDirection { Clockwise, CounterClockwise };

/// G0 / G1. Target is absolute machine space in mm, feed in mm/min.
struct Move {
    Point2 target{};
    bool rapid = false;
    double feed = 0.0;
};

/// G2 / G3, normalized to an absolute centre whatever form (I/J or R) the
/// program used. The start point is the end of the preceding motion.
struct Arc {
    Point2 target{};
    Point2 center{};
    ArcDirection direction = ArcDirection::Clockwise;
    double feed = 0.0;
};

/// M3 / M4 / M5 and S words. Power is a percentage of full scale.
struct LaserSet {
    double power = 0.0;
    bool on = false;
};

/// G20 / G21. Coordinates are already converted to mm; informational only.
struct UnitChange {
    Units units = Units::Millimetres;
};

/// G4.
struct Dwell {
    double duration = 0.0; // seconds
};

/// M2 / M30.
struct ProgramEnd {};

using CommandKind = std::variant<Move, Arc, LaserSet, UnitChange, Dwell, ProgramEnd>;

struct Command {
    CommandKind kind;
    std::size_t lineNumber = 0;
};

using CommandList = std::vector<Command>;

/// Helper for exhaustive std::visit over CommandKind.
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace ogcode::gcode
