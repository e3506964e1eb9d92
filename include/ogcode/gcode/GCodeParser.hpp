// GCodeParser.hpp
// -----------------------------------------------------------------------------
// Line-oriented G-code front end. Modal state (position, units, distance modes, feed,
// laser intent) is carried in an explicit ParserContext value: each call takes
// a snapshot and returns the updated one, so parsing is free of hidden state
// and any prefix of a program can be replayed deterministically.

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "ogcode/core/Errors.hpp"
#include "ogcode/core/Expected.hpp"
#include "ogcode/core/JobConfig.hpp"
#include "ogcode/gcode/Command.hpp"

namespace ogcode::gcode {

enum class DistanceMode { Absolute, Relative };
enum class MotionMode { None, Rapid, Linear, ArcClockwise, ArcCounterClockwise };

struct ParserContext {
    Point2 position{};                        // mm, absolute
    Units units = Units::Millimetres;
    DistanceMode distance = DistanceMode::Absolute;
    DistanceMode arcDistance = DistanceMode::Relative; // G91.1 default for I/J
    MotionMode motion = MotionMode::None;
    double feedRate = 0.0;                    // mm/min, 0 = not yet set
    bool laserOn = false;
    double laserPower = 0.0;                  // percent
    std::size_t lineNumber = 0;               // lines consumed so far
};

struct LineResult {
    ParserContext context;
    CommandList commands;                     // empty for comments/modal-only lines
    std::vector<std::string> warnings;
};

struct ProgramResult {
    CommandList commands;
    std::vector<std::string> warnings;
    ParserContext finalContext;
};

class GCodeParser {
public:
    explicit GCodeParser(config::ParserOptions options = {});

    /**
     * @brief Parse the next line of a program.
     *
     * The returned context has `lineNumber` advanced by one; errors report that
     * line number. Motion-irrelevant unsupported codes become warnings.
     */
    expected<LineResult, core::ParseError>
    parseLine(const ParserContext& context, std::string_view line) const;

    /// Parse a complete program, numbering lines from 1.
    expected<ProgramResult, core::ParseError>
    parseProgram(std::string_view text, const ParserContext& initial = {}) const;

private:
    config::ParserOptions options;
};

} // namespace ogcode::gcode
