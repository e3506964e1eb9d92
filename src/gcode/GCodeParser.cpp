#include "ogcode/gcode/GCodeParser.hpp"

#include "ogcode/log/Log.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <optional>
#include <sstream>

namespace ogcode::gcode {

using core::ParseError;

namespace {

constexpr double POINT_TOLERANCE = 1e-9;       // mm
constexpr double ARC_RADIUS_TOLERANCE = 0.002; // mm, absolute floor
constexpr double ARC_RADIUS_RELATIVE = 0.001;  // 0.1 % of radius

struct Word {
    char letter = 0;
    double value = 0.0;
};

constexpr double MAX_CODE = 999.9;

bool isCodeNumber(double value) {
    return value >= 0.0 && value < MAX_CODE + 0.05;
}

// G and M numbers are compared in tenths so G38.2 and G91.1 stay distinct.
int codeTenths(double value) {
    return static_cast<int>(std::lround(value * 10.0));
}

std::string formatCode(char letter, double value) {
    std::ostringstream os;
    os << letter << value;
    return os.str();
}

expected<std::string, std::string> stripComments(std::string_view line) {
    std::string out;
    out.reserve(line.size());
    bool inComment = false;
    for (char c : line) {
        if (inComment) {
            if (c == ')') {
                inComment = false;
            }
            continue;
        }
        if (c == '(') {
            inComment = true;
            continue;
        }
        if (c == ')') {
            return unexpected(std::string("unbalanced ')'"));
        }
        if (c == ';') {
            break;
        }
        out.push_back(c);
    }
    if (inComment) {
        return unexpected(std::string("unterminated comment"));
    }
    return out;
}

expected<std::vector<Word>, std::string> tokenize(const std::string& text) {
    std::vector<Word> words;
    const std::size_t n = text.size();
    std::size_t i = 0;
    auto skipSpace = [&] {
        while (i < n && std::isspace(static_cast<unsigned char>(text[i]))) {
            ++i;
        }
    };

    while (true) {
        skipSpace();
        if (i >= n || text[i] == '*') { // '*' starts a checksum
            break;
        }
        const auto c = static_cast<unsigned char>(text[i]);
        if (!std::isalpha(c)) {
            return unexpected("unexpected character '" + std::string(1, text[i]) + "'");
        }
        const char letter = static_cast<char>(std::toupper(c));
        ++i;
        skipSpace();

        const std::size_t start = i;
        if (i < n && (text[i] == '+' || text[i] == '-')) {
            ++i;
        }
        bool digits = false;
        while (i < n && (std::isdigit(static_cast<unsigned char>(text[i])) || text[i] == '.')) {
            digits = digits || text[i] != '.';
            ++i;
        }
        if (!digits) {
            return unexpected("missing value for word '" + std::string(1, letter) + "'");
        }

        const std::string number = text.substr(start, i - start);
        char* end = nullptr;
        const double value = std::strtod(number.c_str(), &end);
        if (end != number.c_str() + number.size() || !std::isfinite(value)) {
            return unexpected("malformed number '" + number + "'");
        }
        words.push_back(Word{letter, value});
    }
    return words;
}

expected<Arc, std::string> normalizeArc(Point2 start, Point2 target, ArcDirection direction,
                                        std::optional<double> i, std::optional<double> j,
                                        std::optional<double> r, double unitScale,
                                        DistanceMode arcDistance, double feed) {
    Arc arc;
    arc.target = target;
    arc.direction = direction;
    arc.feed = feed;

    if (r && (i || j)) {
        return unexpected(std::string("arc may not combine R with I/J"));
    }

    if (r) {
        const double radius = *r * unitScale;
        const Point2 chord = target - start;
        const double d = core::length(chord);
        if (d < POINT_TOLERANCE) {
            return unexpected(std::string("R-form arc needs distinct start and end points"));
        }
        const double halfChord = d / 2.0;
        if (std::abs(radius) < halfChord &&
            halfChord - std::abs(radius) > std::max(ARC_RADIUS_TOLERANCE, ARC_RADIUS_RELATIVE * halfChord)) {
            return unexpected(std::string("radius is smaller than half the chord"));
        }
        const double h2 = radius * radius - halfChord * halfChord;
        const double h = h2 > 0.0 ? std::sqrt(h2) : 0.0;

        // Clockwise minor arcs keep the centre to the right of the chord;
        // negative R selects the major arc on the other side.
        const Point2 right{chord.y / d, -chord.x / d};
        double side = direction == ArcDirection::Clockwise ? 1.0 : -1.0;
        if (radius < 0.0) {
            side = -side;
        }
        arc.center = start + chord * 0.5 + right * (h * side);
        return arc;
    }

    if (!i && !j) {
        return unexpected(std::string("arc requires I/J or R words"));
    }

    if (arcDistance == DistanceMode::Relative) {
        arc.center = start + Point2{i.value_or(0.0) * unitScale, j.value_or(0.0) * unitScale};
    } else {
        arc.center = Point2{i ? *i * unitScale : start.x, j ? *j * unitScale : start.y};
    }

    const double startRadius = core::distance(start, arc.center);
    const double endRadius = core::distance(target, arc.center);
    if (startRadius < POINT_TOLERANCE) {
        return unexpected(std::string("arc radius is zero"));
    }
    const double tolerance = std::max(ARC_RADIUS_TOLERANCE, ARC_RADIUS_RELATIVE * startRadius);
    if (std::abs(startRadius - endRadius) > tolerance) {
        std::ostringstream os;
        os << "end point is not on the arc (radius " << startRadius << " vs " << endRadius << ")";
        return unexpected(os.str());
    }
    return arc;
}

} // namespace

GCodeParser::GCodeParser(config::ParserOptions parserOptions)
: options(parserOptions) {}

expected<LineResult, ParseError>
GCodeParser::parseLine(const ParserContext& context, std::string_view line) const {
    LineResult result;
    result.context = context;
    ParserContext& ctx = result.context;
    ctx.lineNumber = context.lineNumber + 1;
    const std::size_t lineNumber = ctx.lineNumber;

    auto fail = [lineNumber](std::string reason) {
        return unexpected(ParseError{lineNumber, std::move(reason)});
    };
    auto warn = [&result, lineNumber](const std::string& message) {
        logWarning("[GCodeParser] line ", lineNumber, ": ", message, "\n");
        result.warnings.push_back("line " + std::to_string(lineNumber) + ": " + message);
    };

    auto stripped = stripComments(line);
    if (!stripped) {
        return fail(stripped.error());
    }
    const std::string& text = *stripped;
    const auto first = text.find_first_not_of(" \t\r");
    if (first == std::string::npos || text[first] == '%') {
        return result;
    }
    if (text[first] == '/') {
        warn("block-delete line skipped");
        return result;
    }

    auto words = tokenize(text);
    if (!words) {
        return fail(words.error());
    }

    std::optional<MotionMode> motionWord;
    std::optional<Units> unitsWord;
    bool dwellRequested = false;
    bool pathControl = false;
    bool laserWord = false;
    bool laserWordOn = false;
    bool programEnd = false;
    std::optional<double> x, y, i, j, r, p, f, s;
    std::optional<std::string> unknownCode;
    std::array<bool, 26> seen{};

    for (const auto& word : *words) {
        if ((word.letter == 'G' || word.letter == 'M') && !isCodeNumber(word.value)) {
            std::ostringstream os;
            os << "code " << formatCode(word.letter, word.value) << " outside 0.." << MAX_CODE;
            return fail(os.str());
        }
        if (word.letter == 'G') {
            const int code = codeTenths(word.value);
            switch (code) {
                case 0: case 10: case 20: case 30: {
                    if (motionWord) {
                        return fail("conflicting motion codes on one line");
                    }
                    static constexpr MotionMode modes[] = {MotionMode::Rapid, MotionMode::Linear,
                                                           MotionMode::ArcClockwise,
                                                           MotionMode::ArcCounterClockwise};
                    motionWord = modes[code / 10];
                    break;
                }
                case 40:  dwellRequested = true; break;
                case 170: break; // XY is the only plane a scan head has
                case 180: case 190:
                    return fail(formatCode('G', word.value) + ": only the XY plane (G17) is supported");
                case 200: unitsWord = Units::Inches; break;
                case 210: unitsWord = Units::Millimetres; break;
                case 900: ctx.distance = DistanceMode::Absolute; break;
                case 910: ctx.distance = DistanceMode::Relative; break;
                case 901: ctx.arcDistance = DistanceMode::Absolute; break;
                case 911: ctx.arcDistance = DistanceMode::Relative; break;
                case 800: ctx.motion = MotionMode::None; break;
                case 610: case 611: case 640:
                    pathControl = true;
                    warn("path control mode " + formatCode('G', word.value) + " ignored");
                    break;
                case 400: case 490:
                case 540: case 550: case 560: case 570: case 580: case 590:
                case 591: case 592: case 593:
                    warn("unsupported code " + formatCode('G', word.value) + " ignored");
                    break;
                case 50: case 51: case 280: case 300: case 330:
                case 382: case 383: case 384: case 385:
                case 730: case 760: case 810: case 820: case 830: case 840: case 850:
                case 860: case 870: case 880: case 890:
                case 920: case 921: case 922: case 923:
                    return fail("unsupported motion code " + formatCode('G', word.value));
                default:
                    if (!unknownCode) {
                        unknownCode = formatCode('G', word.value);
                    }
                    break;
            }
            continue;
        }

        if (word.letter == 'M') {
            switch (codeTenths(word.value)) {
                case 30: case 40: laserWord = true; laserWordOn = true; break;
                case 50:          laserWord = true; laserWordOn = false; break;
                case 20: case 300: programEnd = true; break;
                default:
                    warn("unsupported code " + formatCode('M', word.value) + " ignored");
                    break;
            }
            continue;
        }

        const std::size_t slot = static_cast<std::size_t>(word.letter - 'A');
        if (seen[slot] && word.letter != 'N') {
            return fail("word '" + std::string(1, word.letter) + "' repeated");
        }
        seen[slot] = true;

        switch (word.letter) {
            case 'X': x = word.value; break;
            case 'Y': y = word.value; break;
            case 'I': i = word.value; break;
            case 'J': j = word.value; break;
            case 'R': r = word.value; break;
            case 'P': p = word.value; break;
            case 'F': f = word.value; break;
            case 'S': s = word.value; break;
            case 'N': break;
            case 'Z': warn("Z axis ignored"); break;
            case 'A': case 'B': case 'C': case 'U': case 'V': case 'W':
                warn("axis word " + std::string(1, word.letter) + " ignored");
                break;
            case 'T': warn("tool selection ignored"); break;
            default:
                warn("unsupported word " + formatCode(word.letter, word.value) + " ignored");
                break;
        }
    }

    if (unknownCode) {
        // Coordinates after an unknown G code would run in the previous motion mode.
        if (x || y || i || j || r) {
            return fail("unsupported code " + *unknownCode + " with coordinate words");
        }
        warn("unsupported code " + *unknownCode + " ignored");
    }

    if (unitsWord) {
        ctx.units = *unitsWord;
        result.commands.push_back(Command{UnitChange{*unitsWord}, lineNumber});
    }
    const double unitScale = ctx.units == Units::Inches ? config::OGCODE_INCH_TO_MM : 1.0;

    if (f) {
        if (*f <= 0.0) {
            return fail("feed rate must be positive");
        }
        ctx.feedRate = *f * unitScale;
    }

    if (s) {
        if (!(options.powerScale > 0.0)) {
            return fail("power scale must be positive");
        }
        if (*s < 0.0 || *s > options.powerScale) {
            std::ostringstream os;
            os << "power S" << *s << " outside 0.." << options.powerScale;
            return fail(os.str());
        }
        ctx.laserPower = *s / options.powerScale * 100.0;
    }
    if (laserWord) {
        ctx.laserOn = laserWordOn;
    }
    if (s || laserWord) {
        result.commands.push_back(Command{LaserSet{ctx.laserPower, ctx.laserOn}, lineNumber});
    }

    if (dwellRequested) {
        if (!p) {
            return fail("G4 requires a P word");
        }
        if (*p < 0.0) {
            return fail("dwell time must not be negative");
        }
        result.commands.push_back(Command{Dwell{*p}, lineNumber});
    } else if (p && !pathControl) {
        warn("P word ignored");
    }

    if (motionWord) {
        ctx.motion = *motionWord;
    }

    const bool hasAxis = x || y;
    const bool hasArcWords = i || j || r;
    if (hasAxis || hasArcWords) {
        if (ctx.motion == MotionMode::None) {
            return fail("axis words without an active motion mode");
        }
        const bool arcMode = ctx.motion == MotionMode::ArcClockwise ||
                             ctx.motion == MotionMode::ArcCounterClockwise;
        if (hasArcWords && !arcMode) {
            return fail("I/J/R words require G2 or G3");
        }

        const Point2 start = ctx.position;
        auto resolve = [&](std::optional<double> value, double current) {
            if (!value) {
                return current;
            }
            return ctx.distance == DistanceMode::Absolute ? *value * unitScale
                                                          : current + *value * unitScale;
        };
        const Point2 target{resolve(x, start.x), resolve(y, start.y)};

        if (ctx.motion == MotionMode::Rapid) {
            result.commands.push_back(Command{Move{target, true, 0.0}, lineNumber});
        } else {
            if (ctx.feedRate <= 0.0) {
                return fail("no feed rate set for feed motion");
            }
            if (ctx.motion == MotionMode::Linear) {
                result.commands.push_back(Command{Move{target, false, ctx.feedRate}, lineNumber});
            } else {
                const auto direction = ctx.motion == MotionMode::ArcClockwise
                    ? ArcDirection::Clockwise : ArcDirection::CounterClockwise;
                auto arc = normalizeArc(start, target, direction, i, j, r, unitScale,
                                        ctx.arcDistance, ctx.feedRate);
                if (!arc) {
                    return fail(arc.error());
                }
                result.commands.push_back(Command{*arc, lineNumber});
            }
        }
        ctx.position = target;
    }

    if (programEnd) {
        ctx.laserOn = false;
        ctx.motion = MotionMode::None;
        result.commands.push_back(Command{ProgramEnd{}, lineNumber});
    }

    return result;
}

expected<ProgramResult, ParseError>
GCodeParser::parseProgram(std::string_view text, const ParserContext& initial) const {
    ProgramResult program;
    ParserContext context = initial;

    std::size_t pos = 0;
    while (true) {
        const auto eol = text.find('\n', pos);
        auto line = text.substr(pos, eol == std::string_view::npos ? std::string_view::npos : eol - pos);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        auto parsed = parseLine(context, line);
        if (!parsed) {
            logError("[GCodeParser] ", parsed.error().describe(), "\n");
            return unexpected(parsed.error());
        }
        context = parsed->context;
        for (auto& command : parsed->commands) {
            program.commands.push_back(std::move(command));
        }
        for (auto& warning : parsed->warnings) {
            program.warnings.push_back(std::move(warning));
        }

        if (eol == std::string_view::npos) {
            break;
        }
        pos = eol + 1;
    }

    program.finalContext = context;
    logInfo("[GCodeParser] parsed ", context.lineNumber - initial.lineNumber, " lines into ",
            program.commands.size(), " commands (", program.warnings.size(), " warnings)\n");
    return program;
}

} // namespace ogcode::gcode
