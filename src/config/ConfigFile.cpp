#include "ogcode/config/ConfigFile.hpp"

#include "ogcode/log/Log.hpp"

#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <map>
#include <set>
#include <sstream>
#include <vector>

namespace ogcode::config {

namespace {

constexpr double DEGREES_TO_RADIANS = 3.14159265358979323846 / 180.0;
constexpr double MAX_COUNT = 1e9; // queue slots, grid nodes, milliseconds

std::string_view trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}

expected<double, std::string> parseNumber(std::string_view text) {
    const std::string value(trim(text));
    if (value.empty()) {
        return unexpected(std::string("missing value"));
    }
    char* end = nullptr;
    errno = 0;
    const double number = std::strtod(value.c_str(), &end);
    if (end != value.c_str() + value.size() || errno == ERANGE || !std::isfinite(number)) {
        return unexpected("not a number: '" + value + "'");
    }
    return number;
}

expected<std::vector<double>, std::string> parseList(std::string_view text) {
    std::vector<double> values;
    std::size_t start = 0;
    while (start <= text.size()) {
        const auto comma = text.find(',', start);
        const auto item = text.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start);
        auto number = parseNumber(item);
        if (!number) {
            return unexpected(number.error());
        }
        values.push_back(*number);
        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }
    return values;
}

expected<bool, std::string> parseBool(std::string_view text) {
    const auto value = trim(text);
    if (value == "true" || value == "yes" || value == "on" || value == "1") {
        return true;
    }
    if (value == "false" || value == "no" || value == "off" || value == "0") {
        return false;
    }
    return unexpected("not a boolean: '" + std::string(value) + "'");
}

expected<double, std::string> parsePositive(std::string_view text) {
    auto number = parseNumber(text);
    if (number && *number <= 0.0) {
        return unexpected("must be positive: '" + std::string(trim(text)) + "'");
    }
    return number;
}

expected<std::size_t, std::string> parseCount(std::string_view text) {
    auto number = parseNumber(text);
    if (!number) {
        return unexpected(number.error());
    }
    if (*number < 0.0 || std::floor(*number) != *number) {
        return unexpected("not a non-negative integer: '" + std::string(trim(text)) + "'");
    }
    if (*number > MAX_COUNT) {
        return unexpected("count too large: '" + std::string(trim(text)) + "'");
    }
    return static_cast<std::size_t>(*number);
}

template <typename Duration>
expected<std::chrono::nanoseconds, std::string> parseDuration(std::string_view text) {
    auto number = parseNumber(text);
    if (!number) {
        return unexpected(number.error());
    }
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::duration<double, typename Duration::period>(*number));
}

// Grid and polynomial tables arrive as separate keys; they are assembled once
// the whole file has been read.
struct CorrectionKeys {
    std::size_t columns = 0;
    std::size_t rows = 0;
    std::vector<double> gridX;
    std::vector<double> gridY;
    std::vector<double> polyX;
    std::vector<double> polyY;
    std::size_t gridLine = 0;
    std::size_t polyLine = 0;
};

using Setter = std::function<expected<void, std::string>(std::string_view)>;

template <typename T, typename Parse>
Setter assign(T& target, Parse parse) {
    return [&target, parse](std::string_view value) -> expected<void, std::string> {
        auto parsed = parse(value);
        if (!parsed) {
            return unexpected(parsed.error());
        }
        target = static_cast<T>(*parsed);
        return {};
    };
}

std::map<std::string, Setter, std::less<>> buildSetters(LoadedConfig& config, CorrectionKeys& correction,
                                                        std::size_t& currentLine) {
    auto& job = config.job;
    auto& calibration = config.calibration;
    const auto number = [](std::string_view v) { return parseNumber(v); };
    const auto micros = [](std::string_view v) { return parseDuration<std::chrono::microseconds>(v); };

    std::map<std::string, Setter, std::less<>> setters;
    setters["parser.power_scale"] = assign(job.parser.powerScale, parsePositive);

    setters["planner.max_acceleration"] = assign(job.motion.maxAcceleration, number);
    setters["planner.junction_deviation"] = assign(job.motion.junctionDeviation, number);
    setters["planner.arc_tolerance"] = assign(job.motion.arcTolerance, number);
    setters["planner.rapid_velocity"] = assign(job.motion.rapidVelocity, number);
    setters["planner.mirror_slew_rate"] = assign(job.motion.mirrorSlewRate, number);
    setters["planner.focal_length"] = assign(job.motion.focalLength, number);

    setters["laser.mark_delay_us"] = assign(job.laser.markDelay, micros);
    setters["laser.jump_delay_us"] = assign(job.laser.jumpDelay, micros);
    setters["laser.lead_time_us"] = assign(job.laser.leadTime, micros);
    setters["laser.settle_time_constant_us"] = assign(job.laser.settleTimeConstant, micros);
    setters["laser.settle_tolerance"] = assign(job.laser.settleTolerance, number);

    setters["emitter.sample_period_ns"] = assign(job.emitter.samplePeriod,
        [](std::string_view v) { return parseDuration<std::chrono::nanoseconds>(v); });
    setters["emitter.park_x"] = assign(job.emitter.parkPosition.x, number);
    setters["emitter.park_y"] = assign(job.emitter.parkPosition.y, number);
    setters["emitter.park_step_limit"] = assign(job.emitter.parkStepLimit, number);

    setters["stream.queue_capacity"] = assign(job.stream.queueCapacity, parseCount);
    setters["stream.fail_on_underrun"] = assign(job.stream.failOnUnderrun, parseBool);
    setters["stream.realtime_priority"] = assign(job.stream.realtimePriority, parseBool);

    const auto millis = [](std::string_view v) -> expected<std::chrono::milliseconds, std::string> {
        auto count = parseCount(v);
        if (!count) {
            return unexpected(count.error());
        }
        return std::chrono::milliseconds(static_cast<std::int64_t>(*count));
    };
    setters["network.connect_timeout_ms"] = assign(job.network.connectTimeout, millis);
    setters["network.write_timeout_ms"] = assign(job.network.writeTimeout, millis);
    setters["network.batch_frames"] = assign(job.network.batchFrames, parseCount);

    setters["calibration.scale_x"] = assign(calibration.x.scale, number);
    setters["calibration.scale_y"] = assign(calibration.y.scale, number);
    setters["calibration.offset_x"] = assign(calibration.x.offset, number);
    setters["calibration.offset_y"] = assign(calibration.y.offset, number);
    setters["calibration.rotation_deg"] = [&calibration](std::string_view v) -> expected<void, std::string> {
        auto degrees = parseNumber(v);
        if (!degrees) {
            return unexpected(degrees.error());
        }
        calibration.rotation = *degrees * DEGREES_TO_RADIANS;
        return {};
    };

    auto table = [&currentLine](std::vector<double>& target, std::size_t& line) -> Setter {
        return [&target, &line, &currentLine](std::string_view v) -> expected<void, std::string> {
            auto values = parseList(v);
            if (!values) {
                return unexpected(values.error());
            }
            target = std::move(*values);
            line = currentLine;
            return {};
        };
    };
    setters["calibration.grid_columns"] = assign(correction.columns, parseCount);
    setters["calibration.grid_rows"] = assign(correction.rows, parseCount);
    setters["calibration.grid_x"] = table(correction.gridX, correction.gridLine);
    setters["calibration.grid_y"] = table(correction.gridY, correction.gridLine);
    setters["calibration.polynomial_x"] = table(correction.polyX, correction.polyLine);
    setters["calibration.polynomial_y"] = table(correction.polyY, correction.polyLine);
    return setters;
}

expected<void, ConfigError> applyCorrection(const CorrectionKeys& keys, calibration::CalibrationProfile& profile) {
    const bool hasGrid = !keys.gridX.empty() || !keys.gridY.empty();
    const bool hasPoly = !keys.polyX.empty() || !keys.polyY.empty();
    if (hasGrid && hasPoly) {
        return unexpected(ConfigError{keys.polyLine, "choose either a correction grid or a polynomial"});
    }

    if (hasGrid) {
        const std::size_t nodes = keys.columns * keys.rows;
        if (keys.gridX.size() != nodes || keys.gridY.size() != nodes) {
            std::ostringstream os;
            os << "correction grid needs " << nodes << " values per axis (grid_columns x grid_rows)";
            return unexpected(ConfigError{keys.gridLine, os.str()});
        }
        calibration::CorrectionGrid grid;
        grid.columns = keys.columns;
        grid.rows = keys.rows;
        grid.offsets.reserve(nodes);
        for (std::size_t i = 0; i < nodes; ++i) {
            grid.offsets.push_back(core::Point2{keys.gridX[i], keys.gridY[i]});
        }
        profile.correction = std::move(grid);
    } else if (hasPoly) {
        constexpr std::size_t terms = calibration::CorrectionPolynomial::kTerms;
        if (keys.polyX.size() != terms || keys.polyY.size() != terms) {
            return unexpected(ConfigError{keys.polyLine, "polynomial correction needs 10 coefficients per axis"});
        }
        calibration::CorrectionPolynomial poly;
        for (std::size_t k = 0; k < terms; ++k) {
            poly.x[k] = keys.polyX[k];
            poly.y[k] = keys.polyY[k];
        }
        profile.correction = poly;
    }
    return {};
}

} // namespace

std::string ConfigError::describe() const {
    std::ostringstream os;
    if (lineNumber > 0) {
        os << "config line " << lineNumber << ": ";
    } else {
        os << "config: ";
    }
    os << reason;
    return os.str();
}

expected<LoadedConfig, ConfigError> parseConfigText(std::string_view text) {
    LoadedConfig config;
    CorrectionKeys correction;
    std::size_t lineNumber = 0;
    const auto setters = buildSetters(config, correction, lineNumber);

    std::string section;
    std::set<std::string> seen;
    std::size_t start = 0;
    while (start <= text.size()) {
        const auto newline = text.find('\n', start);
        std::string_view line = text.substr(start, newline == std::string_view::npos
                                                       ? std::string_view::npos
                                                       : newline - start);
        start = newline == std::string_view::npos ? text.size() + 1 : newline + 1;
        ++lineNumber;

        if (const auto hash = line.find('#'); hash != std::string_view::npos) {
            line = line.substr(0, hash);
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }

        if (line.front() == '[') {
            if (line.back() != ']' || line.size() < 3) {
                return unexpected(ConfigError{lineNumber, "malformed section header"});
            }
            section = std::string(trim(line.substr(1, line.size() - 2)));
            continue;
        }

        const auto equals = line.find('=');
        if (equals == std::string_view::npos) {
            return unexpected(ConfigError{lineNumber, "expected 'key = value'"});
        }
        std::string key(trim(line.substr(0, equals)));
        if (!section.empty() && key.find('.') == std::string::npos) {
            key = section + "." + key;
        }

        const auto setter = setters.find(key);
        if (setter == setters.end()) {
            return unexpected(ConfigError{lineNumber, "unknown key '" + key + "'"});
        }
        if (!seen.insert(key).second) {
            return unexpected(ConfigError{lineNumber, "key '" + key + "' set twice"});
        }
        if (auto applied = setter->second(line.substr(equals + 1)); !applied) {
            return unexpected(ConfigError{lineNumber, key + ": " + applied.error()});
        }
    }

    if (auto applied = applyCorrection(correction, config.calibration); !applied) {
        return unexpected(applied.error());
    }
    if (auto valid = config.calibration.validate(); !valid) {
        return unexpected(ConfigError{0, valid.error().describe()});
    }
    return config;
}

expected<LoadedConfig, ConfigError> loadConfigFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return unexpected(ConfigError{0, "cannot open '" + path + "'"});
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    auto loaded = parseConfigText(contents.str());
    if (!loaded) {
        logError("[ConfigFile] ", path, ": ", loaded.error().describe(), "\n");
        return loaded;
    }
    logInfo("[ConfigFile] loaded ", path, "\n");
    return loaded;
}

} // namespace ogcode::config
