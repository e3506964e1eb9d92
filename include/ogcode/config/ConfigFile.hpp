// ConfigFile.hpp
// -----------------------------------------------------------------------------
// Plain-text job configuration:
//
//   # comment
//   planner.max_acceleration = 2e6
//   [laser]
//   mark_delay_us = 120
//
// Keys are `section.name`; a `[section]` line prefixes the keys that follow.
// Unknown keys, repeated keys and malformed values are errors that name the
// line. Anything not set keeps the JobConfig.hpp default.

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "ogcode/calibration/CalibrationProfile.hpp"
#include "ogcode/core/Expected.hpp"
#include "ogcode/core/JobConfig.hpp"

namespace ogcode::config {

struct ConfigError {
    std::size_t lineNumber = 0; // 0 when the error is not tied to a line
    std::string reason;

    std::string describe() const;
};

struct LoadedConfig {
    JobConfig job{};
    calibration::CalibrationProfile calibration{};
};

expected<LoadedConfig, ConfigError> parseConfigText(std::string_view text);
expected<LoadedConfig, ConfigError> loadConfigFile(const std::string& path);

} // namespace ogcode::config
