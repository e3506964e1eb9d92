#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

#include "ogcode/core/Geometry.hpp"

namespace ogcode::config {

/**
 * @brief Defaults that define parsing, planning, laser timing and streaming.
 *
 * Keeping the values here prevents magic numbers from drifting across
 * translation units. Mark/jump/lead delays are scan-head specific; the values
 * below suit a 10 mm aperture head and should be replaced from the datasheet
 * of the head in use.
 */

// Parsing ---------------------------------------------------------------------
constexpr double OGCODE_POWER_SCALE = 1000.0;          // S word that equals 100 %
constexpr double OGCODE_INCH_TO_MM = 25.4;

// Motion ----------------------------------------------------------------------
constexpr double OGCODE_MAX_ACCELERATION = 1.0e6;      // mm/s^2
constexpr double OGCODE_JUNCTION_DEVIATION = 0.01;     // mm
constexpr double OGCODE_ARC_TOLERANCE = 0.001;         // mm (1 um chordal error)
constexpr double OGCODE_RAPID_VELOCITY = 5000.0;       // mm/s
constexpr double OGCODE_MIRROR_SLEW_RATE = 20.0;       // rad/s, mechanical
constexpr double OGCODE_FOCAL_LENGTH = 160.0;          // mm, f-theta lens

// Laser timing ----------------------------------------------------------------
constexpr std::chrono::microseconds OGCODE_MARK_DELAY{100};
constexpr std::chrono::microseconds OGCODE_JUMP_DELAY{200};
constexpr std::chrono::microseconds OGCODE_LEAD_TIME{50};
constexpr std::chrono::microseconds OGCODE_SETTLE_TIME_CONSTANT{100};
constexpr double OGCODE_SETTLE_TOLERANCE = 0.005;      // mm

// Emission --------------------------------------------------------------------
constexpr std::chrono::nanoseconds OGCODE_SAMPLE_PERIOD{10000}; // 100 kHz XY2-100 frame rate
constexpr double OGCODE_PARK_X = 32768.0;              // scanner units
constexpr double OGCODE_PARK_Y = 32768.0;
constexpr double OGCODE_PARK_STEP_LIMIT = 1024.0;      // scanner units per sample

// Streaming -------------------------------------------------------------------
constexpr std::size_t OGCODE_QUEUE_CAPACITY = 4096;    // frames (~41 ms at 100 kHz)

// Network bridge ----------------------------------------------------------------
constexpr std::chrono::milliseconds OGCODE_CONNECT_TIMEOUT{500};
constexpr std::chrono::milliseconds OGCODE_WRITE_TIMEOUT{500}; // a stalled bridge must not hold the job for long
constexpr std::size_t OGCODE_TCP_BATCH_FRAMES = 256;   // 2.56 ms of frames per write

inline double toSeconds(std::chrono::nanoseconds value) {
    return std::chrono::duration<double>(value).count();
}

struct ParserOptions {
    double powerScale = OGCODE_POWER_SCALE;
};

struct MotionLimits {
    double maxAcceleration = OGCODE_MAX_ACCELERATION;
    double junctionDeviation = OGCODE_JUNCTION_DEVIATION; // 0 = exact stop at every corner
    double arcTolerance = OGCODE_ARC_TOLERANCE;
    double rapidVelocity = OGCODE_RAPID_VELOCITY;
    double mirrorSlewRate = OGCODE_MIRROR_SLEW_RATE;
    double focalLength = OGCODE_FOCAL_LENGTH;

    /// Linear speed limit of a single axis: optical deflection is twice the
    /// mechanical angle and an f-theta lens maps angle linearly to position.
    double axisVelocityLimit() const { return 2.0 * focalLength * mirrorSlewRate; }
};

struct LaserTiming {
    std::chrono::nanoseconds markDelay = OGCODE_MARK_DELAY;
    std::chrono::nanoseconds jumpDelay = OGCODE_JUMP_DELAY;
    std::chrono::nanoseconds leadTime = OGCODE_LEAD_TIME;
    std::chrono::nanoseconds settleTimeConstant = OGCODE_SETTLE_TIME_CONSTANT;
    double settleTolerance = OGCODE_SETTLE_TOLERANCE;
};

struct EmitterSettings {
    std::chrono::nanoseconds samplePeriod = OGCODE_SAMPLE_PERIOD;
    core::Point2 parkPosition{OGCODE_PARK_X, OGCODE_PARK_Y};
    double parkStepLimit = OGCODE_PARK_STEP_LIMIT;
};

struct StreamSettings {
    std::size_t queueCapacity = OGCODE_QUEUE_CAPACITY;
    bool failOnUnderrun = false;
    bool realtimePriority = true;
};

struct NetworkSettings {
    std::chrono::milliseconds connectTimeout = OGCODE_CONNECT_TIMEOUT;
    std::chrono::milliseconds writeTimeout = OGCODE_WRITE_TIMEOUT;
    std::size_t batchFrames = OGCODE_TCP_BATCH_FRAMES;
};

struct JobConfig {
    ParserOptions parser{};
    MotionLimits motion{};
    LaserTiming laser{};
    EmitterSettings emitter{};
    StreamSettings stream{};
    NetworkSettings network{};
};

} // namespace ogcode::config
