#include "ogcode/config/ConfigFile.hpp"
#include "ogcode/log/Log.hpp"

#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <variant>

using namespace ogcode;
using namespace ogcode::config;

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { ogcode::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { ogcode::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", +_va, " != ", +_vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_NEAR(a,b,tol,msg) \
    do { double _va=(a); double _vb=(b); if (!(std::abs(_va-_vb) <= (tol))) { ogcode::logError("ASSERT NEAR FAILED: ", (msg), \
        "  (", _va, " vs ", _vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

static std::size_t errorLine(std::string_view text) {
    auto loaded = parseConfigText(text);
    return loaded ? 0 : loaded.error().lineNumber;
}

static void testDefaults() {
    auto loaded = parseConfigText("");
    ASSERT_TRUE(loaded.has_value(), "empty config is valid");
    if (!loaded) return;
    ASSERT_EQ(loaded->job.motion.maxAcceleration, OGCODE_MAX_ACCELERATION, "default acceleration");
    ASSERT_EQ(loaded->job.emitter.samplePeriod.count(), OGCODE_SAMPLE_PERIOD.count(), "default period");
    ASSERT_EQ(loaded->job.network.writeTimeout.count(), OGCODE_WRITE_TIMEOUT.count(), "default write timeout");
    ASSERT_EQ(loaded->job.network.batchFrames, OGCODE_TCP_BATCH_FRAMES, "default batch");
    ASSERT_TRUE(std::holds_alternative<std::monostate>(loaded->calibration.correction), "no lens correction");
}

static void testSectionsAndKeys() {
    const char* text =
        "# scan head A\n"
        "parser.power_scale = 255\n"
        "[planner]\n"
        "max_acceleration = 2e6\n"
        "junction_deviation = 0.02   # tighter corners\n"
        "\n"
        "[laser]\n"
        "mark_delay_us = 120.5\n"
        "lead_time_us = 0\n"
        "settle_tolerance = 0.004\n"
        "[emitter]\n"
        "sample_period_ns = 20000\n"
        "park_x = 1000\n"
        "stream.queue_capacity = 128\n"
        "[stream]\n"
        "fail_on_underrun = yes\n"
        "realtime_priority = off\n"
        "[network]\n"
        "connect_timeout_ms = 2000\n"
        "write_timeout_ms = 750\n"
        "batch_frames = 64\n"
        "[calibration]\n"
        "rotation_deg = 90\n"
        "scale_x = 600\n"
        "offset_y = 30000\n";

    auto loaded = parseConfigText(text);
    ASSERT_TRUE(loaded.has_value(), "config parses");
    if (!loaded) return;
    const auto& job = loaded->job;
    ASSERT_EQ(job.parser.powerScale, 255.0, "top-level dotted key");
    ASSERT_EQ(job.motion.maxAcceleration, 2e6, "planner section");
    ASSERT_EQ(job.motion.junctionDeviation, 0.02, "trailing comment stripped");
    ASSERT_EQ(job.laser.markDelay.count(), std::chrono::nanoseconds::rep{120500}, "microseconds to nanoseconds");
    ASSERT_EQ(job.laser.leadTime.count(), std::chrono::nanoseconds::rep{0}, "zero lead time");
    ASSERT_EQ(job.laser.jumpDelay.count(), OGCODE_JUMP_DELAY.count() * 1000, "unset key keeps its default");
    ASSERT_EQ(job.laser.settleTolerance, 0.004, "settle tolerance");
    ASSERT_EQ(job.emitter.samplePeriod.count(), std::chrono::nanoseconds::rep{20000}, "sample period");
    ASSERT_EQ(job.emitter.parkPosition.x, 1000.0, "park x");
    ASSERT_EQ(job.emitter.parkPosition.y, OGCODE_PARK_Y, "park y default");
    ASSERT_EQ(job.stream.queueCapacity, std::size_t{128}, "dotted key inside a section");
    ASSERT_TRUE(job.stream.failOnUnderrun, "yes is true");
    ASSERT_TRUE(!job.stream.realtimePriority, "off is false");
    ASSERT_EQ(job.network.connectTimeout.count(), std::chrono::milliseconds::rep{2000}, "connect timeout");
    ASSERT_EQ(job.network.writeTimeout.count(), std::chrono::milliseconds::rep{750}, "write timeout");
    ASSERT_EQ(job.network.batchFrames, std::size_t{64}, "batch size");
    ASSERT_NEAR(loaded->calibration.rotation, 3.14159265358979323846 / 2.0, 1e-12, "degrees to radians");
    ASSERT_EQ(loaded->calibration.x.scale, 600.0, "scale x");
    ASSERT_EQ(loaded->calibration.y.offset, 30000.0, "offset y");
}

static void testErrors() {
    ASSERT_EQ(errorLine("planner.max_acceleration = 1e6\nplanner.max_jerk = 5\n"), std::size_t{2}, "unknown key");
    ASSERT_EQ(errorLine("[laser]\nmark_delay_us = soon\n"), std::size_t{2}, "malformed number");
    ASSERT_EQ(errorLine("[laser]\nmark_delay_us = 10\n\nlaser.mark_delay_us = 20\n"), std::size_t{4}, "duplicate key");
    ASSERT_EQ(errorLine("planner.arc_tolerance 0.01\n"), std::size_t{1}, "missing '='");
    ASSERT_EQ(errorLine("\n[laser\n"), std::size_t{2}, "malformed section header");
    ASSERT_EQ(errorLine("stream.fail_on_underrun = maybe\n"), std::size_t{1}, "malformed boolean");
    ASSERT_EQ(errorLine("stream.queue_capacity = 12.5\n"), std::size_t{1}, "fractional count");
    ASSERT_EQ(errorLine("[network]\nwrite_timeout_ms = -5\n"), std::size_t{2}, "negative timeout");
    ASSERT_EQ(errorLine("planner.max_acceleration =\n"), std::size_t{1}, "missing value");
    ASSERT_EQ(errorLine("[parser]\npower_scale = 0\n"), std::size_t{2}, "zero power scale");
    ASSERT_EQ(errorLine("parser.power_scale = -255\n"), std::size_t{1}, "negative power scale");
    ASSERT_EQ(errorLine("stream.queue_capacity = 1e30\n"), std::size_t{1}, "count too large for a size");
    ASSERT_EQ(errorLine("[network]\nwrite_timeout_ms = 1e300\n"), std::size_t{2}, "timeout too large");

    auto badScale = parseConfigText("calibration.scale_y = 0\n");
    ASSERT_TRUE(!badScale.has_value(), "profile validated after loading");
    if (!badScale) {
        ASSERT_EQ(badScale.error().lineNumber, std::size_t{0}, "validation errors have no line");
    }

    auto missing = loadConfigFile("/nonexistent-ogcode-dir/job.conf");
    ASSERT_TRUE(!missing.has_value(), "missing file reported");
}

static void testLensCorrection() {
    auto grid = parseConfigText(
        "[calibration]\n"
        "grid_columns = 2\n"
        "grid_rows = 2\n"
        "grid_x = 0, 1, 2, 3\n"
        "grid_y = 4,5,6,7\n");
    ASSERT_TRUE(grid.has_value(), "grid assembles");
    if (grid) {
        const auto* table = std::get_if<calibration::CorrectionGrid>(&grid->calibration.correction);
        ASSERT_TRUE(table != nullptr, "grid correction selected");
        if (table) {
            ASSERT_EQ(table->offsets.size(), std::size_t{4}, "four nodes");
            ASSERT_EQ(table->offsets[2].x, 2.0, "x value of node 2");
            ASSERT_EQ(table->offsets[2].y, 6.0, "y value of node 2");
        }
    }

    ASSERT_EQ(errorLine("[calibration]\ngrid_columns = 2\ngrid_rows = 2\ngrid_x = 0,1,2\ngrid_y = 0,1,2,3\n"),
              std::size_t{5}, "grid size mismatch names the table line");

    auto poly = parseConfigText(
        "calibration.polynomial_x = 1,0,0,0,0,0,0,0,0,0\n"
        "calibration.polynomial_y = 0,0,0,0,0,0,0,0,0,-2\n");
    ASSERT_TRUE(poly.has_value(), "polynomial assembles");
    if (poly) {
        const auto* coeffs = std::get_if<calibration::CorrectionPolynomial>(&poly->calibration.correction);
        ASSERT_TRUE(coeffs != nullptr, "polynomial correction selected");
        if (coeffs) {
            ASSERT_EQ(coeffs->x[0], 1.0, "constant x term");
            ASSERT_EQ(coeffs->y[9], -2.0, "cubic y term");
        }
    }

    ASSERT_EQ(errorLine("calibration.polynomial_x = 1,2,3\ncalibration.polynomial_y = 1,2,3\n"),
              std::size_t{2}, "short polynomial rejected");
    ASSERT_TRUE(errorLine("calibration.grid_columns = 2\ncalibration.grid_rows = 2\n"
                          "calibration.grid_x = 0,0,0,0\ncalibration.grid_y = 0,0,0,0\n"
                          "calibration.polynomial_x = 0,0,0,0,0,0,0,0,0,0\n"
                          "calibration.polynomial_y = 0,0,0,0,0,0,0,0,0,0\n") != 0,
                "grid and polynomial together rejected");
}

static void testLoadFromFile() {
    const std::string path = (std::filesystem::temp_directory_path() / "ogcode_test_job.conf").string();
    {
        std::ofstream file(path);
        file << "[emitter]\npark_step_limit = 256\n";
    }
    auto loaded = loadConfigFile(path);
    ASSERT_TRUE(loaded.has_value(), "file loads");
    if (loaded) {
        ASSERT_EQ(loaded->job.emitter.parkStepLimit, 256.0, "value from file");
    }
    std::remove(path.c_str());
}

int main() {
    ogcode::setLogLevel(ogcode::LogLevel::Error);

    testDefaults();
    testSectionsAndKeys();
    testErrors();
    testLensCorrection();
    testLoadFromFile();

    ogcode::setLogLevel(ogcode::LogLevel::Info);
    if (g_failures) {
        ogcode::logError("Tests failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    ogcode::logInfo("ConfigFile tests passed.\n");
    return 0;
}
