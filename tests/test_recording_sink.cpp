#include "ogcode/log/Log.hpp"
#include "ogcode/stream/RecordingSink.hpp"
#include "ogcode/xy2/XY2Protocol.hpp"

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <type_traits>

using namespace ogcode;
using namespace ogcode::stream;
using xy2::XY2Frame;

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { ogcode::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { ogcode::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", +_va, " != ", +_vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

namespace {

std::string tempPath(const std::string& name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

XY2Frame makeFrame(std::uint64_t index) {
    XY2Frame frame;
    frame.xWord = xy2::protocol::encodeChannelWord(static_cast<std::uint16_t>(index * 7));
    frame.yWord = xy2::protocol::encodeChannelWord(static_cast<std::uint16_t>(65535 - index));
    frame.laserOn = (index % 3) == 0;
    frame.laserPower = frame.laserOn ? static_cast<std::uint16_t>(1000 + index) : 0;
    frame.sampleIndex = index;
    return frame;
}

} // namespace

static_assert(!std::is_constructible_v<RecordingSink, std::ofstream, std::string>,
              "recording sinks are only created through RecordingSink::open");

static void testWriteAndRead() {
    const std::string path = tempPath("ogcode_test_recording.xy2");
    constexpr std::uint64_t kFrames = 10000; // spans more than one write block

    {
        auto sink = RecordingSink::open(path, std::chrono::nanoseconds{10000});
        ASSERT_TRUE(sink.has_value(), "recording opens");
        if (!sink) return;
        bool accepted = true;
        for (std::uint64_t i = 0; i < kFrames; ++i) {
            if (!(*sink)->accept(makeFrame(i))) accepted = false;
        }
        ASSERT_TRUE(accepted, "every frame accepted");
        ASSERT_TRUE((*sink)->flush().has_value(), "flush succeeds");
        ASSERT_EQ((*sink)->framesWritten(), kFrames, "frame count");
    }

    ASSERT_EQ(static_cast<std::uint64_t>(std::filesystem::file_size(path)),
              static_cast<std::uint64_t>(RECORDING_HEADER_SIZE + kFrames * 12), "file size");

    auto recording = readRecording(path);
    ASSERT_TRUE(recording.has_value(), "recording reads back");
    if (recording) {
        ASSERT_EQ(recording->samplePeriod.count(), std::int64_t{10000}, "sample period kept");
        ASSERT_EQ(recording->frames.size(), static_cast<std::size_t>(kFrames), "frames read");
        bool identical = true;
        for (std::uint64_t i = 0; i < recording->frames.size(); ++i) {
            const XY2Frame& got = recording->frames[i];
            const XY2Frame want = makeFrame(i);
            if (got.xWord != want.xWord || got.yWord != want.yWord || got.laserOn != want.laserOn ||
                got.laserPower != want.laserPower || got.sampleIndex != want.sampleIndex) {
                identical = false;
            }
        }
        ASSERT_TRUE(identical, "frames read back unchanged");
    }

    {
        std::ofstream tail(path, std::ios::binary | std::ios::app);
        tail.write("junk", 4);
    }
    ASSERT_TRUE(!readRecording(path).has_value(), "truncated record rejected");
    std::remove(path.c_str());
}

static void testBadFiles() {
    const std::string path = tempPath("ogcode_test_not_a_recording.bin");
    {
        std::ofstream file(path, std::ios::binary);
        file << "this is not a recording at all";
    }
    ASSERT_TRUE(!readRecording(path).has_value(), "wrong magic rejected");
    std::remove(path.c_str());

    ASSERT_TRUE(!readRecording(tempPath("ogcode_missing_recording.xy2")).has_value(), "missing file rejected");

    auto unwritable = RecordingSink::open("/nonexistent-ogcode-dir/out.xy2", std::chrono::nanoseconds{10000});
    ASSERT_TRUE(!unwritable.has_value(), "unwritable path rejected");
    if (!unwritable) {
        ASSERT_TRUE(static_cast<bool>(unwritable.error().code), "error carries the errno");
    }
}

static void testEmptyRecording() {
    const std::string path = tempPath("ogcode_test_empty.xy2");
    {
        auto sink = RecordingSink::open(path, std::chrono::nanoseconds{20000});
        ASSERT_TRUE(sink.has_value() && (*sink)->flush().has_value(), "empty recording flushes");
    }
    auto recording = readRecording(path);
    ASSERT_TRUE(recording.has_value(), "header-only recording reads");
    if (recording) {
        ASSERT_EQ(recording->frames.size(), std::size_t{0}, "no frames");
        ASSERT_EQ(recording->samplePeriod.count(), std::int64_t{20000}, "period");
    }
    std::remove(path.c_str());
}

int main() {
    ogcode::setLogLevel(ogcode::LogLevel::Error);

    testWriteAndRead();
    testBadFiles();
    testEmptyRecording();

    ogcode::setLogLevel(ogcode::LogLevel::Info);
    if (g_failures) {
        ogcode::logError("Tests failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    ogcode::logInfo("RecordingSink tests passed.\n");
    return 0;
}
