#include "ogcode/xy2/FrameEmitter.hpp"

#include "ogcode/log/Log.hpp"
#include "ogcode/xy2/XY2Protocol.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace ogcode::xy2 {

using core::EncodingError;
using core::Point2;

namespace {

// Event times are rounded up so a laser change never precedes its scheduled time.
std::int64_t eventNanoseconds(double seconds) {
    return static_cast<std::int64_t>(std::ceil(seconds * 1e9 - 1e-3));
}

std::uint16_t clampToScanner(double value) {
    const double clamped = std::clamp(value, calibration::SCANNER_MIN, calibration::SCANNER_MAX);
    return static_cast<std::uint16_t>(std::lround(clamped));
}

expected<std::uint16_t, EncodingError> quantize(double value, char axis, std::uint64_t sampleIndex) {
    if (!std::isfinite(value)) {
        std::ostringstream os;
        os << axis << " value is not finite";
        return unexpected(EncodingError{os.str(), sampleIndex});
    }
    const double rounded = std::round(value);
    if (rounded < calibration::SCANNER_MIN || rounded > calibration::SCANNER_MAX) {
        std::ostringstream os;
        os << axis << " value " << value << " outside the 16-bit data field";
        return unexpected(EncodingError{os.str(), sampleIndex});
    }
    return static_cast<std::uint16_t>(rounded);
}

} // namespace

FrameEmitter::FrameEmitter(calibration::CalibrationTransform transform_, config::EmitterSettings settings_)
: transform(std::move(transform_)), settings(settings_) {}

expected<XY2Frame, EncodingError>
FrameEmitter::encodeSample(const TimedPoint& point, bool laserOn, double power, std::uint64_t sampleIndex) const {
    const Point2 scanner = transform.map(point.position);
    auto x = quantize(scanner.x, 'X', sampleIndex);
    if (!x) {
        return unexpected(x.error());
    }
    auto y = quantize(scanner.y, 'Y', sampleIndex);
    if (!y) {
        return unexpected(y.error());
    }

    XY2Frame frame;
    frame.xWord = protocol::encodeChannelWord(*x);
    frame.yWord = protocol::encodeChannelWord(*y);
    frame.laserOn = laserOn;
    frame.laserPower = laserOn ? protocol::encodePower(power) : 0;
    frame.sampleIndex = sampleIndex;
    return frame;
}

expected<EmitSummary, EncodingError>
FrameEmitter::emit(const timing::Timeline& timeline, const FramePushCallback& push) const {
    if (settings.samplePeriod.count() <= 0) {
        return unexpected(EncodingError{"sample period must be positive", 0});
    }

    std::vector<std::int64_t> eventTimes;
    eventTimes.reserve(timeline.laserEvents.size());
    for (const auto& event : timeline.laserEvents) {
        eventTimes.push_back(eventNanoseconds(event.time));
    }

    TimelineSampler sampler(timeline, settings.samplePeriod);
    EmitSummary summary;
    std::size_t eventCursor = 0;
    bool laserOn = false;
    double power = 0.0;

    logInfo("[FrameEmitter] emitting ", sampler.sampleCount(), " frames at ",
            settings.samplePeriod.count(), " ns\n");

    while (!sampler.done()) {
        const std::uint64_t sampleIndex = sampler.nextIndex();
        const TimedPoint point = sampler.next();
        while (eventCursor < eventTimes.size() && eventTimes[eventCursor] <= point.timestamp.count()) {
            const auto& event = timeline.laserEvents[eventCursor];
            laserOn = event.on;
            power = event.power;
            ++eventCursor;
        }

        auto frame = encodeSample(point, laserOn, power, sampleIndex);
        if (!frame) {
            logError("[FrameEmitter] ", frame.error().describe(), "\n");
            return unexpected(frame.error());
        }
        if (!push(std::move(*frame))) {
            summary.stopped = true;
            break;
        }
        ++summary.framesEmitted;
    }
    return summary;
}

XY2Frame FrameEmitter::scannerFrame(Point2 scanner, std::uint64_t sampleIndex) const {
    XY2Frame frame;
    frame.xWord = protocol::encodeChannelWord(clampToScanner(scanner.x));
    frame.yWord = protocol::encodeChannelWord(clampToScanner(scanner.y));
    frame.laserOn = false;
    frame.laserPower = 0;
    frame.sampleIndex = sampleIndex;
    return frame;
}

std::vector<XY2Frame> FrameEmitter::emergencyStopFrames(std::optional<Point2> from,
                                                        std::uint64_t firstIndex) const {
    const Point2 park{static_cast<double>(clampToScanner(settings.parkPosition.x)),
                      static_cast<double>(clampToScanner(settings.parkPosition.y))};
    std::vector<XY2Frame> frames;
    if (!from) {
        frames.push_back(scannerFrame(park, firstIndex));
        return frames;
    }

    const Point2 start = *from;
    frames.push_back(scannerFrame(start, firstIndex));

    const double step = settings.parkStepLimit > 0.0 ? settings.parkStepLimit : calibration::SCANNER_MAX;
    const double span = std::max(std::abs(park.x - start.x), std::abs(park.y - start.y));
    const auto steps = static_cast<std::uint64_t>(std::max(1.0, std::ceil(span / step)));
    for (std::uint64_t k = 1; k <= steps; ++k) {
        const Point2 position = k == steps
            ? park
            : start + (park - start) * (static_cast<double>(k) / static_cast<double>(steps));
        frames.push_back(scannerFrame(position, firstIndex + k));
    }
    return frames;
}

} // namespace ogcode::xy2
