#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

#include "ogcode/calibration/CalibrationTransform.hpp"
#include "ogcode/core/Errors.hpp"
#include "ogcode/core/Expected.hpp"
#include "ogcode/core/JobConfig.hpp"
#include "ogcode/timing/Timeline.hpp"
#include "ogcode/xy2/TimelineSampler.hpp"
#include "ogcode/xy2/XY2Frame.hpp"

namespace ogcode::xy2 {

/// Receives frames in sample order. Returning false stops emission.
using FramePushCallback = std::function<bool(XY2Frame&&)>;

struct EmitSummary {
    std::uint64_t framesEmitted = 0;
    bool stopped = false; // the push callback refused a frame
};

/**
 * @brief Resamples a timeline at the XY2-100 frame rate and encodes each sample.
 *
 * Each sample is calibrated individually (machine position to scanner units)
 * and quantized to 16 bits. Frames are produced one at a time and handed to
 * the push callback, which usually feeds the bounded frame queue and blocks
 * while it is full.
 */
class FrameEmitter {
public:
    FrameEmitter(calibration::CalibrationTransform transform, config::EmitterSettings settings);

    expected<EmitSummary, core::EncodingError>
    emit(const timing::Timeline& timeline, const FramePushCallback& push) const;

    /// Encode one sample; fails if the calibrated value leaves the 16-bit range.
    expected<XY2Frame, core::EncodingError>
    encodeSample(const TimedPoint& point, bool laserOn, double power, std::uint64_t sampleIndex) const;

    /**
     * @brief Frames that shut the laser and bring the mirrors to the park position.
     *
     * The first frame holds @p from with the laser off; the following frames
     * ramp linearly to park, moving at most `parkStepLimit` scanner units per
     * axis and sample. Without a known position a single park frame is produced.
     */
    std::vector<XY2Frame> emergencyStopFrames(std::optional<core::Point2> from,
                                              std::uint64_t firstIndex) const;

    const config::EmitterSettings& emitterSettings() const { return settings; }

private:
    XY2Frame scannerFrame(core::Point2 scanner, std::uint64_t sampleIndex) const;

    calibration::CalibrationTransform transform;
    config::EmitterSettings settings;
};

} // namespace ogcode::xy2
