#pragma once

#include "ogcode/core/Errors.hpp"
#include "ogcode/core/Expected.hpp"
#include "ogcode/xy2/XY2Frame.hpp"

namespace ogcode::stream {

/**
 * @brief Destination for XY2 frames: hardware bridge, network or file.
 *
 * `accept` is called from the stream worker thread, one frame at a time, in
 * sample order. It may block; a blocked sink back-pressures the emitter
 * through the bounded queue. Any error aborts the job.
 */
class FrameSink {
public:
    virtual ~FrameSink() = default;

    virtual expected<void, core::SinkError> accept(xy2::XY2Frame frame) = 0;

    /// Push out anything buffered. Called once after the last frame.
    virtual expected<void, core::SinkError> flush() = 0;
};

} // namespace ogcode::stream
