// JobCompiler.hpp
// -----------------------------------------------------------------------------
// Drives one job through the pipeline:
//
//   Idle -> Parsing -> Planning -> Calibrating -> TimingSync
//        -> Encoding -> Streaming -> Done | Aborted
//
// Parsing through timing run on the calling thread and are deterministic.
// Encoding produces frames into a bounded FrameQueue that a StreamWorker
// drains into the sink. Failures before Encoding never reach the sink;
// failures from Encoding on, and cancellation, end the stream with the
// emergency-stop sequence (laser off, ramp to park).

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "ogcode/calibration/CalibrationTransform.hpp"
#include "ogcode/core/Errors.hpp"
#include "ogcode/core/Expected.hpp"
#include "ogcode/core/JobConfig.hpp"
#include "ogcode/gcode/Command.hpp"
#include "ogcode/stream/FrameQueue.hpp"
#include "ogcode/stream/FrameSink.hpp"
#include "ogcode/stream/StreamWorker.hpp"
#include "ogcode/timing/Timeline.hpp"
#include "ogcode/xy2/FrameEmitter.hpp"

namespace ogcode::job {

enum class JobState {
    Idle,
    Parsing,
    Planning,
    Calibrating,
    TimingSync,
    Encoding,
    Streaming,
    Done,
    Aborted,
};

const char* toString(JobState state);

/// Everything computed before the first frame is produced.
struct CompiledJob {
    gcode::CommandList commands;
    timing::Timeline timeline;
    std::vector<calibration::CalibratedSegment> calibrated;
    std::vector<std::string> warnings;
};

struct StreamReport {
    std::uint64_t framesEmitted = 0;   // frames produced by the emitter
    std::uint64_t framesDelivered = 0; // frames accepted by the sink
    std::uint64_t framesDiscarded = 0; // queued frames dropped by an abort
    std::uint64_t underruns = 0;
    std::size_t emergencyFrames = 0;
};

using StateListener = std::function<void(JobState)>;

class JobCompiler {
public:
    JobCompiler(config::JobConfig config, calibration::SharedProfile profile);

    /// Run the deterministic stages. Clears any earlier cancel request.
    expected<CompiledJob, core::JobError> compile(std::string_view program);

    /// Emit and stream a compiled job; blocks until the sink has been flushed.
    expected<StreamReport, core::JobError> stream(const CompiledJob& job, stream::FrameSink& sink);

    expected<StreamReport, core::JobError> run(std::string_view program, stream::FrameSink& sink);

    /// Request cancellation from any thread.
    void cancel();

    JobState state() const { return currentState.load(); }
    bool cancelRequested() const { return cancelFlag.load(); }

    /// Called on every state change, on the thread that made it.
    void setStateListener(StateListener listener) { stateListener = std::move(listener); }

    /// Report of the last streamed job, filled in on success and failure alike.
    const StreamReport& lastReport() const { return report; }

    const config::JobConfig& jobConfig() const { return config; }

private:
    void transition(JobState next);
    core::JobError abort(core::JobError error);

    std::size_t emergencyStop(stream::FrameQueue& queue, stream::StreamWorker& worker,
                              stream::FrameSink& sink, const xy2::FrameEmitter& emitter);

    config::JobConfig config;
    calibration::CalibrationTransform transform;

    std::atomic<JobState> currentState{JobState::Idle};
    std::atomic<bool> cancelFlag{false};
    StateListener stateListener;
    StreamReport report;

    std::mutex queueMutex;
    stream::FrameQueue* activeQueue = nullptr; // guarded by queueMutex
    bool shuttingDown = false;                 // guarded by queueMutex
};

/// Process exit status for a failed job (see apps/main.cpp).
int exitCodeFor(const core::JobError& error);

} // namespace ogcode::job
