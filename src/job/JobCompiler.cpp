#include "ogcode/job/JobCompiler.hpp"

#include "ogcode/gcode/GCodeParser.hpp"
#include "ogcode/log/Log.hpp"
#include "ogcode/planner/PathPlanner.hpp"
#include "ogcode/timing/LaserTimingCoordinator.hpp"
#include "ogcode/xy2/XY2Protocol.hpp"

#include <optional>

namespace ogcode::job {

using core::JobError;

const char* toString(JobState state) {
    switch (state) {
        case JobState::Idle: return "Idle";
        case JobState::Parsing: return "Parsing";
        case JobState::Planning: return "Planning";
        case JobState::Calibrating: return "Calibrating";
        case JobState::TimingSync: return "TimingSync";
        case JobState::Encoding: return "Encoding";
        case JobState::Streaming: return "Streaming";
        case JobState::Done: return "Done";
        case JobState::Aborted: return "Aborted";
    }
    return "Unknown";
}

JobCompiler::JobCompiler(config::JobConfig jobConfig, calibration::SharedProfile profile)
: config(std::move(jobConfig)), transform(std::move(profile)) {}

void JobCompiler::transition(JobState next) {
    const JobState previous = currentState.exchange(next);
    logInfo("[JobCompiler] ", toString(previous), " -> ", toString(next), "\n");
    if (stateListener) {
        stateListener(next);
    }
}

JobError JobCompiler::abort(JobError error) {
    logError("[JobCompiler] job aborted: ", core::describe(error), "\n");
    transition(JobState::Aborted);
    return error;
}

void JobCompiler::cancel() {
    cancelFlag = true;
    std::lock_guard<std::mutex> lock(queueMutex);
    if (activeQueue && !shuttingDown) {
        activeQueue->cancel();
    }
    logInfo("[JobCompiler] cancel requested\n");
}

expected<CompiledJob, JobError> JobCompiler::compile(std::string_view program) {
    cancelFlag = false;
    CompiledJob job;
    const gcode::ParserContext initial{};
    const core::Point2 origin = initial.position;

    transition(JobState::Parsing);
    gcode::GCodeParser parser(config.parser);
    auto parsed = parser.parseProgram(program, initial);
    if (!parsed) {
        return unexpected(abort(parsed.error()));
    }
    job.commands = std::move(parsed->commands);
    job.warnings = std::move(parsed->warnings);
    if (cancelFlag) {
        return unexpected(abort(core::CancelledError{}));
    }

    transition(JobState::Planning);
    planner::PathPlanner planner(config.motion);
    auto planned = planner.plan(job.commands, origin);
    if (!planned) {
        return unexpected(abort(planned.error()));
    }
    job.warnings.insert(job.warnings.end(), planned->warnings.begin(), planned->warnings.end());
    if (cancelFlag) {
        return unexpected(abort(core::CancelledError{}));
    }

    transition(JobState::Calibrating);
    if (auto start = transform.evaluate(origin); !start) {
        return unexpected(abort(start.error()));
    }
    auto calibrated = calibration::calibrateSegments(planned->segments, transform);
    if (!calibrated) {
        return unexpected(abort(calibrated.error()));
    }
    job.calibrated = std::move(*calibrated);
    if (cancelFlag) {
        return unexpected(abort(core::CancelledError{}));
    }

    transition(JobState::TimingSync);
    timing::LaserTimingCoordinator coordinator(config.laser);
    auto timeline = coordinator.coordinate(job.commands, std::move(planned->segments), origin);
    if (!timeline) {
        return unexpected(abort(timeline.error()));
    }
    job.timeline = std::move(*timeline);

    logInfo("[JobCompiler] compiled ", job.commands.size(), " commands into ",
            job.timeline.segments.size(), " segments (", job.timeline.totalDuration * 1000.0,
            " ms), ", job.warnings.size(), " warnings\n");
    return job;
}

expected<StreamReport, JobError> JobCompiler::stream(const CompiledJob& job, stream::FrameSink& sink) {
    report = StreamReport{};
    if (cancelFlag) {
        return unexpected(abort(core::CancelledError{}));
    }

    transition(JobState::Encoding);
    xy2::FrameEmitter emitter(transform, config.emitter);
    stream::FrameQueue queue(config.stream.queueCapacity);
    stream::StreamWorker worker(queue, sink, config.stream);

    struct QueueRegistration {
        JobCompiler& owner;
        QueueRegistration(JobCompiler& compiler, stream::FrameQueue& queue) : owner(compiler) {
            std::lock_guard<std::mutex> lock(owner.queueMutex);
            owner.activeQueue = &queue;
            owner.shuttingDown = false;
        }
        ~QueueRegistration() {
            std::lock_guard<std::mutex> lock(owner.queueMutex);
            owner.activeQueue = nullptr;
        }
    } registration(*this, queue);

    if (cancelFlag) {
        queue.cancel();
    }

    auto startStreaming = [&] {
        if (!worker.started()) {
            worker.start();
            transition(JobState::Streaming);
        }
    };

    // The worker starts once the queue is primed so the sink never begins on
    // a nearly empty buffer.
    auto emitted = emitter.emit(job.timeline, [&](xy2::XY2Frame&& frame) {
        if (cancelFlag) {
            return false;
        }
        if (!worker.started() && queue.size() >= queue.capacity()) {
            startStreaming();
        }
        return queue.push(std::move(frame));
    });

    std::optional<JobError> failure;
    if (!emitted) {
        report.framesEmitted = emitted.error().sampleIndex;
        failure = emitted.error();
    } else {
        report.framesEmitted = emitted->framesEmitted;
        if (emitted->stopped) {
            if (auto sinkError = worker.error()) {
                failure = *sinkError;
            } else {
                failure = core::CancelledError{};
            }
        }
    }

    if (!failure) {
        startStreaming();
        // Emission is over; pops on a closed queue are not underruns.
        queue.close();
        queue.waitForDrain();
        if (auto sinkError = worker.error()) {
            failure = *sinkError;
        } else if (cancelFlag) {
            failure = core::CancelledError{};
        } else {
            worker.join();
            if (auto lateError = worker.error()) {
                failure = *lateError;
            } else if (auto flushed = sink.flush(); !flushed) {
                failure = flushed.error();
            }
        }
    }

    if (failure) {
        report.emergencyFrames = emergencyStop(queue, worker, sink, emitter);
        report.framesDelivered = worker.framesDelivered();
        report.underruns = queue.underruns();
        return unexpected(abort(*failure));
    }

    report.framesDelivered = worker.framesDelivered();
    report.underruns = queue.underruns();
    if (report.underruns > 0) {
        logWarning("[JobCompiler] frame queue ran empty ", report.underruns, " times while streaming\n");
    }
    logInfo("[JobCompiler] streamed ", report.framesDelivered, " frames\n");
    transition(JobState::Done);
    return report;
}

std::size_t JobCompiler::emergencyStop(stream::FrameQueue& queue, stream::StreamWorker& worker,
                                       stream::FrameSink& sink, const xy2::FrameEmitter& emitter) {
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        shuttingDown = true;
    }
    worker.ignoreUnderruns();
    report.framesDiscarded = queue.discardPending();

    std::optional<core::Point2> from;
    std::uint64_t firstIndex = 0;
    if (auto last = queue.lastPopped()) {
        from = xy2::protocol::framePosition(*last);
        firstIndex = last->sampleIndex + 1;
    }
    const auto frames = emitter.emergencyStopFrames(from, firstIndex);

    bool queued = false;
    if (!worker.failed() && !queue.isClosed()) {
        if (!worker.started()) {
            worker.start();
        }
        queued = true;
        for (const auto& frame : frames) {
            if (!queue.push(frame)) {
                queued = false;
                break;
            }
        }
    }
    queue.close();
    worker.join();

    if (!queued || worker.failed()) {
        // The queue path is gone; hand the remaining frames to the sink directly.
        const auto last = queue.lastPopped();
        for (const auto& frame : frames) {
            if (last && frame.sampleIndex <= last->sampleIndex) {
                continue;
            }
            if (auto accepted = sink.accept(frame); !accepted) {
                logError("[JobCompiler] emergency stop frame rejected: ", accepted.error().describe(), "\n");
                break;
            }
        }
    }
    if (auto flushed = sink.flush(); !flushed) {
        logError("[JobCompiler] flush after emergency stop failed: ", flushed.error().describe(), "\n");
    }

    logWarning("[JobCompiler] emergency stop: laser off, ", frames.size(), " frames to park, ",
               report.framesDiscarded, " queued frames discarded\n");
    return frames.size();
}

expected<StreamReport, JobError> JobCompiler::run(std::string_view program, stream::FrameSink& sink) {
    auto compiled = compile(program);
    if (!compiled) {
        return unexpected(compiled.error());
    }
    return stream(*compiled, sink);
}

int exitCodeFor(const JobError& error) {
    return std::visit(gcode::Overloaded{
        [](const core::ParseError&) { return 2; },
        [](const core::PlanningError&) { return 3; },
        [](const core::CalibrationError&) { return 4; },
        [](const core::TimingError&) { return 5; },
        [](const core::EncodingError&) { return 6; },
        [](const core::SinkError&) { return 6; },
        [](const core::CancelledError&) { return 7; },
    }, error);
}

} // namespace ogcode::job
