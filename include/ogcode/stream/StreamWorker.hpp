#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <thread>

#include "ogcode/core/Errors.hpp"
#include "ogcode/core/JobConfig.hpp"
#include "ogcode/stream/FrameQueue.hpp"
#include "ogcode/stream/FrameSink.hpp"

namespace ogcode::stream {

/**
 * @brief Consumer thread that moves frames from the queue into a sink.
 *
 * Threading model:
 * - `start()` launches the worker, which calls `run()` until the queue is
 *   closed and drained or the sink reports an error.
 * - On a sink error the queue is cancelled so a blocked producer wakes up.
 * - `join()` waits for the worker; the destructor closes the queue and joins.
 *
 * The worker asks for SCHED_FIFO so sample pacing is not disturbed by the
 * producer; if the request is refused it logs and keeps running.
 */
class StreamWorker {
public:
    StreamWorker(FrameQueue& queue, FrameSink& sink, config::StreamSettings settings);
    ~StreamWorker();

    StreamWorker(const StreamWorker&) = delete;
    StreamWorker& operator=(const StreamWorker&) = delete;

    void start();
    void join();

    bool started() const { return worker.joinable() || running; }
    bool failed() const;
    std::optional<core::SinkError> error() const;
    std::uint64_t framesDelivered() const { return delivered.load(); }

    /// Stop treating an empty queue as a failure (used while the job shuts down).
    void ignoreUnderruns() { underrunsFatal = false; }

private:
    void run();
    void fail(core::SinkError sinkError);
    void requestRealtimePriority();

    FrameQueue& queue;
    FrameSink& sink;
    config::StreamSettings settings;

    std::thread worker;
    std::atomic<bool> running{false};
    std::atomic<bool> underrunsFatal{false};
    std::atomic<std::uint64_t> delivered{0};

    mutable std::mutex errorMutex;
    std::optional<core::SinkError> lastError;
};

} // namespace ogcode::stream
