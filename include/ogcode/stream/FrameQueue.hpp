#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

#include "ogcode/xy2/XY2Frame.hpp"

namespace ogcode::stream {

/**
 * @brief Bounded single-producer, single-consumer frame queue.
 *
 * A full queue blocks the producer; frames are never dropped or reordered.
 * `cancel()` wakes a blocked producer and refuses further pushes until
 * `discardPending()` prepares the queue for the emergency-stop frames.
 * After `close()` the consumer drains what is left and then sees an empty
 * optional.
 */
class FrameQueue {
public:
    explicit FrameQueue(std::size_t capacity);

    FrameQueue(const FrameQueue&) = delete;
    FrameQueue& operator=(const FrameQueue&) = delete;

    /// Blocks while full. Returns false if the queue was cancelled or closed.
    bool push(xy2::XY2Frame frame);

    /// Blocks while empty and open. Empty once closed and drained.
    std::optional<xy2::XY2Frame> pop();

    void close();
    void cancel();

    /// Blocks until the consumer has taken every frame, or the queue is cancelled.
    void waitForDrain();

    /// Drop frames not yet consumed and accept pushes again. Returns the count dropped.
    std::size_t discardPending();

    bool cancelled() const;
    bool isClosed() const;
    std::size_t size() const;
    std::size_t capacity() const { return limit; }

    /// Last frame handed to the consumer, i.e. the last one that reached the sink path.
    std::optional<xy2::XY2Frame> lastPopped() const;

    /// Times the consumer found the queue empty while the producer was still running.
    std::uint64_t underruns() const;

    std::size_t highWaterMark() const;

private:
    mutable std::mutex mutex;
    std::condition_variable notFull;
    std::condition_variable notEmpty;
    std::deque<xy2::XY2Frame> frames;
    std::size_t limit;
    bool closed = false;
    bool isCancelled = false;
    std::optional<xy2::XY2Frame> last;
    std::uint64_t underrunCount = 0;
    std::size_t peak = 0;
};

} // namespace ogcode::stream
