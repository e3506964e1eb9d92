#include "ogcode/stream/FrameQueue.hpp"

#include <algorithm>

namespace ogcode::stream {

FrameQueue::FrameQueue(std::size_t capacity)
: limit(std::max<std::size_t>(1, capacity)) {}

bool FrameQueue::push(xy2::XY2Frame frame) {
    std::unique_lock<std::mutex> lock(mutex);
    notFull.wait(lock, [this] { return frames.size() < limit || isCancelled || closed; });
    if (isCancelled || closed) {
        return false;
    }
    frames.push_back(std::move(frame));
    peak = std::max(peak, frames.size());
    lock.unlock();
    notEmpty.notify_one();
    return true;
}

std::optional<xy2::XY2Frame> FrameQueue::pop() {
    std::unique_lock<std::mutex> lock(mutex);
    if (frames.empty() && !closed) {
        ++underrunCount;
    }
    notEmpty.wait(lock, [this] { return !frames.empty() || closed; });
    if (frames.empty()) {
        return std::nullopt;
    }
    xy2::XY2Frame frame = std::move(frames.front());
    frames.pop_front();
    last = frame;
    lock.unlock();
    notFull.notify_one();
    return frame;
}

void FrameQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        closed = true;
    }
    notEmpty.notify_all();
    notFull.notify_all();
}

void FrameQueue::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        isCancelled = true;
    }
    notFull.notify_all();
}

std::size_t FrameQueue::discardPending() {
    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(mutex);
        dropped = frames.size();
        frames.clear();
        isCancelled = false;
    }
    notFull.notify_all();
    return dropped;
}

void FrameQueue::waitForDrain() {
    std::unique_lock<std::mutex> lock(mutex);
    notFull.wait(lock, [this] { return frames.empty() || isCancelled; });
}

bool FrameQueue::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex);
    return closed;
}

bool FrameQueue::cancelled() const {
    std::lock_guard<std::mutex> lock(mutex);
    return isCancelled;
}

std::size_t FrameQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return frames.size();
}

std::optional<xy2::XY2Frame> FrameQueue::lastPopped() const {
    std::lock_guard<std::mutex> lock(mutex);
    return last;
}

std::uint64_t FrameQueue::underruns() const {
    std::lock_guard<std::mutex> lock(mutex);
    return underrunCount;
}

std::size_t FrameQueue::highWaterMark() const {
    std::lock_guard<std::mutex> lock(mutex);
    return peak;
}

} // namespace ogcode::stream
