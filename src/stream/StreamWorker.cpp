#include "ogcode/stream/StreamWorker.hpp"
#include "ogcode/log/Log.hpp"

#include <cstring>
#include <pthread.h>
#include <sched.h>

namespace ogcode::stream {

StreamWorker::StreamWorker(FrameQueue& queue_, FrameSink& sink_, config::StreamSettings settings_)
: queue(queue_), sink(sink_), settings(settings_), underrunsFatal(settings_.failOnUnderrun) {}

StreamWorker::~StreamWorker() {
    if (worker.joinable()) {
        queue.close();
        worker.join();
    }
}

void StreamWorker::start() {
    if (running) return; // Already running.
    running = true;
    worker = std::thread([this] {
        this->run();
    });
    if (settings.realtimePriority) {
        requestRealtimePriority();
    }
}

void StreamWorker::join() {
    if (worker.joinable()) {
        worker.join();
    }
}

void StreamWorker::requestRealtimePriority() {
    sched_param param{};
    param.sched_priority = sched_get_priority_max(SCHED_FIFO);
    const int rc = pthread_setschedparam(worker.native_handle(), SCHED_FIFO, &param);
    if (rc != 0) {
        logInfo("[StreamWorker] real-time scheduling unavailable (", std::strerror(rc),
                "), streaming at normal priority\n");
    }
}

void StreamWorker::run() {
    const std::uint64_t underrunsAtStart = queue.underruns();
    while (running) {
        auto frame = queue.pop();
        if (!frame) {
            break; // closed and drained
        }
        if (underrunsFatal && queue.underruns() > underrunsAtStart) {
            fail(core::SinkError{"frame queue ran empty while streaming", {}});
            break;
        }
        auto accepted = sink.accept(std::move(*frame));
        if (!accepted) {
            fail(accepted.error());
            break;
        }
        ++delivered;
    }
    running = false;
}

void StreamWorker::fail(core::SinkError sinkError) {
    logError("[StreamWorker] ", sinkError.describe(), "\n");
    {
        std::lock_guard<std::mutex> lock(errorMutex);
        lastError = std::move(sinkError);
    }
    queue.cancel();
}

bool StreamWorker::failed() const {
    std::lock_guard<std::mutex> lock(errorMutex);
    return lastError.has_value();
}

std::optional<core::SinkError> StreamWorker::error() const {
    std::lock_guard<std::mutex> lock(errorMutex);
    return lastError;
}

} // namespace ogcode::stream
