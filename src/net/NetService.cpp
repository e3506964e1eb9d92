#include "ogcode/net/NetService.hpp"
#include "ogcode/log/Log.hpp"

#include <mutex>

namespace ogcode::net {

NetService::NetService()
: work_guard_(asio::make_work_guard(io_))
, t_([this] { io_.run(); })
{
    logInfo("[NetService] I/O thread started\n");
}

NetService::~NetService() {
    work_guard_.reset();
    io_.stop();
    if (t_.joinable()) t_.join();
    logInfo("[NetService] I/O thread stopped\n");
}

std::shared_ptr<NetService> acquireNetService() {
    static std::mutex mutex;
    static std::weak_ptr<NetService> current;

    std::lock_guard<std::mutex> lock(mutex);
    if (auto service = current.lock()) {
        return service;
    }
    auto service = std::make_shared<NetService>();
    current = service;
    return service;
}

} // namespace ogcode::net
