#pragma once

#include "ogcode/net/NetConfig.hpp"

#include <memory>
#include <thread>

namespace ogcode::net {

/**
 * @brief An `asio::io_context` with the thread that runs it.
 *
 * Socket and timer handlers run on this thread while callers block in
 * `runWithDeadline`. The service lives exactly as long as some client holds it:
 * a job that records to a file never starts a network thread.
 */
class NetService {
public:
    NetService();
    ~NetService();

    NetService(const NetService&) = delete;
    NetService& operator=(const NetService&) = delete;

    asio::io_context& context() { return io_; }

private:
    asio::io_context io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    std::thread t_;
};

/// The running service, started on demand and shared by every live client.
std::shared_ptr<NetService> acquireNetService();

} // namespace ogcode::net
