#pragma once

#include "ogcode/core/JobConfig.hpp"
#include "ogcode/log/Log.hpp"
#include "ogcode/net/Deadline.hpp"
#include "ogcode/net/NetConfig.hpp"
#include "ogcode/net/NetService.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace ogcode::net {
using duration = std::chrono::milliseconds;

/**
 * @brief Blocking TCP client with a deadline on every operation.
 *
 * - `connect(...)` resolves and tries each endpoint with a per-attempt timeout.
 * - `write_all(...)` blocks the caller until every byte is sent or the write times out.
 * - All socket work runs on a strand of the shared NetService.
 */
class TcpClient {
public:
    explicit TcpClient(duration connectTimeout = config::OGCODE_CONNECT_TIMEOUT,
                       duration ioTimeout = config::OGCODE_WRITE_TIMEOUT)
    : service_(acquireNetService())
    , strand_(asio::make_strand(service_->context()))
    , socket_(strand_)
    , ioTimeout_(sanitize(ioTimeout))
    , connectTimeout_(sanitize(connectTimeout))
    {}

    ~TcpClient() { close(); }

    TcpClient(const TcpClient&) = delete;
    TcpClient& operator=(const TcpClient&) = delete;

    static duration sanitize(duration timeout) {
        return timeout.count() < 0 ? duration::zero() : timeout;
    }

    std::error_code connect(const tcp::endpoint& endpoint) {
        close();
        socket_ = tcp::socket(strand_);
        auto ex = socket_.get_executor();
        return runWithDeadline(ex, connectTimeout_,
            [&](auto completion) { socket_.async_connect(endpoint, completion); },
            [&] { cancel(); });
    }

    /// Resolve @p host (name or address) and connect to the first endpoint that answers.
    std::error_code connect(const std::string& host, std::uint16_t port) {
        std::error_code ec;
        tcp::resolver resolver(service_->context());
        auto results = resolver.resolve(host, std::to_string(port), ec);
        if (ec) {
            return ec;
        }
        std::error_code last = asio::error::host_not_found;
        for (const auto& entry : results) {
            last = connect(entry.endpoint());
            if (!last) {
                return last;
            }
        }
        return last;
    }

    std::error_code write_all(const void* buf, std::size_t n, duration timeout) {
        auto ex = socket_.get_executor();
        return runWithDeadline(ex, sanitize(timeout),
            [&](auto completion) {
                asio::async_write(socket_, asio::buffer(buf, n),
                    [completion](const std::error_code& op_ec, std::size_t) {
                        completion(op_ec);
                    });
            },
            [&] { cancel(); });
    }

    std::error_code write_all(const void* buf, std::size_t n) {
        return write_all(buf, n, ioTimeout_);
    }

    /// TCP_NODELAY so small batches leave immediately.
    void setLowLatency() {
        std::error_code ec;
        socket_.set_option(tcp::no_delay(true), ec);
        socket_.set_option(asio::socket_base::keep_alive(true), ec);
        if (ec) {
            logWarning("[TcpClient] could not set socket options: ", ec.message(), "\n");
        }
    }

    bool is_open() const { return socket_.is_open(); }

    void cancel() {
        std::error_code ec;
        socket_.cancel(ec);
    }

    void close() {
        if (!socket_.is_open()) return;
        logInfo("[TcpClient] close()\n");
        std::error_code ec;
        socket_.cancel(ec);
        socket_.shutdown(tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

private:
    std::shared_ptr<NetService> service_; // outlives the socket below
    asio::strand<asio::io_context::executor_type> strand_;
    tcp::socket socket_;
    duration ioTimeout_;
    duration connectTimeout_;
};

} // namespace ogcode::net
