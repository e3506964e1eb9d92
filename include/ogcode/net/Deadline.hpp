// Deadline.hpp
// -----------------------------------------------------------------------------
// Blocking wrapper around one Asio async operation with a time limit.

#pragma once

#include "ogcode/log/Log.hpp"
#include "ogcode/net/NetConfig.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>

namespace ogcode::net {

namespace detail {

// Whichever of the operation and the timer claims first publishes the result;
// the other report is ignored. The waiter wakes only on publish, so the winner
// may still touch caller state between claim and publish.
class DeadlineRace {
public:
    bool claim() { return !claimed.exchange(true); }
    void publish(std::error_code ec) { result.set_value(ec); }

    std::future<std::error_code> outcome() { return result.get_future(); }

private:
    std::atomic<bool> claimed{false};
    std::promise<std::error_code> result;
};

} // namespace detail

/**
 * @brief Start an async operation and block until it completes or @p timeout
 * elapses.
 *
 * @p start receives a completion handler taking `std::error_code`. On timeout
 * @p cancel is called so the pending operation finishes with operation_aborted
 * and the result is `asio::error::timed_out`. The io_context behind
 * @p executor must be running on another thread.
 */
template<typename Start, typename Cancel>
std::error_code runWithDeadline(asio::any_io_executor executor,
                                std::chrono::milliseconds timeout,
                                Start start,
                                Cancel cancel) {
    auto race = std::make_shared<detail::DeadlineRace>();
    auto outcome = race->outcome();
    auto timer = std::make_shared<asio::steady_timer>(executor, timeout);

    start([race, timer](const std::error_code& ec) {
        if (race->claim()) {
            timer->cancel();
            race->publish(ec);
        }
    });

    timer->async_wait([race, timer, cancel, timeout](const std::error_code& ec) {
        if (ec == asio::error::operation_aborted) {
            return;
        }
        if (race->claim()) {
            logWarning("[Deadline] operation timed out after ", timeout.count(), " ms\n");
            cancel();
            race->publish(asio::error::timed_out);
        }
    });

    return outcome.get();
}

} // namespace ogcode::net
