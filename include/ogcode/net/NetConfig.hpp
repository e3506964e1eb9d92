#pragma once

#include <asio.hpp>
#include <system_error>

namespace ogcode::net {

/**
 * @brief Networking aliases so the rest of the tree never names Asio directly.
 *
 * Only the TCP frame sink uses the network; everything before the sink is
 * pure computation.
 */
namespace asio = ::asio;

using tcp = asio::ip::tcp;

} // namespace ogcode::net
