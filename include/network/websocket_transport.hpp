#pragma once

#include "network/transport.hpp"
#include "util/string_parsing.hpp"
#include <utility>  // std::exchange, needed by Boost.Asio 1.74 headers in C++20
#include <boost/asio/io_context.hpp>
#include <chrono>

namespace whisperlink {
namespace network {

/**
 * Open a client WebSocket to a tunnel endpoint and expose it as a
 * TransportConnection.
 *
 * - url.scheme "wss": TCP + TLS (SNI set, certificate verification disabled
 *   for the tunnel provider's chain) + upgrade
 * - url.scheme "ws": TCP + upgrade (local relays, tests)
 *
 * Every send() becomes one binary WebSocket message; received messages are
 * delivered as raw bytes, so the same framing runs inside as on TCP.
 *
 * callback fires exactly once on the connection's strand: NONE when the
 * upgrade completed, otherwise the failing step. open_timeout bounds
 * resolve + connect + TLS + upgrade together.
 *
 * Returns nullptr for schemes other than ws/wss.
 */
TransportConnectionPtr CreateWebSocketConnection(boost::asio::io_context &io_context,
                                                 const util::ParsedUrl &url,
                                                 std::chrono::milliseconds open_timeout,
                                                 ConnectCallback callback);

} // namespace network
} // namespace whisperlink
