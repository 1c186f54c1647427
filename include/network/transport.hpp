#pragma once

#include "network/connection_types.hpp"
#include "network/errors.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace whisperlink {
namespace network {

// Abstract byte-stream connection. Implementations:
// - RealTransportConnection: TCP socket (direct inbound/outbound, relay loopback)
// - WebSocketConnection<Stream>: ws/wss client towards a tunnel URL
// Each implementation serializes its own I/O on a private strand, so every
// method here may be called from any thread.

class TransportConnection;
using TransportConnectionPtr = std::shared_ptr<TransportConnection>;

// Callback types for transport events
using ConnectCallback = std::function<void(TransportError error)>;
using ReceiveCallback = std::function<void(const std::vector<uint8_t> &data)>;
using DisconnectCallback = std::function<void()>;

class TransportConnection {
public:
  virtual ~TransportConnection() = default;

  // Start receiving data (callbacks invoked when data arrives or connection
  // closes)
  virtual void start() = 0;

  // Send data (returns true if queued successfully, false if connection closed)
  // Semantics:
  // - Returns false if the connection is already closed at call time.
  // - Returns true if the implementation accepted the send attempt. The write
  //   runs later on the connection's strand; an overflowing send queue
  //   closes the connection instead. `true` means "scheduled", not "written";
  //   the disconnect callback reports fatal errors.
  virtual bool send(const std::vector<uint8_t> &data) = 0;

  // Idempotent; safe from any thread
  virtual void close() = 0;
  virtual bool is_open() const = 0;

  virtual std::string remote_address() const = 0;
  virtual uint16_t remote_port() const = 0;
  virtual bool is_inbound() const = 0;
  virtual TransportKind kind() const = 0;

  // Process-unique id; also identifies the strand that owns this handle
  virtual uint64_t connection_id() const = 0;

  virtual void set_receive_callback(ReceiveCallback callback) = 0;
  virtual void set_disconnect_callback(DisconnectCallback callback) = 0;
};

// Shared id source so TCP and WebSocket connection ids never collide
uint64_t NextConnectionId();

} // namespace network
} // namespace whisperlink
