// Copyright (c) 2025 The WhisperLink developers
// Distributed under the MIT software license

#pragma once

#include "network/connection_types.hpp"
#include "network/message.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace whisperlink {

/**
 * A decrypted message delivered to observers
 */
struct IncomingMessage {
  message::MessageKind kind{message::MessageKind::CHAT};
  std::string peer_id;
  std::string peer_username;
  std::string text;      // plaintext (JSON object text for SIGNAL)
  std::string timestamp; // sender's ISO-8601 timestamp, may be empty
  std::optional<std::string> group_id;
  std::optional<std::string> group_name;
};

/**
 * Event channel for one ConnectionManager
 *
 * Design:
 * - Observer pattern with std::function, one instance per manager
 * - Message observers register for one MessageKind and only see that kind
 * - RAII subscriptions; a Subscription may outlive its MessageEvents
 * - Callbacks run synchronously on the reactor thread that produced the
 *   event, outside the subscriber lock, so they may subscribe/unsubscribe
 */
class MessageEvents {
  struct State;

public:
  /**
   * Subscription handle - RAII wrapper
   * Automatically unsubscribes when destroyed
   */
  class Subscription {
  public:
    Subscription() = default;
    ~Subscription();

    // Movable but not copyable
    Subscription(Subscription &&other) noexcept;
    Subscription &operator=(Subscription &&other) noexcept;
    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;

    void Unsubscribe();
    bool active() const { return active_; }

  private:
    friend class MessageEvents;
    Subscription(std::weak_ptr<State> owner, size_t id);

    std::weak_ptr<State> owner_;
    size_t id_{0};
    bool active_{false};
  };

  using MessageCallback = std::function<void(const IncomingMessage &msg)>;
  using PeerConnectedCallback =
      std::function<void(const std::string &peer_id, const std::string &username,
                         network::TransportKind kind, bool inbound)>;
  using PeerDisconnectedCallback =
      std::function<void(const std::string &peer_id, const std::string &reason)>;

  MessageEvents();

  MessageEvents(const MessageEvents &) = delete;
  MessageEvents &operator=(const MessageEvents &) = delete;

  [[nodiscard]] Subscription SubscribeMessage(message::MessageKind kind,
                                              MessageCallback callback);
  [[nodiscard]] Subscription SubscribePeerConnected(PeerConnectedCallback callback);
  [[nodiscard]] Subscription SubscribePeerDisconnected(PeerDisconnectedCallback callback);

  void NotifyMessage(const IncomingMessage &msg);
  void NotifyPeerConnected(const std::string &peer_id, const std::string &username,
                           network::TransportKind kind, bool inbound);
  void NotifyPeerDisconnected(const std::string &peer_id, const std::string &reason);

  size_t SubscriberCount() const;

private:
  struct CallbackEntry {
    size_t id;
    message::MessageKind kind{message::MessageKind::CHAT};
    MessageCallback message;
    PeerConnectedCallback peer_connected;
    PeerDisconnectedCallback peer_disconnected;
  };

  struct State {
    // Thread-safety: protect callbacks and next_id across threads
    mutable std::mutex mutex;
    std::vector<CallbackEntry> callbacks;
    size_t next_id{1}; // 0 reserved for invalid

    void Unsubscribe(size_t id);
  };

  Subscription Add(CallbackEntry entry);
  std::vector<CallbackEntry> Snapshot() const;

  std::shared_ptr<State> state_;
};

} // namespace whisperlink
