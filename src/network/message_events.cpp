// Copyright (c) 2025 The WhisperLink developers
// Distributed under the MIT software license

#include "network/message_events.hpp"
#include "util/logging.hpp"
#include <algorithm>

namespace whisperlink {

// ============================================================================
// MessageEvents::Subscription
// ============================================================================

MessageEvents::Subscription::Subscription(std::weak_ptr<State> owner, size_t id)
    : owner_(std::move(owner)), id_(id), active_(true) {}

MessageEvents::Subscription::~Subscription() { Unsubscribe(); }

MessageEvents::Subscription::Subscription(Subscription &&other) noexcept
    : owner_(std::move(other.owner_)), id_(other.id_), active_(other.active_) {
  other.owner_.reset();
  other.active_ = false;
}

MessageEvents::Subscription &
MessageEvents::Subscription::operator=(Subscription &&other) noexcept {
  if (this != &other) {
    Unsubscribe();
    owner_ = std::move(other.owner_);
    id_ = other.id_;
    active_ = other.active_;
    other.owner_.reset();
    other.active_ = false;
  }
  return *this;
}

void MessageEvents::Subscription::Unsubscribe() {
  if (!active_)
    return;
  active_ = false;
  if (auto owner = owner_.lock()) {
    owner->Unsubscribe(id_);
  }
  owner_.reset();
}

// ============================================================================
// MessageEvents
// ============================================================================

void MessageEvents::State::Unsubscribe(size_t id) {
  std::lock_guard<std::mutex> lock(mutex);
  callbacks.erase(std::remove_if(callbacks.begin(), callbacks.end(),
                                 [id](const CallbackEntry &e) { return e.id == id; }),
                  callbacks.end());
}

MessageEvents::MessageEvents() : state_(std::make_shared<State>()) {}

MessageEvents::Subscription MessageEvents::Add(CallbackEntry entry) {
  std::lock_guard<std::mutex> lock(state_->mutex);
  entry.id = state_->next_id++;
  size_t id = entry.id;
  state_->callbacks.push_back(std::move(entry));
  return Subscription(state_, id);
}

std::vector<MessageEvents::CallbackEntry> MessageEvents::Snapshot() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->callbacks;
}

MessageEvents::Subscription MessageEvents::SubscribeMessage(message::MessageKind kind,
                                                            MessageCallback callback) {
  CallbackEntry entry{};
  entry.kind = kind;
  entry.message = std::move(callback);
  return Add(std::move(entry));
}

MessageEvents::Subscription
MessageEvents::SubscribePeerConnected(PeerConnectedCallback callback) {
  CallbackEntry entry{};
  entry.peer_connected = std::move(callback);
  return Add(std::move(entry));
}

MessageEvents::Subscription
MessageEvents::SubscribePeerDisconnected(PeerDisconnectedCallback callback) {
  CallbackEntry entry{};
  entry.peer_disconnected = std::move(callback);
  return Add(std::move(entry));
}

void MessageEvents::NotifyMessage(const IncomingMessage &msg) {
  for (auto &entry : Snapshot()) {
    if (!entry.message || entry.kind != msg.kind)
      continue;
    try {
      entry.message(msg);
    } catch (const std::exception &e) {
      LOG_ERROR("{} handler threw for message from {}: {}",
                message::MessageKindAsString(msg.kind), msg.peer_id, e.what());
    }
  }
}

void MessageEvents::NotifyPeerConnected(const std::string &peer_id,
                                        const std::string &username,
                                        network::TransportKind kind, bool inbound) {
  for (auto &entry : Snapshot()) {
    if (!entry.peer_connected)
      continue;
    try {
      entry.peer_connected(peer_id, username, kind, inbound);
    } catch (const std::exception &e) {
      LOG_ERROR("peer-connected handler threw for {}: {}", peer_id, e.what());
    }
  }
}

void MessageEvents::NotifyPeerDisconnected(const std::string &peer_id,
                                           const std::string &reason) {
  for (auto &entry : Snapshot()) {
    if (!entry.peer_disconnected)
      continue;
    try {
      entry.peer_disconnected(peer_id, reason);
    } catch (const std::exception &e) {
      LOG_ERROR("peer-disconnected handler threw for {}: {}", peer_id, e.what());
    }
  }
}

size_t MessageEvents::SubscriberCount() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->callbacks.size();
}

} // namespace whisperlink
