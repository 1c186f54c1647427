// Copyright (c) 2025 The WhisperLink developers
// Distributed under the MIT software license

#pragma once

/*
 Peer directory - contacts and the local identity as seen by the connection layer

 The connection layer only consumes these through ContactDirectory and
 IdentityProvider. It reads contacts to dial, stamps last_seen after a
 successful handshake, and (trust-on-first-use) adds unknown inbound peers.

 MemoryContactDirectory is the node's implementation: an in-memory map that,
 when given a path, persists every change to contacts.json with
 util::atomic_write_file. File format (keyed by user_id):

   {
     "<user_id>": {
       "user_id": "...", "username": "...", "public_key": "<hex>",
       "connection_type": "direct" | "tunnel",
       "address": "host:port" | null, "tunnel_url": "https://..." | null,
       "added_at": "<ISO-8601>", "last_seen": "<ISO-8601>" | null
     }
   }

 identity.json holds {"user_id", "username", "public_key", "private_key"} and
 is written 0600.
*/

#include "network/connection_types.hpp"
#include "util/threadsafe_containers.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace whisperlink {
namespace network {

struct Contact {
  std::string user_id;
  std::string username;
  std::string public_key; // lowercase hex
  ContactConnectionType connection_type{ContactConnectionType::DIRECT};
  std::string address;    // host:port for DIRECT
  std::string tunnel_url; // https://... for TUNNEL
  std::string added_at;
  std::string last_seen; // empty = never
};

struct LocalIdentity {
  std::string user_id;
  std::string username;
  std::string public_key;
  std::string private_key;
};

class ContactDirectory {
public:
  virtual ~ContactDirectory() = default;

  virtual std::optional<Contact> GetContact(const std::string &user_id) const = 0;
  // false if user_id is already known
  virtual bool AddContact(const Contact &contact) = 0;
  virtual void UpdateLastSeen(const std::string &user_id) = 0;
  virtual std::vector<Contact> ListContacts() const = 0;
};

class IdentityProvider {
public:
  virtual ~IdentityProvider() = default;

  // nullopt while nobody is logged in
  virtual std::optional<LocalIdentity> GetCurrentUser() const = 0;
};

class MemoryContactDirectory : public ContactDirectory {
public:
  // Empty path = memory only
  explicit MemoryContactDirectory(std::string persist_path = "");

  std::optional<Contact> GetContact(const std::string &user_id) const override;
  bool AddContact(const Contact &contact) override;
  void UpdateLastSeen(const std::string &user_id) override;
  std::vector<Contact> ListContacts() const override;

  bool RemoveContact(const std::string &user_id);

  // Replace the in-memory set with the file's contents. A missing file is an
  // empty directory; a corrupt file is logged and leaves the directory empty.
  bool Load();
  bool Save() const;

private:
  void PersistIfConfigured() const;

  std::string persist_path_;
  util::ThreadSafeMap<std::string, Contact, std::map> contacts_;
  // Serializes file writes
  mutable std::mutex save_mutex_;
};

class StaticIdentityProvider : public IdentityProvider {
public:
  StaticIdentityProvider() = default;
  explicit StaticIdentityProvider(LocalIdentity identity);

  std::optional<LocalIdentity> GetCurrentUser() const override;

  void SetIdentity(LocalIdentity identity);
  void Logout();

private:
  mutable std::mutex mutex_;
  std::optional<LocalIdentity> identity_;
};

// identity.json helpers
std::optional<LocalIdentity> LoadIdentity(const std::string &path);
bool SaveIdentity(const std::string &path, const LocalIdentity &identity);

// Fresh identity: random 128-bit hex user_id plus a new X25519 key pair
std::optional<LocalIdentity> GenerateIdentity(const std::string &username);

} // namespace network
} // namespace whisperlink
