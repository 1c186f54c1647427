// Copyright (c) 2025 The WhisperLink developers
// Distributed under the MIT software license

#include "network/peer_directory.hpp"
#include "crypto/crypto_box.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <nlohmann/json.hpp>
#include <openssl/rand.h>

namespace whisperlink {
namespace network {

namespace {

using json = nlohmann::json;

json ContactToJson(const Contact &c) {
  json j;
  j["user_id"] = c.user_id;
  j["username"] = c.username;
  j["public_key"] = c.public_key;
  j["connection_type"] = ContactConnectionTypeAsString(c.connection_type);
  j["address"] = c.address.empty() ? json(nullptr) : json(c.address);
  j["tunnel_url"] = c.tunnel_url.empty() ? json(nullptr) : json(c.tunnel_url);
  j["added_at"] = c.added_at;
  j["last_seen"] = c.last_seen.empty() ? json(nullptr) : json(c.last_seen);
  return j;
}

// Optional string field: absent or null -> ""
std::string OptionalString(const json &obj, const char *key) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null())
    return {};
  return it->get<std::string>();
}

std::optional<Contact> ContactFromJson(const json &j) {
  if (!j.is_object())
    return std::nullopt;
  for (const char *key : {"user_id", "username", "public_key"}) {
    if (!j.contains(key) || !j[key].is_string() || j[key].get<std::string>().empty())
      return std::nullopt;
  }
  Contact c;
  c.user_id = j["user_id"].get<std::string>();
  c.username = j["username"].get<std::string>();
  c.public_key = j["public_key"].get<std::string>();
  c.connection_type = ParseContactConnectionType(OptionalString(j, "connection_type"));
  c.address = OptionalString(j, "address");
  c.tunnel_url = OptionalString(j, "tunnel_url");
  c.added_at = OptionalString(j, "added_at");
  c.last_seen = OptionalString(j, "last_seen");
  return c;
}

} // namespace

// ============================================================================
// MemoryContactDirectory
// ============================================================================

MemoryContactDirectory::MemoryContactDirectory(std::string persist_path)
    : persist_path_(std::move(persist_path)) {}

std::optional<Contact> MemoryContactDirectory::GetContact(const std::string &user_id) const {
  std::optional<Contact> result;
  contacts_.Read(user_id, [&](const Contact &c) { result = c; });
  return result;
}

bool MemoryContactDirectory::AddContact(const Contact &contact) {
  if (contact.user_id.empty())
    return false;
  Contact stored = contact;
  if (stored.added_at.empty())
    stored.added_at = util::GetTimeISO8601();
  if (!contacts_.TryInsert(stored.user_id, stored))
    return false;
  LOG_DEBUG("Added contact {} ({})", stored.username, stored.user_id);
  PersistIfConfigured();
  return true;
}

void MemoryContactDirectory::UpdateLastSeen(const std::string &user_id) {
  std::string now = util::GetTimeISO8601();
  if (contacts_.Modify(user_id, [&](Contact &c) { c.last_seen = now; })) {
    PersistIfConfigured();
  }
}

std::vector<Contact> MemoryContactDirectory::ListContacts() const {
  std::vector<Contact> result;
  result.reserve(contacts_.Size());
  contacts_.ForEach([&](const std::string &, const Contact &c) { result.push_back(c); });
  return result;
}

bool MemoryContactDirectory::RemoveContact(const std::string &user_id) {
  if (!contacts_.Erase(user_id))
    return false;
  PersistIfConfigured();
  return true;
}

void MemoryContactDirectory::PersistIfConfigured() const {
  if (persist_path_.empty())
    return;
  if (!Save()) {
    LOG_WARN("Contact change not persisted to {}", persist_path_);
  }
}

bool MemoryContactDirectory::Save() const {
  if (persist_path_.empty())
    return false;

  std::lock_guard<std::mutex> lock(save_mutex_);
  try {
    json root = json::object();
    contacts_.ForEach([&](const std::string &id, const Contact &c) { root[id] = ContactToJson(c); });

    std::string data = root.dump(2);
    if (!util::atomic_write_file(persist_path_, data, 0600)) {
      LOG_ERROR("Failed to save contacts to {}", persist_path_);
      return false;
    }
    return true;
  } catch (const json::exception &e) {
    LOG_ERROR("Failed to serialize contacts: {}", e.what());
    return false;
  }
}

bool MemoryContactDirectory::Load() {
  if (persist_path_.empty())
    return false;

  contacts_.Clear();
  auto data = util::read_file_string(persist_path_);
  if (!data) {
    LOG_DEBUG("No contacts file at {}", persist_path_);
    return true;
  }

  json root;
  try {
    root = json::parse(*data);
  } catch (const json::exception &e) {
    LOG_WARN("Failed to parse contacts file {}: {}", persist_path_, e.what());
    return false;
  }
  if (!root.is_object()) {
    LOG_WARN("Invalid contacts file format in {}", persist_path_);
    return false;
  }

  size_t loaded = 0;
  for (auto it = root.begin(); it != root.end(); ++it) {
    std::optional<Contact> contact;
    try {
      contact = ContactFromJson(it.value());
    } catch (const json::exception &e) {
      LOG_WARN("Skipping contact {}: {}", it.key(), e.what());
      continue;
    }
    if (!contact) {
      LOG_WARN("Skipping malformed contact entry {}", it.key());
      continue;
    }
    contacts_.Insert(contact->user_id, *contact);
    ++loaded;
  }
  LOG_INFO("Loaded {} contacts from {}", loaded, persist_path_);
  return true;
}

// ============================================================================
// StaticIdentityProvider
// ============================================================================

StaticIdentityProvider::StaticIdentityProvider(LocalIdentity identity)
    : identity_(std::move(identity)) {}

std::optional<LocalIdentity> StaticIdentityProvider::GetCurrentUser() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return identity_;
}

void StaticIdentityProvider::SetIdentity(LocalIdentity identity) {
  std::lock_guard<std::mutex> lock(mutex_);
  identity_ = std::move(identity);
}

void StaticIdentityProvider::Logout() {
  std::lock_guard<std::mutex> lock(mutex_);
  identity_.reset();
}

// ============================================================================
// identity.json
// ============================================================================

std::optional<LocalIdentity> LoadIdentity(const std::string &path) {
  auto data = util::read_file_string(path);
  if (!data) {
    LOG_DEBUG("No identity file at {}", path);
    return std::nullopt;
  }

  try {
    json root = json::parse(*data);
    LocalIdentity id;
    id.user_id = root.at("user_id").get<std::string>();
    id.username = root.at("username").get<std::string>();
    id.public_key = root.at("public_key").get<std::string>();
    id.private_key = root.at("private_key").get<std::string>();

    if (id.user_id.empty() || id.username.empty()) {
      LOG_ERROR("Identity file {} has empty user_id or username", path);
      return std::nullopt;
    }
    if (!crypto::CryptoBox::IsValidKey(id.public_key) ||
        !crypto::CryptoBox::IsValidKey(id.private_key)) {
      LOG_ERROR("Identity file {} holds invalid key material", path);
      return std::nullopt;
    }
    auto derived = crypto::CryptoBox::DerivePublicKey(id.private_key);
    if (!derived || *derived != id.public_key) {
      LOG_ERROR("Identity file {}: public key does not match private key", path);
      return std::nullopt;
    }
    return id;
  } catch (const json::exception &e) {
    LOG_ERROR("Failed to parse identity file {}: {}", path, e.what());
    return std::nullopt;
  }
}

bool SaveIdentity(const std::string &path, const LocalIdentity &identity) {
  json root;
  root["user_id"] = identity.user_id;
  root["username"] = identity.username;
  root["public_key"] = identity.public_key;
  root["private_key"] = identity.private_key;

  // Private key material: owner-only
  if (!util::atomic_write_file(path, root.dump(2), 0600)) {
    LOG_ERROR("Failed to write identity file {}", path);
    return false;
  }
  return true;
}

std::optional<LocalIdentity> GenerateIdentity(const std::string &username) {
  if (username.empty())
    return std::nullopt;

  std::vector<uint8_t> raw_id(16);
  if (RAND_bytes(raw_id.data(), static_cast<int>(raw_id.size())) != 1) {
    LOG_CRYPTO_WARN("RAND_bytes failed while generating user id");
    return std::nullopt;
  }
  auto keys = crypto::CryptoBox::GenerateKeyPair();
  if (!keys)
    return std::nullopt;

  LocalIdentity id;
  id.user_id = crypto::HexEncode(raw_id);
  id.username = username;
  id.public_key = keys->public_key;
  id.private_key = keys->private_key;
  return id;
}

} // namespace network
} // namespace whisperlink
