#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace whisperlink {
namespace util {

/**
 * ThreadSafeMap - one mutex around a std::map / std::unordered_map
 *
 * Backs the connection registry (peer_id -> Connection), the contact
 * directory and the set of handshaking sessions. Every call takes the lock
 * once, so check-and-act sequences that must not interleave are expressed as
 * a single call:
 *
 *   registry.TryInsert(peer_id, conn);               // first registration wins
 *   registry.TakeIf(peer_id, [&](const Connection &c) {
 *     return c.session_id == sid;                    // only our own entry
 *   });
 *   registry.TakeAll();                              // shutdown
 *
 * Callbacks run under the lock: keep them short and never call back into the
 * same map. Values are returned by copy; no iterators escape.
 */
template <typename Key, typename Value,
          template <typename...> class MapType = std::unordered_map>
class ThreadSafeMap {
public:
  ThreadSafeMap() = default;

  ThreadSafeMap(const ThreadSafeMap &) = delete;
  ThreadSafeMap &operator=(const ThreadSafeMap &) = delete;

  // Insert or overwrite; true if the key was new
  bool Insert(const Key &key, const Value &value) {
    std::lock_guard<std::mutex> lock(mutex_);
    return map_.insert_or_assign(key, value).second;
  }

  // Insert only if absent; false leaves the existing value untouched
  bool TryInsert(const Key &key, const Value &value) {
    std::lock_guard<std::mutex> lock(mutex_);
    return map_.emplace(key, value).second;
  }

  // reader(const Value&) under the lock; false if absent
  template <typename Func> bool Read(const Key &key, Func &&reader) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = map_.find(key);
    if (it == map_.end())
      return false;
    reader(it->second);
    return true;
  }

  // modifier(Value&) under the lock; false if absent
  template <typename Func> bool Modify(const Key &key, Func &&modifier) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = map_.find(key);
    if (it == map_.end())
      return false;
    modifier(it->second);
    return true;
  }

  bool Contains(const Key &key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return map_.find(key) != map_.end();
  }

  bool Erase(const Key &key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return map_.erase(key) > 0;
  }

  std::optional<Value> Take(const Key &key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return TakeLocked(map_.find(key));
  }

  // Remove and return the value only if predicate(const Value&) holds
  template <typename Pred> std::optional<Value> TakeIf(const Key &key, Pred &&predicate) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = map_.find(key);
    if (it == map_.end() || !predicate(it->second))
      return std::nullopt;
    return TakeLocked(it);
  }

  // Empty the map in one step and hand back what it held
  std::vector<std::pair<Key, Value>> TakeAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::pair<Key, Value>> out;
    out.reserve(map_.size());
    for (auto &entry : map_)
      out.emplace_back(entry.first, std::move(entry.second));
    map_.clear();
    return out;
  }

  void Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    map_.clear();
  }

  size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return map_.size();
  }

  bool Empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return map_.empty();
  }

  // callback(const Key&, const Value&) for every entry, under the lock
  template <typename Func> void ForEach(Func &&callback) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &[key, value] : map_)
      callback(key, value);
  }

  std::vector<std::pair<Key, Value>> GetAll() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::pair<Key, Value>>(map_.begin(), map_.end());
  }

  std::vector<Key> GetKeys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Key> keys;
    keys.reserve(map_.size());
    for (const auto &entry : map_)
      keys.push_back(entry.first);
    return keys;
  }

private:
  std::optional<Value> TakeLocked(typename MapType<Key, Value>::iterator it) {
    if (it == map_.end())
      return std::nullopt;
    std::optional<Value> value(std::move(it->second));
    map_.erase(it);
    return value;
  }

  mutable std::mutex mutex_;
  MapType<Key, Value> map_;
};

} // namespace util
} // namespace whisperlink
