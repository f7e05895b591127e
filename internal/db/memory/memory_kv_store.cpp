#include "memory_kv_store.hpp"

#include <algorithm>

namespace hacktracker::db::memory {

std::optional<std::string> MemoryKeyValueStore::GetString(const std::string& key) {
  std::lock_guard lock(mutex_);

  auto it = values_.find(key);
  if (it == values_.end()) return std::nullopt;
  return it->second;
}

Result MemoryKeyValueStore::SetString(const std::string& key, const std::string& value) {
  std::lock_guard lock(mutex_);
  values_[key] = value;
  return Result::Ok();
}

Result MemoryKeyValueStore::Remove(const std::string& key) {
  std::lock_guard lock(mutex_);
  values_.erase(key);
  return Result::Ok();
}

Result MemoryKeyValueStore::Clear() {
  std::lock_guard lock(mutex_);
  values_.clear();
  return Result::Ok();
}

std::vector<std::string> MemoryKeyValueStore::Keys() {
  std::lock_guard lock(mutex_);

  std::vector<std::string> keys;
  keys.reserve(values_.size());
  for (const auto& [key, _] : values_) keys.push_back(key);
  std::sort(keys.begin(), keys.end());
  return keys;
}

} // namespace hacktracker::db::memory
