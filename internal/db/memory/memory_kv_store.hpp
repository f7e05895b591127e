#pragma once

#include <mutex>
#include <unordered_map>

#include "internal/db/api/key_value_store.hpp"

namespace hacktracker::db::memory {

class MemoryKeyValueStore final : public db::KeyValueStore {
 public:
  std::optional<std::string> GetString(const std::string& key) override;
  Result                     SetString(const std::string& key, const std::string& value) override;
  Result                     Remove(const std::string& key) override;
  Result                     Clear() override;
  std::vector<std::string>   Keys() override;

 private:
  std::mutex                                   mutex_;
  std::unordered_map<std::string, std::string> values_;
};

} // namespace hacktracker::db::memory
