#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"

namespace hacktracker::db {

/*
  Local string key/value primitive the persistent cache sits on.

  Semantics guaranteed for ALL backends:

  - GetString returns the last value set for the key, or nullopt
  - SetString overwrites
  - Remove of a missing key is OK
  - no cross-key transactions
*/
class KeyValueStore {
 public:
  virtual ~KeyValueStore() = default;

  virtual std::optional<std::string> GetString(const std::string& key) = 0;

  virtual Result SetString(const std::string& key, const std::string& value) = 0;

  virtual Result Remove(const std::string& key) = 0;

  virtual Result Clear() = 0;

  virtual std::vector<std::string> Keys() = 0;
};

} // namespace hacktracker::db
