#pragma once

#include <google/protobuf/message.h>
#include <google/protobuf/util/json_util.h>

#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/key_value_store.hpp"
#include "internal/util/time.hpp"

namespace hacktracker::cache {

// Parses protobuf JSON into M. Throws std::runtime_error on bad input.
template <typename M>
M ParseMessage(const std::string& json) {
  M message;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &message, options);
  if (!status.ok()) {
    throw std::runtime_error("invalid " + message.GetTypeName() + " json: " + std::string(status.message()));
  }
  return message;
}

std::string ToJson(const google::protobuf::Message& message);

/*
  Versioned, TTL'd JSON cache over a KeyValueStore.

  Every value is wrapped in a CacheEntry {version, timestamp, ttl_seconds,
  data}. A read that finds an unparsable entry, a version other than the
  running schema version, an entry older than its TTL, or a payload the
  decoder rejects evicts the key and reports a miss. Callers never see
  these cases as errors.

  Writes are best effort: a failed write is logged, the in-memory state
  stays authoritative.
*/
class PersistentCacheStore {
 public:
  PersistentCacheStore(std::shared_ptr<db::KeyValueStore> store, int schema_version, std::chrono::seconds default_ttl,
                       util::NowFn now = util::Now);

  // Purges everything when the stored schema version differs from ours.
  // Call once at process start.
  void CheckSchemaVersion();

  void SetJson(const std::string& key, const google::protobuf::Message& value,
               std::optional<std::chrono::seconds> ttl = std::nullopt);

  template <typename T>
  std::optional<T> GetJson(const std::string& key, const std::function<T(const std::string& data_json)>& decode) {
    auto data = ReadLive(key);
    if (!data) return std::nullopt;

    try {
      return decode(*data);
    } catch (const std::exception& e) {
      Evict(key, "decode failed", e.what());
      return std::nullopt;
    }
  }

  template <typename M>
  std::optional<M> GetMessage(const std::string& key) {
    return GetJson<M>(key, [](const std::string& json) { return ParseMessage<M>(json); });
  }

  void Remove(const std::string& key);
  void Clear(const std::string& key) {
    Remove(key);
  }

  // Drops every entry, then re-records the schema version.
  void ClearAll();

  // Every stored key, the version marker included.
  std::vector<std::string> Keys() {
    return store_->Keys();
  }

  int schema_version() const {
    return schema_version_;
  }
  std::chrono::seconds default_ttl() const {
    return default_ttl_;
  }

 private:
  // JSON of the entry's data when the entry is live.
  std::optional<std::string> ReadLive(const std::string& key);

  void Evict(const std::string& key, const char* reason, const std::string& detail = {});
  void RecordVersion();

  std::shared_ptr<db::KeyValueStore> store_;
  int                                schema_version_;
  std::chrono::seconds               default_ttl_;
  util::NowFn                        now_;
};

} // namespace hacktracker::cache
