#include "persistent_cache_store.hpp"

#include <google/protobuf/struct.pb.h>

#include "cache_keys.hpp"
#include "hacktracker/cache/v1/cache_entry.pb.h"
#include "internal/observability/logging.hpp"

namespace hacktracker::cache {

using hacktracker::cache::v1::CacheEntry;
using observability::IntField;
using observability::StringField;

std::string ToJson(const google::protobuf::Message& message) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) {
    throw std::runtime_error("failed to serialize " + message.GetTypeName() + ": " + std::string(status.message()));
  }
  return json;
}

PersistentCacheStore::PersistentCacheStore(std::shared_ptr<db::KeyValueStore> store, int schema_version,
                                           std::chrono::seconds default_ttl, util::NowFn now)
    : store_(std::move(store)), schema_version_(schema_version), default_ttl_(default_ttl), now_(std::move(now)) {
}

void PersistentCacheStore::RecordVersion() {
  auto result = store_->SetString(keys::kCacheVersion, std::to_string(schema_version_));
  if (!result) {
    HACKTRACKER_LOG_WARN("cache version write failed", {StringField("error", result.message)});
  }
}

void PersistentCacheStore::CheckSchemaVersion() {
  const auto stored = store_->GetString(keys::kCacheVersion);
  if (stored && *stored == std::to_string(schema_version_)) {
    return;
  }

  HACKTRACKER_LOG_INFO("cache schema changed, purging",
                       {StringField("stored", stored.value_or("<none>")), IntField("current", schema_version_)});
  ClearAll();
}

void PersistentCacheStore::SetJson(const std::string& key, const google::protobuf::Message& value,
                                   std::optional<std::chrono::seconds> ttl) {
  CacheEntry entry;
  entry.set_version(schema_version_);
  *entry.mutable_timestamp() = util::ToProto(now_());
  entry.set_ttl_seconds(ttl.value_or(default_ttl_).count());

  *entry.mutable_data() = ParseMessage<google::protobuf::Value>(ToJson(value));

  auto result = store_->SetString(key, ToJson(entry));
  if (!result) {
    HACKTRACKER_LOG_WARN("cache write failed",
                         {StringField("key", key), StringField("code", db::ToString(result.code)), StringField("error", result.message)});
  }
}

std::optional<std::string> PersistentCacheStore::ReadLive(const std::string& key) {
  const auto raw = store_->GetString(key);
  if (!raw) return std::nullopt;

  CacheEntry entry;
  try {
    entry = ParseMessage<CacheEntry>(*raw);
  } catch (const std::exception& e) {
    Evict(key, "corrupt entry", e.what());
    return std::nullopt;
  }

  if (entry.version() != schema_version_) {
    Evict(key, "version mismatch", std::to_string(entry.version()));
    return std::nullopt;
  }

  if (!entry.has_timestamp() || !entry.has_data()) {
    Evict(key, "corrupt entry", "missing timestamp or data");
    return std::nullopt;
  }

  const auto age = now_() - util::FromProto(entry.timestamp());
  if (age > std::chrono::seconds(entry.ttl_seconds())) {
    Evict(key, "expired");
    return std::nullopt;
  }

  try {
    return ToJson(entry.data());
  } catch (const std::exception& e) {
    Evict(key, "corrupt entry", e.what());
    return std::nullopt;
  }
}

void PersistentCacheStore::Evict(const std::string& key, const char* reason, const std::string& detail) {
  HACKTRACKER_LOG_DEBUG("cache entry evicted", {StringField("key", key), StringField("reason", reason), StringField("detail", detail)});
  Remove(key);
}

void PersistentCacheStore::Remove(const std::string& key) {
  auto result = store_->Remove(key);
  if (!result) {
    HACKTRACKER_LOG_WARN("cache remove failed", {StringField("key", key), StringField("error", result.message)});
  }
}

void PersistentCacheStore::ClearAll() {
  auto result = store_->Clear();
  if (!result) {
    HACKTRACKER_LOG_WARN("cache clear failed", {StringField("error", result.message)});
  }
  RecordVersion();
}

} // namespace hacktracker::cache
