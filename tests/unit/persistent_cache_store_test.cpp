#include "internal/cache/persistent_cache_store.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/message_differencer.h>

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "hacktracker/cache/v1/cache_entry.pb.h"
#include "internal/cache/cache_keys.hpp"
#include "internal/db/memory/memory_kv_store.hpp"
#include "tests/support/fake_scoring_api.hpp"

namespace {

using hacktracker::cache::PersistentCacheStore;
using hacktracker::db::memory::MemoryKeyValueStore;
using hacktracker::testing::MakeAtBat;
using hacktracker::testing::ManualClock;
using namespace hacktracker::scoring::v1;
using namespace std::chrono_literals;

namespace keys = hacktracker::cache::keys;

AtBatList SampleLog() {
  AtBatList list;
  *list.add_at_bats() = MakeAtBat("a", "K", 10, 1);
  *list.add_at_bats() = MakeAtBat("b", "1B", 20, 2);
  return list;
}

bool Contains(MemoryKeyValueStore& store, const std::string& key) {
  return store.GetString(key).has_value();
}

void TestRoundTripWithinTtl() {
  ManualClock          clock;
  auto                 store = std::make_shared<MemoryKeyValueStore>();
  PersistentCacheStore cache(store, 2, 24h, clock.fn());

  cache.SetJson(keys::AtBats("g1"), SampleLog());
  clock.Advance(23h);

  auto loaded = cache.GetMessage<AtBatList>(keys::AtBats("g1"));
  assert(loaded.has_value());
  assert(google::protobuf::util::MessageDifferencer::Equals(*loaded, SampleLog()));
}

void TestExpiredEntryIsEvicted() {
  ManualClock          clock;
  auto                 store = std::make_shared<MemoryKeyValueStore>();
  PersistentCacheStore cache(store, 2, 24h, clock.fn());

  cache.SetJson("short", SampleLog(), 10s);
  clock.Advance(10s);
  assert(cache.GetMessage<AtBatList>("short").has_value());

  clock.Advance(1s);
  assert(!cache.GetMessage<AtBatList>("short").has_value());
  assert(!Contains(*store, "short"));
}

void TestVersionMismatchIsEvicted() {
  ManualClock clock;
  auto        store = std::make_shared<MemoryKeyValueStore>();

  PersistentCacheStore old_cache(store, 1, 24h, clock.fn());
  old_cache.SetJson("k", SampleLog());

  PersistentCacheStore new_cache(store, 2, 24h, clock.fn());
  assert(!new_cache.GetMessage<AtBatList>("k").has_value());
  assert(!Contains(*store, "k"));
}

void TestCorruptEntriesAreEvicted() {
  ManualClock          clock;
  auto                 store = std::make_shared<MemoryKeyValueStore>();
  PersistentCacheStore cache(store, 2, 24h, clock.fn());

  store->SetString("garbage", "{not json");
  assert(!cache.GetMessage<AtBatList>("garbage").has_value());
  assert(!Contains(*store, "garbage"));

  // envelope fine, payload is not an AtBatList
  hacktracker::cache::v1::CacheEntry entry;
  entry.set_version(2);
  *entry.mutable_timestamp() = hacktracker::util::ToProto(clock.Now());
  entry.set_ttl_seconds(60);
  *entry.mutable_data() = hacktracker::cache::ParseMessage<google::protobuf::Value>(R"({"bogus": 1})");
  store->SetString("wrong_shape", hacktracker::cache::ToJson(entry));

  assert(!cache.GetMessage<AtBatList>("wrong_shape").has_value());
  assert(!Contains(*store, "wrong_shape"));
}

void TestDecoderFailureEvicts() {
  ManualClock          clock;
  auto                 store = std::make_shared<MemoryKeyValueStore>();
  PersistentCacheStore cache(store, 2, 24h, clock.fn());

  cache.SetJson("k", SampleLog());
  auto value = cache.GetJson<int>("k", [](const std::string&) -> int { throw std::runtime_error("nope"); });
  assert(!value.has_value());
  assert(!Contains(*store, "k"));
}

void TestMissingKeyIsPlainMiss() {
  ManualClock          clock;
  auto                 store = std::make_shared<MemoryKeyValueStore>();
  PersistentCacheStore cache(store, 2, 24h, clock.fn());

  store->SetString("other", "x");
  assert(!cache.GetMessage<AtBatList>("missing").has_value());
  assert(store->Keys().size() == 1);
}

void TestSchemaVersionCheckPurgesOnChange() {
  ManualClock clock;
  auto        store = std::make_shared<MemoryKeyValueStore>();

  PersistentCacheStore v1(store, 1, 24h, clock.fn());
  v1.CheckSchemaVersion();
  v1.SetJson(keys::AtBats("g1"), SampleLog());
  v1.SetJson(keys::Games("t1"), GameList{});

  // same version: nothing is touched
  PersistentCacheStore again(store, 1, 24h, clock.fn());
  again.CheckSchemaVersion();
  assert(Contains(*store, keys::AtBats("g1")));

  PersistentCacheStore v2(store, 2, 24h, clock.fn());
  v2.CheckSchemaVersion();
  assert(!Contains(*store, keys::AtBats("g1")));
  assert(!Contains(*store, keys::Games("t1")));
  assert(store->GetString(keys::kCacheVersion).value() == "2");
}

void TestClearAllKeepsVersionMarker() {
  ManualClock          clock;
  auto                 store = std::make_shared<MemoryKeyValueStore>();
  PersistentCacheStore cache(store, 3, 24h, clock.fn());

  cache.SetJson("a", SampleLog());
  cache.SetJson("b", SampleLog());
  cache.ClearAll();

  const auto remaining = cache.Keys();
  assert(remaining.size() == 1);
  assert(remaining[0] == keys::kCacheVersion);
  assert(store->GetString(keys::kCacheVersion).value() == "3");
}

void TestRemoveDropsSingleKey() {
  ManualClock          clock;
  auto                 store = std::make_shared<MemoryKeyValueStore>();
  PersistentCacheStore cache(store, 2, 24h, clock.fn());

  cache.SetJson("a", SampleLog());
  cache.SetJson("b", SampleLog());
  cache.Remove("a");
  assert(!cache.GetMessage<AtBatList>("a").has_value());
  assert(cache.GetMessage<AtBatList>("b").has_value());
}

} // namespace

int main() {
  TestRoundTripWithinTtl();
  TestExpiredEntryIsEvicted();
  TestVersionMismatchIsEvicted();
  TestCorruptEntriesAreEvicted();
  TestDecoderFailureEvicts();
  TestMissingKeyIsPlainMiss();
  TestSchemaVersionCheckPurgesOnChange();
  TestClearAllKeepsVersionMarker();
  TestRemoveDropsSingleKey();

  std::cout << "hacktracker_unit_persistent_cache_store: pass\n";
  return 0;
}
