#include "internal/game_state/game_state_cache.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/memory/memory_kv_store.hpp"
#include "tests/support/fake_scoring_api.hpp"

namespace {

using hacktracker::cache::PersistentCacheStore;
using hacktracker::collection::CollectionRegistry;
using hacktracker::db::memory::MemoryKeyValueStore;
using hacktracker::game_state::GameStateCache;
using hacktracker::game_state::GameStateKey;
using hacktracker::game_state::GameStateWatch;
using hacktracker::mutation::MutationOutcome;
using hacktracker::mutation::MutationStatus;
using hacktracker::runtime::EventLoop;
using hacktracker::testing::FakeScoringApi;
using hacktracker::testing::MakeAtBat;
using hacktracker::testing::MakeCreate;
using hacktracker::testing::MakeGame;
using hacktracker::testing::ManualClock;
using hacktracker::testing::RecordingMessenger;
using hacktracker::testing::Slot;
using namespace hacktracker::scoring::v1;
using namespace std::chrono_literals;

using State = GameStateCache::Value::State;

const GameStateKey kKey{"g1", "t1"};

struct Fixture {
  ManualClock                         clock;
  std::shared_ptr<FakeScoringApi>     api      = std::make_shared<FakeScoringApi>(clock.fn());
  std::shared_ptr<EventLoop>          loop     = std::make_shared<EventLoop>(clock.fn());
  std::shared_ptr<RecordingMessenger> messages = std::make_shared<RecordingMessenger>();
  std::shared_ptr<CollectionRegistry> registry = std::make_shared<CollectionRegistry>(
      api, std::make_shared<PersistentCacheStore>(std::make_shared<MemoryKeyValueStore>(), 2, 24h, clock.fn()), messages, clock.fn());
  std::shared_ptr<GameStateCache> cache = GameStateCache::Create(registry, loop, 300s);

  std::vector<State> seen;

  Fixture() {
    api->at_bats["g1"] = {MakeAtBat("a", "K", 10), MakeAtBat("b", "1B", 20), MakeAtBat("c", "GO", 30)};
    api->games["t1"]   = {MakeGame("g1", "t1", {Slot("p1", 1), Slot("p2", 2), Slot("p3", 3)})};
  }

  GameStateWatch Watch() {
    return cache->Watch(kKey, [this](const State&, const State& next) { seen.push_back(next); });
  }

  hacktracker::scoring::InGameState Current() const {
    return cache->Current(kKey)->value();
  }
};

void TestFirstWatchLoadsThenComputes() {
  Fixture f;
  f.api->deferred = true;

  auto watch = f.Watch();
  assert(f.seen.size() == 1 && f.seen[0].IsLoading());
  assert(f.api->PendingCount() == 2);

  f.api->SucceedNext(); // at-bats
  assert(f.cache->Current(kKey)->IsLoading());

  f.api->SucceedNext(); // games
  assert(f.seen.back().HasData());
  assert(f.Current().inning() == 1);
  assert(f.Current().outs() == 2);
  assert(f.Current().batter_player_id() == "p1");
}

void TestRecordAtBatStampsStateAndRecomputesOnLoop() {
  Fixture f;
  auto    watch = f.Watch();
  assert(f.seen.back().HasData());

  std::optional<MutationOutcome<AtBat>> outcome;
  f.cache->RecordAtBat(kKey, MakeCreate("", "p1", "K"), [&](MutationOutcome<AtBat> o) { outcome = o; });
  assert(outcome && outcome->ok());

  const auto& stored = f.api->at_bats["g1"].back();
  assert(stored.game_id() == "g1");
  assert(stored.inning() == 1);
  assert(stored.outs() == 2);

  // the collection changed, the derived state follows on the next loop turn
  assert(f.Current().outs() == 2);
  f.loop->RunUntilIdle();
  assert(f.Current().inning() == 2);
  assert(f.Current().outs() == 0);
  assert(f.Current().batter_player_id() == "p2");
}

void TestRecordAtBatWithoutWatchComputesSynchronously() {
  Fixture f;
  f.registry->AtBats("g1")->Load();
  f.registry->Games("t1")->Load();

  f.cache->RecordAtBat(kKey, MakeCreate("g1", "p1", "1B"));
  assert(f.api->at_bats["g1"].back().outs() == 2);
  assert(!f.cache->IsLive(kKey));
}

void TestRecordAtBatWithoutStateIsRefused() {
  Fixture f;
  f.api->games["t1"].clear();

  std::optional<MutationOutcome<AtBat>> outcome;
  f.cache->RecordAtBat(kKey, MakeCreate("g1", "p1", "1B"), [&](MutationOutcome<AtBat> o) { outcome = o; });
  assert(outcome && outcome->status == MutationStatus::kSkipped);
  assert(outcome->error_message == "Game state not available");
  assert(f.api->create_calls == 0);
}

void TestRecomputeFailureKeepsLastGoodState() {
  Fixture f;
  auto       watch  = f.Watch();
  const auto before = f.Current();

  f.api->at_bats["g1"].push_back(MakeAtBat("bad", "  ", 40));
  f.registry->AtBats("g1")->Refresh();
  f.loop->RunUntilIdle();

  assert(f.cache->Current(kKey)->HasData());
  assert(f.Current() == before);
}

void TestInvalidLineupStaysLoading() {
  Fixture f;
  f.api->games["t1"] = {MakeGame("g1", "t1", {})};

  auto watch = f.Watch();
  assert(f.cache->Current(kKey)->IsLoading());
  assert(f.seen.size() == 1);
}

void TestKeepAliveRetainsNodeUntilExpiry() {
  Fixture f;
  {
    auto watch = f.Watch();
  }
  assert(f.cache->IsLive(kKey));
  assert(f.loop->PendingTimers() == 1);

  f.clock.Advance(299s);
  f.loop->RunUntilIdle();
  assert(f.cache->IsLive(kKey));

  // re-watch inside the window: timer cancelled, value served at once, no reload
  const int fetches = f.api->list_at_bats_calls;
  f.seen.clear();
  {
    auto watch = f.Watch();
    assert(f.loop->PendingTimers() == 0);
    assert(f.seen.size() == 1 && f.seen[0].HasData());
    assert(f.api->list_at_bats_calls == fetches);
  }

  f.clock.Advance(300s);
  f.loop->RunUntilIdle();
  assert(!f.cache->IsLive(kKey));
  assert(!f.cache->Current(kKey).has_value());
}

void TestSecondObserverKeepsNodeAlive() {
  Fixture f;
  auto    first  = f.Watch();
  auto    second = f.Watch();

  first.Reset();
  assert(f.loop->PendingTimers() == 0);

  second = GameStateWatch();
  assert(f.loop->PendingTimers() == 1);
}

void TestLastAtBatUsesReplayOrder() {
  Fixture f;
  assert(!f.cache->GetLastAtBat(kKey).has_value());

  auto watch = f.Watch();
  assert(f.cache->GetLastAtBat(kKey)->at_bat_id() == "c");
}

void TestUpdateAtBatRecordRecomputes() {
  Fixture f;
  auto    watch = f.Watch();

  UpdateAtBatRequest edit;
  edit.set_at_bat_id("b");
  edit.set_result("DP");
  f.cache->UpdateAtBatRecord(kKey, edit);
  f.loop->RunUntilIdle();

  assert(f.Current().inning() == 2);
  assert(f.Current().outs() == 1);
}

void TestResetDropsNodesAndOldWatchesAreHarmless() {
  Fixture f;
  auto    watch = f.Watch();

  f.cache->Reset();
  assert(f.cache->LiveCount() == 0);

  auto fresh = f.Watch();
  watch.Reset();
  assert(f.loop->PendingTimers() == 0);
  assert(f.cache->IsLive(kKey));
}

} // namespace

int main() {
  TestFirstWatchLoadsThenComputes();
  TestRecordAtBatStampsStateAndRecomputesOnLoop();
  TestRecordAtBatWithoutWatchComputesSynchronously();
  TestRecordAtBatWithoutStateIsRefused();
  TestRecomputeFailureKeepsLastGoodState();
  TestInvalidLineupStaysLoading();
  TestKeepAliveRetainsNodeUntilExpiry();
  TestSecondObserverKeepsNodeAlive();
  TestLastAtBatUsesReplayOrder();
  TestUpdateAtBatRecordRecomputes();
  TestResetDropsNodesAndOldWatchesAreHarmless();

  std::cout << "hacktracker_unit_game_state_cache: pass\n";
  return 0;
}
