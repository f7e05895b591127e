#include "internal/collection/game_collection.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "internal/cache/cache_keys.hpp"
#include "internal/collection/collection_registry.hpp"
#include "internal/db/memory/memory_kv_store.hpp"
#include "tests/support/fake_scoring_api.hpp"

namespace {

using hacktracker::cache::PersistentCacheStore;
using hacktracker::collection::CollectionRegistry;
using hacktracker::collection::GameCollection;
using hacktracker::db::memory::MemoryKeyValueStore;
using hacktracker::mutation::MutationOutcome;
using hacktracker::mutation::MutationStatus;
using hacktracker::testing::FakeScoringApi;
using hacktracker::testing::MakeGame;
using hacktracker::testing::ManualClock;
using hacktracker::testing::RecordingMessenger;
using hacktracker::testing::Slot;
using hacktracker::util::TransportError;
using namespace hacktracker::scoring::v1;
using namespace std::chrono_literals;

namespace keys = hacktracker::cache::keys;

struct Fixture {
  ManualClock                           clock;
  std::shared_ptr<FakeScoringApi>       api       = std::make_shared<FakeScoringApi>(clock.fn());
  std::shared_ptr<MemoryKeyValueStore>  store     = std::make_shared<MemoryKeyValueStore>();
  std::shared_ptr<PersistentCacheStore> cache     = std::make_shared<PersistentCacheStore>(store, 2, 24h, clock.fn());
  std::shared_ptr<RecordingMessenger>   messenger = std::make_shared<RecordingMessenger>();
  std::shared_ptr<GameCollection>       games     = std::make_shared<GameCollection>("t1", api, cache, messenger);

  Fixture() {
    api->games["t1"] = {MakeGame("g1", "t1", {Slot("p2", 2), Slot("p1", 1)}), MakeGame("g2", "t1", {Slot("p5", 1)})};
  }
};

void TestLoadPersistsAndFindsGames() {
  Fixture f;
  f.games->Load();

  assert(f.games->published()->Data().size() == 2);
  assert(f.games->FindGame("g2").has_value());
  assert(!f.games->FindGame("missing").has_value());

  auto lineup = f.games->Lineup("g1");
  assert(lineup && lineup->size() == 2);
  assert((*lineup)[0].player_id() == "p1");

  auto persisted = f.cache->GetMessage<GameList>(keys::Games("t1"));
  assert(persisted && persisted->games_size() == 2);
}

void TestLoadFromCacheBeforeNetwork() {
  Fixture  f;
  GameList cached;
  *cached.add_games() = MakeGame("old", "t1", {Slot("p9", 1)});
  f.cache->SetJson(keys::Games("t1"), cached);

  f.api->deferred = true;
  f.games->Load();
  assert(f.games->FindGame("old").has_value());

  f.api->SucceedNext();
  assert(!f.games->FindGame("old").has_value());
  assert(f.games->FindGame("g1").has_value());
}

void TestLineupUpdateIsOptimisticAndRollsBack() {
  Fixture f;
  f.games->Load();
  f.api->deferred = true;

  std::optional<MutationOutcome<Game>> outcome;
  f.games->UpdateLineup("g1", {Slot("p7", 1)}, [&](MutationOutcome<Game> o) { outcome = o; });
  assert(f.games->Lineup("g1")->size() == 1);
  assert((*f.games->Lineup("g1"))[0].player_id() == "p7");

  f.api->FailNext(TransportError(403, "not your team", "Forbidden"));
  assert(outcome && outcome->status == MutationStatus::kRolledBack);
  assert(f.games->Lineup("g1")->size() == 2);
  assert(f.messenger->errors.back() == "Failed to update lineup: Not authorized");
}

void TestLineupUpdateSuccess() {
  Fixture f;
  f.games->Load();

  f.games->UpdateLineup("g1", {Slot("p3", 2), Slot("p4", 1)});
  auto lineup = f.games->Lineup("g1");
  assert(lineup && lineup->size() == 2);
  assert((*lineup)[0].player_id() == "p4");
  assert(f.messenger->successes.back() == "Lineup updated successfully");

  auto persisted = f.cache->GetMessage<GameList>(keys::Games("t1"));
  assert(persisted && persisted->games(0).lineup_size() == 2);
}

void TestUnknownGameIsReported() {
  Fixture f;
  f.games->Load();

  f.games->UpdateLineup("missing", {Slot("p1", 1)});
  assert(f.api->lineup_calls == 0);
  assert(f.messenger->errors.back() == "Game not found");
}

void TestRegistryReusesAndResets() {
  ManualClock clock;
  auto        api      = std::make_shared<FakeScoringApi>(clock.fn());
  auto        cache    = std::make_shared<PersistentCacheStore>(std::make_shared<MemoryKeyValueStore>(), 2, 24h, clock.fn());
  auto        registry = std::make_shared<CollectionRegistry>(api, cache, std::make_shared<RecordingMessenger>(), clock.fn());

  api->games["t1"] = {MakeGame("g1", "t1", {Slot("p1", 1)})};

  auto games = registry->Games("t1");
  assert(registry->Games("t1") == games);
  assert(registry->AtBats("g1") == registry->AtBats("g1"));
  assert(registry->size() == 2);

  games->Load();
  assert(games->published()->HasData());

  registry->Reset();
  assert(registry->size() == 0);
  assert(games->detached());
  assert(games->published()->state().IsLoading());
  assert(registry->Games("t1") != games);
}

void TestDetachedCollectionIgnoresLateFetch() {
  Fixture f;
  f.api->deferred = true;
  f.games->Load();

  f.games->Detach();
  f.api->SucceedNext();

  assert(f.games->published()->state().IsLoading());
  assert(!f.cache->GetMessage<GameList>(keys::Games("t1")).has_value());
}

} // namespace

int main() {
  TestLoadPersistsAndFindsGames();
  TestLoadFromCacheBeforeNetwork();
  TestLineupUpdateIsOptimisticAndRollsBack();
  TestLineupUpdateSuccess();
  TestUnknownGameIsReported();
  TestRegistryReusesAndResets();
  TestDetachedCollectionIgnoresLateFetch();

  std::cout << "hacktracker_unit_game_collection: pass\n";
  return 0;
}
