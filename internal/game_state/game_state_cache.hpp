#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include "internal/collection/collection_registry.hpp"
#include "internal/runtime/event_loop.hpp"
#include "internal/scoring/game_state.hpp"
#include "internal/state/published_value.hpp"

namespace hacktracker::game_state {

struct GameStateKey {
  std::string game_id;
  std::string team_id;

  bool operator==(const GameStateKey& other) const {
    return game_id == other.game_id && team_id == other.team_id;
  }
};

struct GameStateKeyHash {
  std::size_t operator()(const GameStateKey& key) const {
    const std::size_t h = std::hash<std::string>{}(key.game_id);
    return h ^ (std::hash<std::string>{}(key.team_id) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
  }
};

class GameStateCache;

/*
  Observation handle from GameStateCache::Watch. While at least one is
  alive the node stays live; dropping the last one arms the keep-alive
  timer. Move-only.
*/
class GameStateWatch {
 public:
  GameStateWatch() = default;
  ~GameStateWatch();

  GameStateWatch(const GameStateWatch&)            = delete;
  GameStateWatch& operator=(const GameStateWatch&) = delete;
  GameStateWatch(GameStateWatch&& other) noexcept;
  GameStateWatch& operator=(GameStateWatch&& other) noexcept;

  void Reset();

  bool Active() const {
    return subscription_.Active();
  }
  const GameStateKey& key() const {
    return key_;
  }

 private:
  friend class GameStateCache;
  GameStateWatch(std::weak_ptr<GameStateCache> cache, GameStateKey key, std::uint64_t node_id, state::Subscription subscription);

  std::weak_ptr<GameStateCache> cache_;
  GameStateKey                  key_;
  std::uint64_t                 node_id_ = 0;
  state::Subscription           subscription_;
};

/*
  Derived in-game state per (game, team).

  A node is created by the first Watch(). It loads the game's at-bats and
  the team's games, computes the state once both are available and then
  recomputes on the event loop after every change to either collection.
  Recompute failures keep the last good state. Loading -> Data only; no
  error state is published.

  When the last watch goes away the node lingers for keep_alive so a quick
  re-watch gets its value without a reload.

  Everything runs on the loop thread.
*/
class GameStateCache : public std::enable_shared_from_this<GameStateCache> {
 public:
  using Value     = state::PublishedValue<scoring::InGameState>;
  using Listener  = Value::Listener;
  using AtBatDone = collection::AtBatCollection::AtBatDone;

  static std::shared_ptr<GameStateCache> Create(std::shared_ptr<collection::CollectionRegistry> registry,
                                                std::shared_ptr<runtime::EventLoop> loop, std::chrono::seconds keep_alive);

  GameStateCache(const GameStateCache&)            = delete;
  GameStateCache& operator=(const GameStateCache&) = delete;

  // listener is called at once with the current state, then on every change.
  GameStateWatch Watch(const GameStateKey& key, Listener listener);

  // Stamps the request with the current inning and outs, then records it
  // through the game's AtBatCollection.
  void RecordAtBat(const GameStateKey& key, hacktracker::scoring::v1::CreateAtBatRequest request, AtBatDone done = {});

  void UpdateAtBatRecord(const GameStateKey& key, const hacktracker::scoring::v1::UpdateAtBatRequest& request,
                         AtBatDone done = {});

  std::optional<hacktracker::scoring::v1::AtBat> GetLastAtBat(const GameStateKey& key);

  // Published state of a live node.
  std::optional<Value::State> Current(const GameStateKey& key) const;

  bool IsLive(const GameStateKey& key) const;
  std::size_t LiveCount() const {
    return nodes_.size();
  }

  // Sign-out: drops every node and pending timer.
  void Reset();

 private:
  struct Node {
    std::uint64_t                                 id = 0;
    GameStateKey                                  key;
    std::shared_ptr<Value>                        value;
    std::shared_ptr<collection::AtBatCollection>  at_bats;
    std::shared_ptr<collection::GameCollection>   games;
    state::Subscription                           at_bats_subscription;
    state::Subscription                           games_subscription;
    int                                           observers = 0;
    std::optional<runtime::EventLoop::TimerId>    release_timer;
    bool                                          recompute_pending = false;
  };

  GameStateCache(std::shared_ptr<collection::CollectionRegistry> registry, std::shared_ptr<runtime::EventLoop> loop,
                 std::chrono::seconds keep_alive);

  friend class GameStateWatch;
  // node_id guards against a watch outliving a Reset()
  void Release(const GameStateKey& key, std::uint64_t node_id);

  Node& Acquire(const GameStateKey& key);
  Node* Find(const GameStateKey& key);
  void  OnCollectionChanged(const GameStateKey& key);
  void  ScheduleRecompute(Node& node);
  void  Recompute(const GameStateKey& key);
  void  Expire(const GameStateKey& key);

  // nullopt when either collection has no data or the reducer rejects it
  static std::optional<scoring::InGameState> TryCompute(const Node& node);

  std::shared_ptr<collection::CollectionRegistry> registry_;
  std::shared_ptr<runtime::EventLoop>             loop_;
  std::chrono::seconds                            keep_alive_;

  std::unordered_map<GameStateKey, std::unique_ptr<Node>, GameStateKeyHash> nodes_;
  std::uint64_t                                                             next_node_id_ = 1;
};

} // namespace hacktracker::game_state
