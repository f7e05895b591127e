#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "hacktracker/scoring/v1.hpp"
#include "internal/api/scoring_api.hpp"
#include "internal/cache/persistent_cache_store.hpp"
#include "internal/mutation/mutation_engine.hpp"
#include "internal/notify/messenger.hpp"
#include "internal/scoring/game_state_reducer.hpp"
#include "internal/state/published_value.hpp"

namespace hacktracker::collection {

/*
  The games of one team, cache-first like AtBatCollection.
*/
class GameCollection : public std::enable_shared_from_this<GameCollection> {
 public:
  using Value    = std::vector<hacktracker::scoring::v1::Game>;
  using GameDone = std::function<void(mutation::MutationOutcome<hacktracker::scoring::v1::Game>)>;

  GameCollection(std::string team_id, std::shared_ptr<api::ScoringApi> api, std::shared_ptr<cache::PersistentCacheStore> cache,
                 std::shared_ptr<notify::Messenger> messenger);

  void Load();
  void Refresh();

  std::optional<hacktracker::scoring::v1::Game> FindGame(const std::string& game_id) const;

  // Lineup of a loaded game, ordered by batting order.
  std::optional<scoring::Lineup> Lineup(const std::string& game_id) const;

  // Optimistic lineup replacement.
  void UpdateLineup(const std::string& game_id, const scoring::Lineup& lineup, GameDone done = {});

  // See AtBatCollection::Detach.
  void Detach();
  bool detached() const {
    return detached_;
  }

  const std::shared_ptr<state::PublishedValue<Value>>& published() const {
    return value_;
  }
  state::Subscription Subscribe(state::PublishedValue<Value>::Listener listener) {
    return value_->Subscribe(std::move(listener));
  }

  const std::string& team_id() const {
    return team_id_;
  }

 private:
  void Fetch();
  void Persist(const Value& games);
  // throws util::NotFound
  hacktracker::scoring::v1::Game RequireGame(const std::string& game_id) const;

  std::string                                   team_id_;
  std::shared_ptr<api::ScoringApi>              api_;
  std::shared_ptr<cache::PersistentCacheStore>  cache_;
  std::shared_ptr<notify::Messenger>            messenger_;
  std::shared_ptr<state::PublishedValue<Value>> value_;
  mutation::MutationEngine<Value>               engine_;
  bool                                          load_started_ = false;
  bool                                          detached_     = false;
};

} // namespace hacktracker::collection
