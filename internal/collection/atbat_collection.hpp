#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "hacktracker/scoring/v1.hpp"
#include "internal/api/scoring_api.hpp"
#include "internal/cache/persistent_cache_store.hpp"
#include "internal/mutation/mutation_engine.hpp"
#include "internal/notify/messenger.hpp"
#include "internal/scoring/game_state_reducer.hpp"
#include "internal/state/published_value.hpp"
#include "internal/util/time.hpp"

namespace hacktracker::collection {

/*
  The at-bat log of one game.

  Published value is the log in replay order. Load() is cache-first: a
  non-empty persisted log is published at once and refreshed from the API
  in the background. Create/Update/Delete go through the MutationEngine and
  persist the log after the server confirms.
*/
class AtBatCollection : public std::enable_shared_from_this<AtBatCollection> {
 public:
  using Value       = scoring::AtBats;
  using AtBatDone   = std::function<void(mutation::MutationOutcome<hacktracker::scoring::v1::AtBat>)>;
  using DeleteDone  = std::function<void(mutation::MutationOutcome<api::Ack>)>;

  AtBatCollection(std::string game_id, std::shared_ptr<api::ScoringApi> api, std::shared_ptr<cache::PersistentCacheStore> cache,
                  std::shared_ptr<notify::Messenger> messenger, util::NowFn now = util::Now);

  // First call only; later calls are no-ops.
  void Load();
  void Refresh();

  void CreateAtBat(const hacktracker::scoring::v1::CreateAtBatRequest& request, AtBatDone done = {});
  void UpdateAtBat(const hacktracker::scoring::v1::UpdateAtBatRequest& request, AtBatDone done = {});
  void DeleteAtBat(const std::string& at_bat_id, DeleteDone done = {});

  // Latest at-bat in replay order, if any.
  std::optional<hacktracker::scoring::v1::AtBat> LastAtBat() const;

  // Retires the collection (sign-out). Fetches still in flight are dropped
  // and nothing is persisted afterwards.
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

  const std::string& game_id() const {
    return game_id_;
  }

 private:
  void Fetch();
  void Persist(const Value& log);

  std::optional<hacktracker::scoring::v1::AtBat> Find(const std::string& at_bat_id) const;
  // throws util::NotFound
  hacktracker::scoring::v1::AtBat Require(const std::string& at_bat_id) const;

  std::string                                   game_id_;
  std::shared_ptr<api::ScoringApi>              api_;
  std::shared_ptr<cache::PersistentCacheStore>  cache_;
  std::shared_ptr<notify::Messenger>            messenger_;
  util::NowFn                                   now_;
  std::shared_ptr<state::PublishedValue<Value>> value_;
  mutation::MutationEngine<Value>               engine_;
  bool                                          load_started_ = false;
  bool                                          detached_     = false;
};

} // namespace hacktracker::collection
