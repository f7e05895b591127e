#pragma once

#include <memory>

#include "internal/cache/persistent_cache_store.hpp"
#include "internal/collection/collection_registry.hpp"
#include "internal/game_state/game_state_cache.hpp"

namespace hacktracker::session {

class Session {
 public:
  Session(std::shared_ptr<cache::PersistentCacheStore> cache, std::shared_ptr<collection::CollectionRegistry> registry,
          std::shared_ptr<game_state::GameStateCache> game_state);

  // Forgets everything the signed-in user saw: derived state, live
  // collections and the persisted cache.
  void SignOut();

 private:
  std::shared_ptr<cache::PersistentCacheStore>    cache_;
  std::shared_ptr<collection::CollectionRegistry> registry_;
  std::shared_ptr<game_state::GameStateCache>     game_state_;
};

} // namespace hacktracker::session
