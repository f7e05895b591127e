#include "session.hpp"

#include "internal/observability/logging.hpp"

namespace hacktracker::session {

Session::Session(std::shared_ptr<cache::PersistentCacheStore> cache, std::shared_ptr<collection::CollectionRegistry> registry,
                 std::shared_ptr<game_state::GameStateCache> game_state)
    : cache_(std::move(cache)), registry_(std::move(registry)), game_state_(std::move(game_state)) {
}

void Session::SignOut() {
  // nodes first, so the registry reset does not schedule recomputes
  game_state_->Reset();
  registry_->Reset();
  cache_->ClearAll();

  HACKTRACKER_LOG_INFO("signed out, cache cleared");
}

} // namespace hacktracker::session
