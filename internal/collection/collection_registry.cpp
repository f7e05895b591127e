#include "collection_registry.hpp"

#include "internal/observability/logging.hpp"

namespace hacktracker::collection {

CollectionRegistry::CollectionRegistry(std::shared_ptr<api::ScoringApi> api, std::shared_ptr<cache::PersistentCacheStore> cache,
                                       std::shared_ptr<notify::Messenger> messenger, util::NowFn now)
    : api_(std::move(api)), cache_(std::move(cache)), messenger_(std::move(messenger)), now_(std::move(now)) {
}

std::shared_ptr<AtBatCollection> CollectionRegistry::AtBats(const std::string& game_id) {
  auto it = at_bats_.find(game_id);
  if (it != at_bats_.end()) return it->second;

  auto collection = std::make_shared<AtBatCollection>(game_id, api_, cache_, messenger_, now_);
  at_bats_.emplace(game_id, collection);
  return collection;
}

std::shared_ptr<GameCollection> CollectionRegistry::Games(const std::string& team_id) {
  auto it = games_.find(team_id);
  if (it != games_.end()) return it->second;

  auto collection = std::make_shared<GameCollection>(team_id, api_, cache_, messenger_);
  games_.emplace(team_id, collection);
  return collection;
}

void CollectionRegistry::Reset() {
  HACKTRACKER_LOG_INFO("dropping collections",
                       {observability::IntField("at_bat_collections", static_cast<int64_t>(at_bats_.size())),
                        observability::IntField("game_collections", static_cast<int64_t>(games_.size()))});

  auto at_bats = std::move(at_bats_);
  auto games   = std::move(games_);
  at_bats_.clear();
  games_.clear();

  for (auto& [id, collection] : at_bats) {
    collection->Detach();
  }
  for (auto& [id, collection] : games) {
    collection->Detach();
  }
}

} // namespace hacktracker::collection
