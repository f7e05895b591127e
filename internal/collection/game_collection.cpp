#include "game_collection.hpp"

#include <google/protobuf/util/message_differencer.h>

#include <algorithm>

#include "failure_message.hpp"
#include "internal/cache/cache_keys.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace hacktracker::collection {

using hacktracker::scoring::v1::Game;
using hacktracker::scoring::v1::GameList;
using mutation::MutationDescriptor;
using mutation::MutationOutcome;
using observability::IntField;
using observability::StringField;

namespace {

using Value = GameCollection::Value;

Value FromList(const GameList& list) {
  return Value(list.games().begin(), list.games().end());
}

Value::const_iterator FindIn(const Value& games, const std::string& game_id) {
  return std::find_if(games.begin(), games.end(), [&](const Game& g) { return g.game_id() == game_id; });
}

Value Replace(const Value& games, const Game& game) {
  Value out(games);
  for (auto& g : out) {
    if (g.game_id() == game.game_id()) g = game;
  }
  return out;
}

Game WithLineup(const Game& game, const scoring::Lineup& lineup) {
  Game out(game);
  out.clear_lineup();
  for (const auto& slot : scoring::GameStateReducer::OrderLineup(lineup)) {
    *out.add_lineup() = slot;
  }
  return out;
}

} // namespace

GameCollection::GameCollection(std::string team_id, std::shared_ptr<api::ScoringApi> api,
                               std::shared_ptr<cache::PersistentCacheStore> cache, std::shared_ptr<notify::Messenger> messenger)
    : team_id_(std::move(team_id)),
      api_(std::move(api)),
      cache_(std::move(cache)),
      messenger_(std::move(messenger)),
      value_(state::PublishedValue<Value>::Create()),
      engine_(value_, messenger_, "games/" + team_id_) {
}

void GameCollection::Load() {
  if (load_started_) return;
  load_started_ = true;

  auto cached = cache_->GetMessage<GameList>(cache::keys::Games(team_id_));
  if (cached && cached->games_size() > 0) {
    HACKTRACKER_LOG_DEBUG("games served from cache", {StringField("team_id", team_id_), IntField("count", cached->games_size())});
    value_->SetData(FromList(*cached));
  }

  Fetch();
}

void GameCollection::Detach() {
  detached_ = true;
  value_->Set(state::PublishedValue<Value>::State::Loading());
}

void GameCollection::Refresh() {
  load_started_ = true;
  Fetch();
}

void GameCollection::Fetch() {
  auto self = shared_from_this();
  api_->ListGames(team_id_, [self](api::ApiResult<GameList> result) {
    if (self->detached_) {
      HACKTRACKER_LOG_DEBUG("game fetch dropped, collection detached", {StringField("team_id", self->team_id_)});
      return;
    }

    if (result.ok()) {
      auto games = FromList(result.value());
      self->value_->SetData(games);
      self->Persist(games);
      return;
    }

    const auto message = ErrorText(result.error());
    if (self->value_->HasData()) {
      HACKTRACKER_LOG_WARN("game refresh failed, keeping current list",
                           {StringField("team_id", self->team_id_), StringField("error", message)});
      return;
    }
    HACKTRACKER_LOG_WARN("game load failed", {StringField("team_id", self->team_id_), StringField("error", message)});
    self->value_->Set(state::PublishedValue<Value>::State::Error(message));
  });
}

void GameCollection::Persist(const Value& games) {
  if (detached_) return;

  GameList list;
  for (const auto& g : games) {
    *list.add_games() = g;
  }
  cache_->SetJson(cache::keys::Games(team_id_), list);
}

std::optional<Game> GameCollection::FindGame(const std::string& game_id) const {
  if (!value_->HasData()) return std::nullopt;

  const auto& games = value_->Data();
  auto        it    = FindIn(games, game_id);
  if (it == games.end()) return std::nullopt;
  return *it;
}

Game GameCollection::RequireGame(const std::string& game_id) const {
  auto game = FindGame(game_id);
  if (!game) throw util::NotFound("Game not found");
  return *game;
}

std::optional<scoring::Lineup> GameCollection::Lineup(const std::string& game_id) const {
  auto game = FindGame(game_id);
  if (!game) return std::nullopt;
  return scoring::GameStateReducer::OrderLineup(scoring::ToLineup(game->lineup()));
}

void GameCollection::UpdateLineup(const std::string& game_id, const scoring::Lineup& lineup, GameDone done) {
  if (!value_->HasData()) {
    if (done) done(MutationOutcome<Game>{});
    return;
  }

  Game original;
  try {
    original = RequireGame(game_id);
  } catch (const util::NotFound& e) {
    messenger_->ShowError(e.what());
    if (done) {
      MutationOutcome<Game> outcome;
      outcome.error_message = e.what();
      done(std::move(outcome));
    }
    return;
  }

  const Game edited = WithLineup(original, lineup);
  auto       remote = api_;

  MutationDescriptor<Value, Game> d;
  d.optimistic_update = [edited](const Value& current) { return Replace(current, edited); };
  d.api_call          = [remote, game_id, lineup](api::ApiCallback<Game> cb) { remote->UpdateGameLineup(game_id, lineup, std::move(cb)); };
  d.apply_result      = [](const Value& current, const Game& server) { return Replace(current, server); };
  d.rollback          = [original, edited](const Value& current) {
    auto it = FindIn(current, original.game_id());
    if (it == current.end() || !google::protobuf::util::MessageDifferencer::Equals(*it, edited)) return current;
    return Replace(current, original);
  };
  d.success_message = "Lineup updated successfully";
  d.error_message   = [](const std::exception& e) { return FailureMessage("Failed to update lineup", e); };

  auto self = shared_from_this();
  engine_.Mutate<Game>(std::move(d), [self, done](MutationOutcome<Game> outcome) {
    if (outcome.ok() && self->value_->HasData()) self->Persist(self->value_->Data());
    if (done) done(std::move(outcome));
  });
}

} // namespace hacktracker::collection
