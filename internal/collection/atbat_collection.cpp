#include "atbat_collection.hpp"

#include <google/protobuf/util/message_differencer.h>

#include <algorithm>
#include <iterator>
#include <unordered_map>

#include "failure_message.hpp"
#include "internal/cache/cache_keys.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace hacktracker::collection {

using hacktracker::scoring::GameStateReducer;
using hacktracker::scoring::v1::AtBat;
using hacktracker::scoring::v1::AtBatList;
using hacktracker::scoring::v1::CreateAtBatRequest;
using hacktracker::scoring::v1::UpdateAtBatRequest;
using mutation::MutationDescriptor;
using mutation::MutationOutcome;
using observability::IntField;
using observability::StringField;

namespace {

using Value = AtBatCollection::Value;

Value Without(const Value& log, const std::string& at_bat_id) {
  Value out;
  out.reserve(log.size());
  std::copy_if(log.begin(), log.end(), std::back_inserter(out), [&](const AtBat& a) { return a.at_bat_id() != at_bat_id; });
  return out;
}

Value::const_iterator FindIn(const Value& log, const std::string& at_bat_id) {
  return std::find_if(log.begin(), log.end(), [&](const AtBat& a) { return a.at_bat_id() == at_bat_id; });
}

// Replaces the record with the same id; absent ids are left out.
Value Replace(const Value& log, const AtBat& record) {
  Value out(log);
  for (auto& a : out) {
    if (a.at_bat_id() == record.at_bat_id()) a = record;
  }
  return GameStateReducer::OrderEvents(out);
}

uint64_t NextSequence(const Value& log) {
  uint64_t max_sequence = 0;
  for (const auto& a : log) max_sequence = std::max<uint64_t>(max_sequence, a.sequence());
  return max_sequence + 1;
}

// The server does not know local sequences; keep the ones we assigned.
Value CarrySequences(Value fresh, const Value& current) {
  std::unordered_map<std::string, uint64_t> sequences;
  for (const auto& a : current) {
    if (a.sequence() != 0) sequences[a.at_bat_id()] = a.sequence();
  }
  for (auto& a : fresh) {
    if (a.sequence() != 0) continue;
    auto it = sequences.find(a.at_bat_id());
    if (it != sequences.end()) a.set_sequence(it->second);
  }
  return GameStateReducer::OrderEvents(fresh);
}

AtBat ApplyEdit(const AtBat& existing, const UpdateAtBatRequest& request, const google::protobuf::Timestamp& now) {
  AtBat edited(existing);
  if (request.has_result()) edited.set_result(request.result());
  if (request.has_hit_location()) *edited.mutable_hit_location() = request.hit_location();
  if (request.has_hit_type()) edited.set_hit_type(request.hit_type());
  if (request.has_rbis()) edited.set_rbis(request.rbis());
  if (request.has_inning()) edited.set_inning(request.inning());
  if (request.has_outs()) edited.set_outs(request.outs());
  *edited.mutable_updated_at() = now;
  return edited;
}

template <typename R>
MutationOutcome<R> NotFoundOutcome(const std::string& message) {
  MutationOutcome<R> outcome;
  outcome.error_message = message;
  return outcome;
}

} // namespace

AtBatCollection::AtBatCollection(std::string game_id, std::shared_ptr<api::ScoringApi> api,
                                 std::shared_ptr<cache::PersistentCacheStore> cache, std::shared_ptr<notify::Messenger> messenger,
                                 util::NowFn now)
    : game_id_(std::move(game_id)),
      api_(std::move(api)),
      cache_(std::move(cache)),
      messenger_(std::move(messenger)),
      now_(std::move(now)),
      value_(state::PublishedValue<Value>::Create()),
      engine_(value_, messenger_, "atbats/" + game_id_) {
}

// ------------------------------------------------------------
// Loading
// ------------------------------------------------------------

void AtBatCollection::Load() {
  if (load_started_) return;
  load_started_ = true;

  auto cached = cache_->GetMessage<AtBatList>(cache::keys::AtBats(game_id_));
  if (cached && cached->at_bats_size() > 0) {
    HACKTRACKER_LOG_DEBUG("at-bats served from cache", {StringField("game_id", game_id_), IntField("count", cached->at_bats_size())});
    value_->SetData(GameStateReducer::OrderEvents(scoring::ToAtBats(cached->at_bats())));
  }

  Fetch();
}

void AtBatCollection::Detach() {
  detached_ = true;
  value_->Set(state::PublishedValue<Value>::State::Loading());
}

void AtBatCollection::Refresh() {
  load_started_ = true;
  Fetch();
}

void AtBatCollection::Fetch() {
  auto self = shared_from_this();
  api_->ListAtBats(game_id_, [self](api::ApiResult<AtBatList> result) {
    if (self->detached_) {
      HACKTRACKER_LOG_DEBUG("at-bat fetch dropped, collection detached", {StringField("game_id", self->game_id_)});
      return;
    }

    if (result.ok()) {
      auto fresh = GameStateReducer::OrderEvents(scoring::ToAtBats(result.value().at_bats()));
      if (self->value_->HasData()) {
        fresh = CarrySequences(std::move(fresh), self->value_->Data());
      }
      self->value_->SetData(fresh);
      self->Persist(fresh);
      return;
    }

    const auto message = ErrorText(result.error());
    if (self->value_->HasData()) {
      HACKTRACKER_LOG_WARN("at-bat refresh failed, keeping current log",
                           {StringField("game_id", self->game_id_), StringField("error", message)});
      return;
    }
    HACKTRACKER_LOG_WARN("at-bat load failed", {StringField("game_id", self->game_id_), StringField("error", message)});
    self->value_->Set(state::PublishedValue<Value>::State::Error(message));
  });
}

void AtBatCollection::Persist(const Value& log) {
  if (detached_) return;

  AtBatList list;
  for (const auto& a : log) {
    *list.add_at_bats() = a;
  }
  cache_->SetJson(cache::keys::AtBats(game_id_), list);
}

// ------------------------------------------------------------
// Queries
// ------------------------------------------------------------

std::optional<AtBat> AtBatCollection::Find(const std::string& at_bat_id) const {
  if (!value_->HasData()) return std::nullopt;

  const auto& log = value_->Data();
  auto        it  = FindIn(log, at_bat_id);
  if (it == log.end()) return std::nullopt;
  return *it;
}

AtBat AtBatCollection::Require(const std::string& at_bat_id) const {
  auto found = Find(at_bat_id);
  if (!found) throw util::NotFound("At-bat not found");
  return *found;
}

std::optional<AtBat> AtBatCollection::LastAtBat() const {
  if (!value_->HasData() || value_->Data().empty()) return std::nullopt;

  const auto& log = value_->Data();
  return *std::max_element(log.begin(), log.end(), &GameStateReducer::Precedes);
}

// ------------------------------------------------------------
// Mutations
// ------------------------------------------------------------

void AtBatCollection::CreateAtBat(const CreateAtBatRequest& request, AtBatDone done) {
  AtBat temp;
  temp.set_at_bat_id(util::TempId());
  temp.set_game_id(game_id_);
  temp.set_player_id(request.player_id());
  temp.set_result(request.result());
  temp.set_inning(request.inning());
  temp.set_outs(request.outs());
  temp.set_batting_order(request.batting_order());
  if (request.has_hit_location()) *temp.mutable_hit_location() = request.hit_location();
  if (request.has_hit_type()) temp.set_hit_type(request.hit_type());
  if (request.has_rbis()) temp.set_rbis(request.rbis());

  const auto created_at       = util::ToProto(now_());
  *temp.mutable_created_at() = created_at;
  *temp.mutable_updated_at() = created_at;
  temp.set_sequence(value_->HasData() ? NextSequence(value_->Data()) : 1);

  CreateAtBatRequest outgoing(request);
  outgoing.set_game_id(game_id_);

  const auto temp_id       = temp.at_bat_id();
  const auto temp_sequence = temp.sequence();
  auto       remote        = api_;

  MutationDescriptor<Value, AtBat> d;
  d.optimistic_update = [temp](const Value& current) {
    Value next(current);
    next.push_back(temp);
    return GameStateReducer::OrderEvents(next);
  };
  d.api_call = [remote, outgoing](api::ApiCallback<AtBat> cb) { remote->CreateAtBat(outgoing, std::move(cb)); };
  d.apply_result = [temp_id, temp_sequence](const Value& current, const AtBat& created) {
    AtBat confirmed(created);
    if (confirmed.sequence() == 0) confirmed.set_sequence(temp_sequence);

    // a refresh may already have brought the server copy in
    Value next = Without(Without(current, temp_id), confirmed.at_bat_id());
    next.push_back(confirmed);
    return GameStateReducer::OrderEvents(next);
  };
  d.rollback        = [temp_id](const Value& current) { return Without(current, temp_id); };
  d.success_message = "At-bat recorded successfully";
  d.error_message   = [](const std::exception& e) { return FailureMessage("Failed to record at-bat", e); };

  auto self = shared_from_this();
  engine_.Mutate<AtBat>(std::move(d), [self, done](MutationOutcome<AtBat> outcome) {
    if (outcome.ok() && self->value_->HasData()) self->Persist(self->value_->Data());
    if (done) done(std::move(outcome));
  });
}

void AtBatCollection::UpdateAtBat(const UpdateAtBatRequest& request, AtBatDone done) {
  if (!value_->HasData()) {
    if (done) done(MutationOutcome<AtBat>{});
    return;
  }

  AtBat original;
  try {
    original = Require(request.at_bat_id());
  } catch (const util::NotFound& e) {
    messenger_->ShowError(e.what());
    if (done) done(NotFoundOutcome<AtBat>(e.what()));
    return;
  }

  const AtBat edited = ApplyEdit(original, request, util::ToProto(now_()));

  UpdateAtBatRequest outgoing(request);
  outgoing.set_game_id(game_id_);
  auto remote = api_;

  MutationDescriptor<Value, AtBat> d;
  d.optimistic_update = [edited](const Value& current) { return Replace(current, edited); };
  d.api_call          = [remote, outgoing](api::ApiCallback<AtBat> cb) { remote->UpdateAtBat(outgoing, std::move(cb)); };
  d.apply_result      = [original](const Value& current, const AtBat& server) {
    // deleted in the meantime: do not resurrect it
    if (FindIn(current, original.at_bat_id()) == current.end()) return current;

    AtBat confirmed(server);
    confirmed.set_at_bat_id(original.at_bat_id());
    *confirmed.mutable_created_at() = original.created_at();
    if (confirmed.sequence() == 0) confirmed.set_sequence(original.sequence());
    return Replace(current, confirmed);
  };
  d.rollback = [original, edited](const Value& current) {
    auto it = FindIn(current, original.at_bat_id());
    if (it == current.end()) return current;

    // someone else replaced the record since our edit; leave theirs
    if (!google::protobuf::util::MessageDifferencer::Equals(*it, edited)) return current;
    return Replace(current, original);
  };
  d.success_message = "At-bat updated successfully";
  d.error_message   = [](const std::exception& e) { return FailureMessage("Failed to update at-bat", e); };

  auto self = shared_from_this();
  engine_.Mutate<AtBat>(std::move(d), [self, done](MutationOutcome<AtBat> outcome) {
    if (outcome.ok() && self->value_->HasData()) self->Persist(self->value_->Data());
    if (done) done(std::move(outcome));
  });
}

void AtBatCollection::DeleteAtBat(const std::string& at_bat_id, DeleteDone done) {
  if (!value_->HasData()) {
    if (done) done(MutationOutcome<api::Ack>{});
    return;
  }

  AtBat removed;
  try {
    removed = Require(at_bat_id);
  } catch (const util::NotFound& e) {
    messenger_->ShowError(e.what());
    if (done) done(NotFoundOutcome<api::Ack>(e.what()));
    return;
  }

  const auto game_id = game_id_;
  auto        remote  = api_;

  MutationDescriptor<Value, api::Ack> d;
  d.optimistic_update = [at_bat_id](const Value& current) { return Without(current, at_bat_id); };
  d.api_call          = [remote, game_id, at_bat_id](api::ApiCallback<api::Ack> cb) { remote->DeleteAtBat(game_id, at_bat_id, std::move(cb)); };
  d.apply_result      = [at_bat_id](const Value& current, const api::Ack&) { return Without(current, at_bat_id); };
  d.rollback          = [removed](const Value& current) {
    if (FindIn(current, removed.at_bat_id()) != current.end()) return current;

    Value next(current);
    next.push_back(removed);
    return GameStateReducer::OrderEvents(next);
  };
  d.success_message = "At-bat deleted successfully";
  d.error_message   = [](const std::exception& e) { return FailureMessage("Failed to delete at-bat", e); };

  auto self = shared_from_this();
  engine_.Mutate<api::Ack>(std::move(d), [self, done](MutationOutcome<api::Ack> outcome) {
    if (outcome.ok() && self->value_->HasData()) self->Persist(self->value_->Data());
    if (done) done(std::move(outcome));
  });
}

} // namespace hacktracker::collection
