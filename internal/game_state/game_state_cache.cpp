#include "game_state_cache.hpp"

#include "internal/observability/logging.hpp"
#include "internal/scoring/game_state_reducer.hpp"

namespace hacktracker::game_state {

using hacktracker::scoring::v1::AtBat;
using hacktracker::scoring::v1::CreateAtBatRequest;
using hacktracker::scoring::v1::UpdateAtBatRequest;
using observability::IntField;
using observability::StringField;

// ------------------------------------------------------------
// GameStateWatch
// ------------------------------------------------------------

GameStateWatch::GameStateWatch(std::weak_ptr<GameStateCache> cache, GameStateKey key, std::uint64_t node_id,
                               state::Subscription subscription)
    : cache_(std::move(cache)), key_(std::move(key)), node_id_(node_id), subscription_(std::move(subscription)) {
}

GameStateWatch::~GameStateWatch() {
  Reset();
}

GameStateWatch::GameStateWatch(GameStateWatch&& other) noexcept
    : cache_(std::move(other.cache_)),
      key_(std::move(other.key_)),
      node_id_(other.node_id_),
      subscription_(std::move(other.subscription_)) {
}

GameStateWatch& GameStateWatch::operator=(GameStateWatch&& other) noexcept {
  if (this != &other) {
    Reset();
    cache_        = std::move(other.cache_);
    key_          = std::move(other.key_);
    node_id_      = other.node_id_;
    subscription_ = std::move(other.subscription_);
  }
  return *this;
}

void GameStateWatch::Reset() {
  if (!subscription_.Active()) return;

  subscription_.Reset();
  if (auto cache = cache_.lock()) {
    cache->Release(key_, node_id_);
  }
  cache_.reset();
}

// ------------------------------------------------------------
// GameStateCache
// ------------------------------------------------------------

std::shared_ptr<GameStateCache> GameStateCache::Create(std::shared_ptr<collection::CollectionRegistry> registry,
                                                       std::shared_ptr<runtime::EventLoop> loop, std::chrono::seconds keep_alive) {
  return std::shared_ptr<GameStateCache>(new GameStateCache(std::move(registry), std::move(loop), keep_alive));
}

GameStateCache::GameStateCache(std::shared_ptr<collection::CollectionRegistry> registry, std::shared_ptr<runtime::EventLoop> loop,
                               std::chrono::seconds keep_alive)
    : registry_(std::move(registry)), loop_(std::move(loop)), keep_alive_(keep_alive) {
}

GameStateWatch GameStateCache::Watch(const GameStateKey& key, Listener listener) {
  Node& node = Acquire(key);
  ++node.observers;

  auto subscription = node.value->Subscribe(listener);
  listener(node.value->state(), node.value->state());

  return GameStateWatch(weak_from_this(), key, node.id, std::move(subscription));
}

GameStateCache::Node& GameStateCache::Acquire(const GameStateKey& key) {
  if (Node* existing = Find(key)) {
    if (existing->release_timer) {
      loop_->Cancel(*existing->release_timer);
      existing->release_timer.reset();
      HACKTRACKER_LOG_DEBUG("game state revived", {StringField("game_id", key.game_id)});
    }
    return *existing;
  }

  auto node     = std::make_unique<Node>();
  node->id      = next_node_id_++;
  node->key     = key;
  node->value   = Value::Create();
  node->at_bats = registry_->AtBats(key.game_id);
  node->games   = registry_->Games(key.team_id);

  Node& ref = *node;
  nodes_.emplace(key, std::move(node));

  std::weak_ptr<GameStateCache> weak = weak_from_this();
  ref.at_bats_subscription = ref.at_bats->Subscribe([weak, key](const auto&, const auto&) {
    if (auto self = weak.lock()) self->OnCollectionChanged(key);
  });
  ref.games_subscription = ref.games->Subscribe([weak, key](const auto&, const auto&) {
    if (auto self = weak.lock()) self->OnCollectionChanged(key);
  });

  HACKTRACKER_LOG_DEBUG("game state node created", {StringField("game_id", key.game_id), StringField("team_id", key.team_id)});

  // either load may publish synchronously (cache hit) and trigger the first compute
  ref.at_bats->Load();
  ref.games->Load();

  if (Node* current = Find(key); current != nullptr && !current->value->HasData()) {
    if (auto computed = TryCompute(*current)) current->value->SetData(*computed);
  }
  return *Find(key);
}

GameStateCache::Node* GameStateCache::Find(const GameStateKey& key) {
  auto it = nodes_.find(key);
  return it == nodes_.end() ? nullptr : it->second.get();
}

void GameStateCache::OnCollectionChanged(const GameStateKey& key) {
  Node* node = Find(key);
  if (node == nullptr) return;

  if (node->value->HasData()) {
    ScheduleRecompute(*node);
    return;
  }

  if (auto computed = TryCompute(*node)) {
    node->value->SetData(*computed);
  }
}

void GameStateCache::ScheduleRecompute(Node& node) {
  if (node.recompute_pending) return;
  node.recompute_pending = true;

  std::weak_ptr<GameStateCache> weak = weak_from_this();
  loop_->Post([weak, key = node.key] {
    if (auto self = weak.lock()) self->Recompute(key);
  });
}

void GameStateCache::Recompute(const GameStateKey& key) {
  Node* node = Find(key);
  if (node == nullptr) return;
  node->recompute_pending = false;

  if (auto computed = TryCompute(*node)) {
    node->value->SetData(*computed);
  }
}

std::optional<scoring::InGameState> GameStateCache::TryCompute(const Node& node) {
  if (!node.at_bats->published()->HasData() || !node.games->published()->HasData()) {
    return std::nullopt;
  }

  try {
    const auto lineup = node.games->Lineup(node.key.game_id).value_or(scoring::Lineup{});
    return scoring::GameStateReducer::Compute(node.at_bats->published()->Data(), lineup);
  } catch (const std::exception& e) {
    HACKTRACKER_LOG_WARN("game state compute failed, keeping previous state",
                         {StringField("game_id", node.key.game_id), StringField("error", e.what())});
    return std::nullopt;
  }
}

void GameStateCache::Release(const GameStateKey& key, std::uint64_t node_id) {
  Node* node = Find(key);
  if (node == nullptr || node->id != node_id) return;

  if (--node->observers > 0) return;

  std::weak_ptr<GameStateCache> weak = weak_from_this();
  node->release_timer = loop_->PostDelayed(keep_alive_, [weak, key] {
    if (auto self = weak.lock()) self->Expire(key);
  });
  HACKTRACKER_LOG_DEBUG("game state keep-alive armed",
                        {StringField("game_id", key.game_id), IntField("keep_alive_s", keep_alive_.count())});
}

void GameStateCache::Expire(const GameStateKey& key) {
  auto it = nodes_.find(key);
  if (it == nodes_.end() || it->second->observers > 0) return;

  HACKTRACKER_LOG_DEBUG("game state released", {StringField("game_id", key.game_id)});
  nodes_.erase(it);
}

// ------------------------------------------------------------
// Operations
// ------------------------------------------------------------

void GameStateCache::RecordAtBat(const GameStateKey& key, CreateAtBatRequest request, AtBatDone done) {
  auto at_bats = registry_->AtBats(key.game_id);

  std::optional<scoring::InGameState> current;
  if (Node* node = Find(key); node != nullptr && node->value->HasData()) {
    current = node->value->Data();
  } else {
    Node probe;
    probe.key     = key;
    probe.at_bats = at_bats;
    probe.games   = registry_->Games(key.team_id);
    current       = TryCompute(probe);
  }

  if (!current) {
    const std::string message = "Game state not available";
    HACKTRACKER_LOG_WARN("at-bat not recorded, game state unknown", {StringField("game_id", key.game_id)});
    if (done) {
      mutation::MutationOutcome<AtBat> outcome;
      outcome.error_message = message;
      done(std::move(outcome));
    }
    return;
  }

  request.set_game_id(key.game_id);
  request.set_inning(current->inning());
  request.set_outs(current->outs());

  at_bats->CreateAtBat(request, std::move(done));
}

void GameStateCache::UpdateAtBatRecord(const GameStateKey& key, const UpdateAtBatRequest& request, AtBatDone done) {
  registry_->AtBats(key.game_id)->UpdateAtBat(request, std::move(done));
}

std::optional<AtBat> GameStateCache::GetLastAtBat(const GameStateKey& key) {
  return registry_->AtBats(key.game_id)->LastAtBat();
}

std::optional<GameStateCache::Value::State> GameStateCache::Current(const GameStateKey& key) const {
  auto it = nodes_.find(key);
  if (it == nodes_.end()) return std::nullopt;
  return it->second->value->state();
}

bool GameStateCache::IsLive(const GameStateKey& key) const {
  return nodes_.count(key) > 0;
}

void GameStateCache::Reset() {
  for (auto& [key, node] : nodes_) {
    if (node->release_timer) loop_->Cancel(*node->release_timer);
  }
  HACKTRACKER_LOG_INFO("game state cache reset", {IntField("nodes", static_cast<int64_t>(nodes_.size()))});
  nodes_.clear();
}

} // namespace hacktracker::game_state
