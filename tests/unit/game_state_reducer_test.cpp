#include "internal/scoring/game_state_reducer.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"
#include "tests/support/fake_scoring_api.hpp"

namespace {

using hacktracker::scoring::AtBats;
using hacktracker::scoring::GameStateReducer;
using hacktracker::scoring::Lineup;
using hacktracker::testing::MakeAtBat;
using hacktracker::testing::Slot;
using hacktracker::util::ValidationError;

Lineup ThreeBatters() {
  return {Slot("p1", 1), Slot("p2", 2), Slot("p3", 3)};
}

template <typename Fn>
bool ThrowsValidation(Fn fn) {
  try {
    fn();
  } catch (const ValidationError&) {
    return true;
  }
  return false;
}

void TestEmptyLogIsInitialState() {
  const auto state = GameStateReducer::Compute({}, ThreeBatters());
  assert(state.inning() == 1);
  assert(state.outs() == 0);
  assert(state.batter_index() == 0);
  assert(state.batter_player_id() == "p1");
  assert(state == GameStateReducer::Initial(ThreeBatters()));
}

void TestThreeOutsRollTheInningAndBatterWraps() {
  const AtBats log = {MakeAtBat("a", "K", 10), MakeAtBat("b", "1B", 20), MakeAtBat("c", "GO", 30)};
  const auto   state = GameStateReducer::Compute(log, ThreeBatters());

  assert(state.inning() == 1);
  assert(state.outs() == 2);
  assert(state.batter_index() == 0);
  assert(state.batter_player_id() == "p1");

  const AtBats more = {MakeAtBat("a", "K", 10), MakeAtBat("b", "1B", 20), MakeAtBat("c", "GO", 30), MakeAtBat("d", "F8", 40)};
  const auto   next = GameStateReducer::Compute(more, ThreeBatters());
  assert(next.inning() == 2);
  assert(next.outs() == 0);
  assert(next.batter_player_id() == "p2");
}

void TestDoublePlayCarriesExtraOut() {
  const AtBats log = {MakeAtBat("a", "K", 10), MakeAtBat("b", "DP643", 20)};
  const auto   state = GameStateReducer::Compute(log, ThreeBatters());
  assert(state.inning() == 2);
  assert(state.outs() == 0);

  const AtBats overflow = {MakeAtBat("a", "K", 10), MakeAtBat("b", "K", 20), MakeAtBat("c", "DP", 30)};
  const auto   carried  = GameStateReducer::Compute(overflow, ThreeBatters());
  assert(carried.inning() == 2);
  assert(carried.outs() == 1);
}

void TestTriplePlayEndsTheInning() {
  const AtBats log   = {MakeAtBat("a", "1B", 10), MakeAtBat("b", "TP", 20)};
  const auto   state = GameStateReducer::Compute(log, ThreeBatters());
  assert(state.inning() == 2);
  assert(state.outs() == 0);
  assert(state.batter_index() == 2);
}

void TestBatterIndexIsCountModuloLineup() {
  AtBats log;
  for (int i = 0; i < 7; ++i) {
    log.push_back(MakeAtBat("ab" + std::to_string(i), "BB", 100 + i));
  }
  const auto state = GameStateReducer::Compute(log, ThreeBatters());
  assert(state.batter_index() == 7 % 3);
  assert(state.batter_player_id() == "p2");
  assert(state.inning() == 1 && state.outs() == 0);
}

void TestLineupIsSortedByBattingOrder() {
  const Lineup shuffled = {Slot("p9", 9), Slot("p1", 1), Slot("p4", 4)};
  const AtBats log      = {MakeAtBat("a", "K", 10)};
  const auto   state    = GameStateReducer::Compute(log, shuffled);
  assert(state.batter_index() == 1);
  assert(state.batter_player_id() == "p4");
}

void TestInputOrderDoesNotMatter() {
  const AtBats ordered  = {MakeAtBat("a", "K", 10), MakeAtBat("b", "1B", 20), MakeAtBat("c", "DP", 30)};
  const AtBats shuffled = {ordered[2], ordered[0], ordered[1]};
  assert(GameStateReducer::Compute(ordered, ThreeBatters()) == GameStateReducer::Compute(shuffled, ThreeBatters()));
}

void TestEqualTimestampsBreakOnSequenceThenId() {
  const AtBats log = {MakeAtBat("z", "K", 10, 1), MakeAtBat("a", "1B", 10, 2), MakeAtBat("m", "GO", 10, 0),
                      MakeAtBat("b", "GO", 10, 0)};

  const auto ordered = GameStateReducer::OrderEvents(log);
  assert(ordered[0].at_bat_id() == "b");
  assert(ordered[1].at_bat_id() == "m");
  assert(ordered[2].at_bat_id() == "z");
  assert(ordered[3].at_bat_id() == "a");

  assert(GameStateReducer::Precedes(log[0], log[1]));
  assert(!GameStateReducer::Precedes(log[1], log[0]));
}

void TestInvalidLineupsAreRejected() {
  assert(ThrowsValidation([] { GameStateReducer::Compute({}, {}); }));
  assert(ThrowsValidation([] { GameStateReducer::Compute({}, {Slot("", 1)}); }));
  assert(ThrowsValidation([] { GameStateReducer::Compute({}, {Slot("p1", 0)}); }));
  assert(ThrowsValidation([] { GameStateReducer::Compute({}, {Slot("p1", -2)}); }));
  assert(ThrowsValidation([] { GameStateReducer::Compute({}, {Slot("p1", 1), Slot("p2", 1)}); }));
}

void TestMalformedEventsAreRejected() {
  assert(ThrowsValidation([] { GameStateReducer::Compute({MakeAtBat("", "K", 10)}, ThreeBatters()); }));
  assert(ThrowsValidation([] { GameStateReducer::Compute({MakeAtBat("a", "   ", 10)}, ThreeBatters()); }));
}

void TestUnknownResultsOnlyAdvanceTheBatter() {
  const AtBats log   = {MakeAtBat("a", "BALK", 10), MakeAtBat("b", "E", 20)};
  const auto   state = GameStateReducer::Compute(log, ThreeBatters());
  assert(state.outs() == 0);
  assert(state.batter_index() == 2);
}

} // namespace

int main() {
  TestEmptyLogIsInitialState();
  TestThreeOutsRollTheInningAndBatterWraps();
  TestDoublePlayCarriesExtraOut();
  TestTriplePlayEndsTheInning();
  TestBatterIndexIsCountModuloLineup();
  TestLineupIsSortedByBattingOrder();
  TestInputOrderDoesNotMatter();
  TestEqualTimestampsBreakOnSequenceThenId();
  TestInvalidLineupsAreRejected();
  TestMalformedEventsAreRejected();
  TestUnknownResultsOnlyAdvanceTheBatter();

  std::cout << "hacktracker_unit_game_state_reducer: pass\n";
  return 0;
}
