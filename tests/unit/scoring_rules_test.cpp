#include "internal/scoring/scoring_rules.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using namespace hacktracker::scoring;

void TestSingleOutCodes() {
  for (const char* code : {"K", "OUT", "FO", "GO", "PO", "LO", "F7", "F8", "F9", "L7", "L8", "L9", "P3", "P4", "P5", "P6", "G3",
                           "G4", "G5", "G6", "SF", "SH", "SAC"}) {
    assert(IsOut(code));
    assert(OutCount(code) == 1);
    assert(!IsHit(code));
    assert(Classify(code) == ResultClass::kOut);
  }
}

void TestDoubleAndTriplePlays() {
  assert(OutCount("DP") == 2);
  assert(OutCount("DP643") == 2);
  assert(OutCount("DOUBLE_PLAY") == 2);
  assert(OutCount("TP") == 3);
  assert(OutCount("TP543") == 3);
  assert(OutCount("TRIPLE_PLAY") == 3);
  assert(IsOut("dp"));
  assert(IsOut("TRIPLE_PLAY"));
}

void TestNormalizationTrimsAndUppercases() {
  assert(Normalize("  go \t") == "GO");
  assert(Normalize("hr") == "HR");
  assert(OutCount(" k ") == 1);
  assert(IsHit(" home_run"));
  assert(Normalize("") == "");
}

void TestHitsWalksAndReachingBase() {
  for (const char* code : {"1B", "2B", "3B", "HR", "SINGLE", "DOUBLE", "TRIPLE", "HOMERUN", "HOME_RUN"}) {
    assert(IsHit(code));
    assert(ReachesBase(code));
    assert(OutCount(code) == 0);
  }

  assert(IsWalk("BB") && IsWalk("walk") && IsWalk("BASE_ON_BALLS"));
  assert(IsHitByPitch("HBP") && IsHitByPitch("hit_by_pitch"));
  assert(!IsHit("BB"));

  assert(ReachesBase("E") && ReachesBase("FC") && ReachesBase("FIELDERS_CHOICE") && ReachesBase("error"));
  assert(Classify("FC") == ResultClass::kReachedOnError);
  assert(Classify("HBP") == ResultClass::kHitByPitch);
  assert(Classify("bb") == ResultClass::kWalk);
  assert(Classify("2b") == ResultClass::kHit);
}

void TestUnknownCodesAreNeutral() {
  for (const char* code : {"XYZ", "", "BALK", "K2"}) {
    assert(!IsOut(code));
    assert(!IsHit(code));
    assert(!ReachesBase(code));
    assert(OutCount(code) == 0);
    assert(Classify(code) == ResultClass::kUnknown);
  }
  assert(std::string(ToString(ResultClass::kUnknown)) == "unknown");
  assert(std::string(ToString(ResultClass::kOut)) == "out");
}

} // namespace

int main() {
  TestSingleOutCodes();
  TestDoubleAndTriplePlays();
  TestNormalizationTrimsAndUppercases();
  TestHitsWalksAndReachingBase();
  TestUnknownCodesAreNeutral();

  std::cout << "hacktracker_unit_scoring_rules: pass\n";
  return 0;
}
