#pragma once

#include <string>
#include <string_view>

namespace hacktracker::scoring {

/*
  Result-code semantics.

  Every consumer that needs to know whether a code is an out, a hit, etc.
  goes through these functions. Codes are compared after Normalize()
  (trimmed, ASCII uppercase). Unknown codes are neither outs nor hits.
*/

enum class ResultClass {
  kOut,
  kHit,
  kWalk,
  kHitByPitch,
  kReachedOnError,
  kUnknown,
};

std::string Normalize(std::string_view code);

bool IsOut(std::string_view code);

// 3 for triple plays, 2 for double plays, 1 for any other out, else 0.
int OutCount(std::string_view code);

bool IsHit(std::string_view code);
bool IsWalk(std::string_view code);
bool IsHitByPitch(std::string_view code);

// hit, walk, HBP, error or fielder's choice
bool ReachesBase(std::string_view code);

ResultClass Classify(std::string_view code);

const char* ToString(ResultClass result_class);

} // namespace hacktracker::scoring
