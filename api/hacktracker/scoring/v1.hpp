#pragma once

#include "hacktracker/scoring/v1/atbat.pb.h"
#include "hacktracker/scoring/v1/game.pb.h"

#include "hacktracker/cache/v1/cache_entry.pb.h"

namespace hacktracker::scoring::v1 {
using namespace ::hacktracker::cache::v1;
}
