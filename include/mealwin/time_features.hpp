#pragma once

#include "mealwin/maybe_real.hpp"
#include "mealwin/types.hpp"

#include <cstdint>

namespace mealwin {

struct TimeFeatures {
  MaybeReal meal_hour;        // 0..23
  MaybeReal meal_dow;         // 0 = Monday ... 6 = Sunday
  MaybeReal meal_is_weekend;  // 1 for Saturday/Sunday, else 0
};

// Calendar features of a meal anchor, evaluated at
// eaten_at + cfg.local_utc_offset_minutes.
TimeFeatures compute_time_features(int64_t eaten_at_ms, const MealWindowConfig& cfg);

} // namespace mealwin
