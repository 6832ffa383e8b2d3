#include "mealwin/time_features.hpp"

#include "mealwin/activity.hpp"
#include "mealwin/utils.hpp"

namespace mealwin {

TimeFeatures compute_time_features(int64_t eaten_at_ms, const MealWindowConfig& cfg) {
  const CivilTime c = civil_from_millis(eaten_at_ms + minutes_to_millis(cfg.local_utc_offset_minutes));

  TimeFeatures f;
  f.meal_hour = static_cast<double>(c.hour);
  f.meal_dow = static_cast<double>(c.weekday);
  f.meal_is_weekend = (c.weekday >= 5) ? 1.0 : 0.0;
  return f;
}

} // namespace mealwin
