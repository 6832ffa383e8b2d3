#pragma once

#include "mealwin/maybe_real.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace mealwin {

// All absolute timestamps are UTC milliseconds since the Unix epoch.
//
// Boundary readers normalize every timestamp to UTC before anything reaches
// the feature engine (see parse_timestamp_to_utc_millis in utils.hpp).

// Summed meal composition (see meal_macros.hpp).
struct MacroTotals {
  MaybeReal meal_grams;
  MaybeReal meal_calories_kcal;
  MaybeReal meal_carbs_g;
  MaybeReal meal_fiber_g;
  MaybeReal meal_protein_g;
  MaybeReal meal_fat_g;
};

struct MealEvent {
  std::string id;          // opaque identifier
  int64_t eaten_at_ms{0};  // meal anchor
  MacroTotals macros;
};

// One continuous glucose monitor reading (EGV).
struct GlucoseSample {
  int64_t measured_at_ms{0};
  MaybeReal glucose_mgdl;
};

struct Workout {
  int64_t start_ms{0};
  int64_t end_ms{0};
  MaybeReal duration_min;
  MaybeReal active_energy_kcal;
  MaybeReal avg_hr_bpm;
  std::string activity_type;
};

struct ExerciseSet {
  int64_t performed_at_ms{0};
  std::string name;
  MaybeReal reps;
  MaybeReal weight_kg;
};

// A glucose value expressed relative to a meal anchor.
//
// minute is (measured_at - eaten_at) in minutes; negative before the meal.
// A non-finite minute is treated like a missing sample by every consumer.
struct RelativeSample {
  double minute{0.0};
  MaybeReal value;
};

// One point of a uniform time grid (see grid_resample.hpp).
struct GridPoint {
  double minute{0.0};
  MaybeReal value;  // unknown when the grid point is not covered by data
};

// Window lengths (minutes) and quality thresholds shared by every computation
// of one run. Pass it explicitly; there is no global configuration.
//
// Windows relative to the meal anchor:
//   baseline  [-pre_baseline_minutes, 0)
//   context   [-pre_context_minutes, 0)
//   outcome   [0, post_minutes]
//   slope     [0, min(slope_minutes, post_minutes)]
//   activity  [-activity_pre_minutes, 0) and [0, activity_post_minutes)
//
// slope_minutes <= post_minutes is assumed but not enforced (see
// window_config_warnings in window_config.hpp).
struct MealWindowConfig {
  double pre_baseline_minutes{30.0};
  double pre_context_minutes{120.0};
  double post_minutes{180.0};
  double slope_minutes{60.0};
  double grid_minutes{5.0};
  double activity_pre_minutes{360.0};
  double activity_post_minutes{180.0};

  size_t min_points_pre_baseline{3};
  size_t min_points_post{10};

  // Offset added to UTC anchors when deriving calendar features
  // (hour of day, day of week). 0 => calendar features are in UTC.
  double local_utc_offset_minutes{0.0};
};

} // namespace mealwin
