#pragma once

#include "mealwin/maybe_real.hpp"
#include "mealwin/types.hpp"

#include <cstdint>
#include <vector>

namespace mealwin {

// Activity aggregated around one meal anchor.
//
// Column names keep the default window lengths (6 h before, 3 h after) for
// compatibility with existing datasets; the actual windows come from
// cfg.activity_pre_minutes / cfg.activity_post_minutes.
struct ActivityFeatures {
  MaybeReal workout_count_pre6h{0.0};
  MaybeReal workout_minutes_pre6h{0.0};
  MaybeReal workout_energy_kcal_pre6h{0.0};
  MaybeReal workout_count_post3h{0.0};
  MaybeReal workout_minutes_post3h{0.0};
  MaybeReal workout_energy_kcal_post3h{0.0};
  MaybeReal exercise_set_count_pre6h{0.0};
  MaybeReal exercise_set_volume_pre6h{0.0};
  MaybeReal exercise_set_count_post3h{0.0};
  MaybeReal exercise_set_volume_post3h{0.0};
};

// Convert a window length in minutes to whole milliseconds.
int64_t minutes_to_millis(double minutes);

// Aggregate workouts and exercise sets into the windows
//   pre  = [anchor - activity_pre_minutes, anchor)
//   post = [anchor, anchor + activity_post_minutes)
//
// - Workouts are placed by start time; sets by performed time.
// - Workouts contribute count, summed duration_min, summed active_energy_kcal.
// - Sets contribute count and volume = sum(reps * weight_kg).
// - Unknown numeric fields count as 0 (the record is still counted).
//
// The inputs need not be sorted or pre-filtered.
ActivityFeatures aggregate_activity(int64_t anchor_ms,
                                    const std::vector<Workout>& workouts,
                                    const std::vector<ExerciseSet>& sets,
                                    const MealWindowConfig& cfg);

} // namespace mealwin
