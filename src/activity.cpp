#include "mealwin/activity.hpp"

#include <cmath>
#include <vector>

namespace mealwin {

int64_t minutes_to_millis(double minutes) {
  if (!std::isfinite(minutes)) return 0;
  return static_cast<int64_t>(std::llround(minutes * 60000.0));
}

ActivityFeatures aggregate_activity(int64_t anchor_ms,
                                    const std::vector<Workout>& workouts,
                                    const std::vector<ExerciseSet>& sets,
                                    const MealWindowConfig& cfg) {
  const int64_t pre_start = anchor_ms - minutes_to_millis(cfg.activity_pre_minutes);
  const int64_t post_end = anchor_ms + minutes_to_millis(cfg.activity_post_minutes);

  ActivityFeatures a;

  for (const auto& w : workouts) {
    const double minutes = w.duration_min.value_or(0.0);
    const double kcal = w.active_energy_kcal.value_or(0.0);
    if (w.start_ms >= pre_start && w.start_ms < anchor_ms) {
      a.workout_count_pre6h += 1.0;
      a.workout_minutes_pre6h += minutes;
      a.workout_energy_kcal_pre6h += kcal;
    } else if (w.start_ms >= anchor_ms && w.start_ms < post_end) {
      a.workout_count_post3h += 1.0;
      a.workout_minutes_post3h += minutes;
      a.workout_energy_kcal_post3h += kcal;
    }
  }

  for (const auto& s : sets) {
    const double volume = s.reps.value_or(0.0) * s.weight_kg.value_or(0.0);
    if (s.performed_at_ms >= pre_start && s.performed_at_ms < anchor_ms) {
      a.exercise_set_count_pre6h += 1.0;
      a.exercise_set_volume_pre6h += volume;
    } else if (s.performed_at_ms >= anchor_ms && s.performed_at_ms < post_end) {
      a.exercise_set_count_post3h += 1.0;
      a.exercise_set_volume_post3h += volume;
    }
  }

  return a;
}

} // namespace mealwin
