#include "mealwin/activity.hpp"

#include "test_support.hpp"
#include <cstdint>
#include <iostream>
#include <vector>

using mealwin_test::approx;

namespace {

static mealwin::Workout workout_at(int64_t start_ms, mealwin::MaybeReal minutes, mealwin::MaybeReal kcal) {
  mealwin::Workout w;
  w.start_ms = start_ms;
  w.end_ms = start_ms;
  w.duration_min = minutes;
  w.active_energy_kcal = kcal;
  return w;
}

static mealwin::ExerciseSet set_at(int64_t t_ms, mealwin::MaybeReal reps, mealwin::MaybeReal kg) {
  mealwin::ExerciseSet s;
  s.performed_at_ms = t_ms;
  s.name = "squat";
  s.reps = reps;
  s.weight_kg = kg;
  return s;
}

} // namespace

int main() {
  using namespace mealwin;

  assert(minutes_to_millis(1.0) == 60000);
  assert(minutes_to_millis(0.5) == 30000);
  assert(minutes_to_millis(-2.0) == -120000);

  const MealWindowConfig cfg;
  const int64_t anchor = 1704542400000LL;  // 2024-01-06T12:00:00Z
  const int64_t kMinute = 60000;

  // Nothing logged => all zeros (known, not unknown).
  {
    const ActivityFeatures a = aggregate_activity(anchor, {}, {}, cfg);
    assert(a.workout_count_pre6h == 0.0);
    assert(a.exercise_set_volume_post3h == 0.0);
  }

  {
    const std::vector<Workout> workouts = {
        workout_at(anchor - 60 * kMinute, 30.0, 200.0),
        workout_at(anchor - 360 * kMinute, 10.0, MaybeReal()),  // window start is inclusive
        workout_at(anchor - 361 * kMinute, 99.0, 999.0),        // too early
        workout_at(anchor, 20.0, 150.0),                    // anchor belongs to post
        workout_at(anchor + 180 * kMinute, 99.0, 999.0),        // window end is exclusive
    };
    const std::vector<ExerciseSet> sets = {
        set_at(anchor - 10 * kMinute, 10.0, 50.0),
        set_at(anchor - 5 * kMinute, MaybeReal(), 50.0),
        set_at(anchor + 30 * kMinute, 5.0, 20.0),
        set_at(anchor + 200 * kMinute, 5.0, 20.0),
    };

    const ActivityFeatures a = aggregate_activity(anchor, workouts, sets, cfg);
    assert(approx(a.workout_count_pre6h.value(), 2.0));
    assert(approx(a.workout_minutes_pre6h.value(), 40.0));
    assert(approx(a.workout_energy_kcal_pre6h.value(), 200.0));
    assert(approx(a.workout_count_post3h.value(), 1.0));
    assert(approx(a.workout_minutes_post3h.value(), 20.0));
    assert(approx(a.workout_energy_kcal_post3h.value(), 150.0));

    assert(approx(a.exercise_set_count_pre6h.value(), 2.0));
    assert(approx(a.exercise_set_volume_pre6h.value(), 500.0));
    assert(approx(a.exercise_set_count_post3h.value(), 1.0));
    assert(approx(a.exercise_set_volume_post3h.value(), 100.0));
  }

  // Configurable windows.
  {
    MealWindowConfig narrow = cfg;
    narrow.activity_pre_minutes = 30.0;
    narrow.activity_post_minutes = 10.0;
    const std::vector<Workout> workouts = {
        workout_at(anchor - 60 * kMinute, 30.0, 200.0),
        workout_at(anchor - 20 * kMinute, 15.0, 100.0),
        workout_at(anchor + 20 * kMinute, 15.0, 100.0),
    };
    const ActivityFeatures a = aggregate_activity(anchor, workouts, {}, narrow);
    assert(approx(a.workout_count_pre6h.value(), 1.0));
    assert(approx(a.workout_minutes_pre6h.value(), 15.0));
    assert(approx(a.workout_count_post3h.value(), 0.0));
  }

  std::cout << "ok\n";
  return 0;
}
