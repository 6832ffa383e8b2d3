#pragma once

#include "mealwin/types.hpp"

#include <cstdint>
#include <vector>

namespace mealwin {

// Time-sorted, read-only view of the raw observation series.
//
// The constructor stable-sorts its own copies once (O(n log n)); every query
// is a binary-search range lookup, so building rows for m meals costs
// O(n log n + m log n) instead of rescanning the full history per meal.
//
// Queries are const and the index holds no mutable state, so one index may be
// shared by concurrent readers.
class SeriesIndex {
public:
  SeriesIndex() = default;
  SeriesIndex(std::vector<GlucoseSample> glucose,
              std::vector<Workout> workouts,
              std::vector<ExerciseSet> sets);

  // Glucose samples with (measured_at - anchor) in
  // [-before_minutes, +after_minutes] (both ends inclusive), as minutes
  // relative to the anchor, in time order.
  std::vector<RelativeSample> glucose_relative(int64_t anchor_ms,
                                               double before_minutes,
                                               double after_minutes) const;

  // Workouts with start time in [from_ms, to_ms).
  std::vector<Workout> workouts_starting_in(int64_t from_ms, int64_t to_ms) const;

  // Exercise sets with performed time in [from_ms, to_ms).
  std::vector<ExerciseSet> sets_performed_in(int64_t from_ms, int64_t to_ms) const;

private:
  std::vector<GlucoseSample> glucose_;
  std::vector<Workout> workouts_;
  std::vector<ExerciseSet> sets_;
};

// Absolute time span [*start_ms, *end_ms] needed to compute every window of
// the given meals:
//   [min eaten_at - max(pre_context, activity_pre),
//    max eaten_at + max(post, activity_post)]
//
// Returns false (outputs untouched) when meals is empty.
bool meal_series_span(const std::vector<MealEvent>& meals,
                      const MealWindowConfig& cfg,
                      int64_t* start_ms,
                      int64_t* end_ms);

// Drop observations outside [start_ms, end_ms] (inclusive), in place.
// Null pointers are ignored.
void trim_series_to_span(int64_t start_ms,
                         int64_t end_ms,
                         std::vector<GlucoseSample>* glucose,
                         std::vector<Workout>* workouts,
                         std::vector<ExerciseSet>* sets);

} // namespace mealwin
