#pragma once

#include "mealwin/activity.hpp"
#include "mealwin/context_features.hpp"
#include "mealwin/maybe_real.hpp"
#include "mealwin/series_index.hpp"
#include "mealwin/targets.hpp"
#include "mealwin/time_features.hpp"
#include "mealwin/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace mealwin {

// Model inputs for one meal. The same record is produced by the dataset
// builder and by the single-meal inference path, so training and prediction
// always see the same columns in the same order (feature_column_names()).
struct FeatureRow {
  TimeFeatures time;
  MacroTotals macros;
  ContextFeatures context;
  ActivityFeatures activity;
  MaybeReal minutes_since_prev_meal;
};

// One dataset row (one meal).
struct MealRow {
  std::string meal_event_id;
  int64_t eaten_at_ms{0};
  FeatureRow features;
  TargetRow targets;
  size_t egv_points_in_window{0};  // glucose samples in [-pre_context, +post]
};

// Fixed feature column order (24 columns).
const std::vector<std::string>& feature_column_names();

// Feature values in feature_column_names() order.
std::vector<MaybeReal> feature_values(const FeatureRow& row);

// Set a feature by column name. Returns false for an unknown name.
bool set_feature_value(FeatureRow* row, const std::string& name, const MaybeReal& v);

// Target columns written to the dataset, in order:
//   peak_mgdl, peak_inc_mgdl, incremental_auc_mgdl_min, slope_0_60_mgdl_per_min
// baseline_mgdl is a feature column and is not repeated here.
const std::vector<std::string>& target_column_names();

// Target value by name. Also accepts "baseline_mgdl".
// Returns unknown for an unrecognized name.
MaybeReal target_value(const TargetRow& row, const std::string& name);

bool is_target_column(const std::string& name);

// Set a target by column name (including "baseline_mgdl").
// Returns false for an unknown name.
bool set_target_value(TargetRow* row, const std::string& name, const MaybeReal& v);

// Glucose samples relative to the meal, sliced to
// [-pre_context_minutes, +post_minutes].
std::vector<RelativeSample> glucose_for_meal(const SeriesIndex& index,
                                             int64_t eaten_at_ms,
                                             const MealWindowConfig& cfg);

// Features of one meal, given its already-sliced glucose window.
FeatureRow compute_meal_features(const MealEvent& meal,
                                 const std::vector<RelativeSample>& glucose,
                                 const SeriesIndex& index,
                                 const MaybeReal& minutes_since_prev_meal,
                                 const MealWindowConfig& cfg);

// Build the meal-centered dataset: one row per meal, ordered by eaten_at
// (stable for equal times).
//
// The raw series may cover any time range and need not be sorted; they are
// trimmed to the span the meals need and indexed once.
//
// minutes_since_prev_meal is measured to the previous row and is unknown for
// the first row. An empty meal list yields an empty result.
std::vector<MealRow> build_meal_dataset(std::vector<MealEvent> meals,
                                        std::vector<GlucoseSample> glucose,
                                        std::vector<Workout> workouts,
                                        std::vector<ExerciseSet> sets,
                                        const MealWindowConfig& cfg);

// Features for a single meal (inference path; no targets).
//
// minutes_since_prev_meal is measured to the latest meal in all_meals that
// was eaten strictly before this one (unknown if none).
FeatureRow build_single_meal_features(const MealEvent& meal,
                                      const std::vector<MealEvent>& all_meals,
                                      std::vector<GlucoseSample> glucose,
                                      std::vector<Workout> workouts,
                                      std::vector<ExerciseSet> sets,
                                      const MealWindowConfig& cfg);

} // namespace mealwin
