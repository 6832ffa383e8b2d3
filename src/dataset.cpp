#include "mealwin/dataset.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace mealwin {

namespace {

struct FeatureField {
  const char* name;
  MaybeReal& (*ref)(FeatureRow&);
};

static const std::vector<FeatureField>& feature_fields() {
  static const std::vector<FeatureField> fields = {
    {"meal_hour", [](FeatureRow& r) -> MaybeReal& { return r.time.meal_hour; }},
    {"meal_dow", [](FeatureRow& r) -> MaybeReal& { return r.time.meal_dow; }},
    {"meal_is_weekend", [](FeatureRow& r) -> MaybeReal& { return r.time.meal_is_weekend; }},
    {"meal_grams", [](FeatureRow& r) -> MaybeReal& { return r.macros.meal_grams; }},
    {"meal_calories_kcal", [](FeatureRow& r) -> MaybeReal& { return r.macros.meal_calories_kcal; }},
    {"meal_carbs_g", [](FeatureRow& r) -> MaybeReal& { return r.macros.meal_carbs_g; }},
    {"meal_fiber_g", [](FeatureRow& r) -> MaybeReal& { return r.macros.meal_fiber_g; }},
    {"meal_protein_g", [](FeatureRow& r) -> MaybeReal& { return r.macros.meal_protein_g; }},
    {"meal_fat_g", [](FeatureRow& r) -> MaybeReal& { return r.macros.meal_fat_g; }},
    {"baseline_mgdl", [](FeatureRow& r) -> MaybeReal& { return r.context.baseline_mgdl; }},
    {"pre_slope_mgdl_per_min", [](FeatureRow& r) -> MaybeReal& { return r.context.pre_slope_mgdl_per_min; }},
    {"pre_mean_mgdl", [](FeatureRow& r) -> MaybeReal& { return r.context.pre_mean_mgdl; }},
    {"pre_std_mgdl", [](FeatureRow& r) -> MaybeReal& { return r.context.pre_std_mgdl; }},
    {"workout_count_pre6h", [](FeatureRow& r) -> MaybeReal& { return r.activity.workout_count_pre6h; }},
    {"workout_minutes_pre6h", [](FeatureRow& r) -> MaybeReal& { return r.activity.workout_minutes_pre6h; }},
    {"workout_energy_kcal_pre6h", [](FeatureRow& r) -> MaybeReal& { return r.activity.workout_energy_kcal_pre6h; }},
    {"workout_count_post3h", [](FeatureRow& r) -> MaybeReal& { return r.activity.workout_count_post3h; }},
    {"workout_minutes_post3h", [](FeatureRow& r) -> MaybeReal& { return r.activity.workout_minutes_post3h; }},
    {"workout_energy_kcal_post3h", [](FeatureRow& r) -> MaybeReal& { return r.activity.workout_energy_kcal_post3h; }},
    {"exercise_set_count_pre6h", [](FeatureRow& r) -> MaybeReal& { return r.activity.exercise_set_count_pre6h; }},
    {"exercise_set_volume_pre6h", [](FeatureRow& r) -> MaybeReal& { return r.activity.exercise_set_volume_pre6h; }},
    {"exercise_set_count_post3h", [](FeatureRow& r) -> MaybeReal& { return r.activity.exercise_set_count_post3h; }},
    {"exercise_set_volume_post3h", [](FeatureRow& r) -> MaybeReal& { return r.activity.exercise_set_volume_post3h; }},
    {"minutes_since_prev_meal", [](FeatureRow& r) -> MaybeReal& { return r.minutes_since_prev_meal; }},
  };
  return fields;
}

struct TargetField {
  const char* name;
  MaybeReal& (*ref)(TargetRow&);
};

static const std::vector<TargetField>& target_fields() {
  static const std::vector<TargetField> fields = {
    {"peak_mgdl", [](TargetRow& r) -> MaybeReal& { return r.peak_mgdl; }},
    {"peak_inc_mgdl", [](TargetRow& r) -> MaybeReal& { return r.peak_inc_mgdl; }},
    {"incremental_auc_mgdl_min", [](TargetRow& r) -> MaybeReal& { return r.incremental_auc_mgdl_min; }},
    {"slope_0_60_mgdl_per_min", [](TargetRow& r) -> MaybeReal& { return r.slope_0_60_mgdl_per_min; }},
  };
  return fields;
}

static std::vector<std::string> names_of(const std::vector<FeatureField>& fields) {
  std::vector<std::string> out;
  for (const auto& f : fields) out.emplace_back(f.name);
  return out;
}

static std::vector<std::string> names_of(const std::vector<TargetField>& fields) {
  std::vector<std::string> out;
  for (const auto& f : fields) out.emplace_back(f.name);
  return out;
}

static MaybeReal minutes_between(int64_t earlier_ms, int64_t later_ms) {
  return static_cast<double>(later_ms - earlier_ms) / 60000.0;
}

} // namespace

const std::vector<std::string>& feature_column_names() {
  static const std::vector<std::string> names = names_of(feature_fields());
  return names;
}

std::vector<MaybeReal> feature_values(const FeatureRow& row) {
  FeatureRow copy = row;
  std::vector<MaybeReal> out;
  out.reserve(feature_fields().size());
  for (const auto& f : feature_fields()) out.push_back(f.ref(copy));
  return out;
}

bool set_feature_value(FeatureRow* row, const std::string& name, const MaybeReal& v) {
  if (!row) return false;
  for (const auto& f : feature_fields()) {
    if (name == f.name) {
      f.ref(*row) = v;
      return true;
    }
  }
  return false;
}

const std::vector<std::string>& target_column_names() {
  static const std::vector<std::string> names = names_of(target_fields());
  return names;
}

MaybeReal target_value(const TargetRow& row, const std::string& name) {
  if (name == "baseline_mgdl") return row.baseline_mgdl;
  TargetRow copy = row;
  for (const auto& f : target_fields()) {
    if (name == f.name) return f.ref(copy);
  }
  return MaybeReal();
}

bool is_target_column(const std::string& name) {
  for (const auto& f : target_fields()) {
    if (name == f.name) return true;
  }
  return false;
}

bool set_target_value(TargetRow* row, const std::string& name, const MaybeReal& v) {
  if (!row) return false;
  if (name == "baseline_mgdl") {
    row->baseline_mgdl = v;
    return true;
  }
  for (const auto& f : target_fields()) {
    if (name == f.name) {
      f.ref(*row) = v;
      return true;
    }
  }
  return false;
}

std::vector<RelativeSample> glucose_for_meal(const SeriesIndex& index,
                                             int64_t eaten_at_ms,
                                             const MealWindowConfig& cfg) {
  return index.glucose_relative(eaten_at_ms, cfg.pre_context_minutes, cfg.post_minutes);
}

FeatureRow compute_meal_features(const MealEvent& meal,
                                 const std::vector<RelativeSample>& glucose,
                                 const SeriesIndex& index,
                                 const MaybeReal& minutes_since_prev_meal,
                                 const MealWindowConfig& cfg) {
  FeatureRow f;
  f.time = compute_time_features(meal.eaten_at_ms, cfg);
  f.macros = meal.macros;
  f.context = compute_context_features(glucose, cfg);

  const int64_t from_ms = meal.eaten_at_ms - minutes_to_millis(cfg.activity_pre_minutes);
  const int64_t to_ms = meal.eaten_at_ms + minutes_to_millis(cfg.activity_post_minutes);
  f.activity = aggregate_activity(meal.eaten_at_ms,
                                  index.workouts_starting_in(from_ms, to_ms),
                                  index.sets_performed_in(from_ms, to_ms),
                                  cfg);

  f.minutes_since_prev_meal = minutes_since_prev_meal;
  return f;
}

std::vector<MealRow> build_meal_dataset(std::vector<MealEvent> meals,
                                        std::vector<GlucoseSample> glucose,
                                        std::vector<Workout> workouts,
                                        std::vector<ExerciseSet> sets,
                                        const MealWindowConfig& cfg) {
  std::vector<MealRow> rows;
  if (meals.empty()) return rows;

  std::stable_sort(meals.begin(), meals.end(), [](const MealEvent& a, const MealEvent& b) {
    return a.eaten_at_ms < b.eaten_at_ms;
  });

  int64_t span_start = 0;
  int64_t span_end = 0;
  meal_series_span(meals, cfg, &span_start, &span_end);
  trim_series_to_span(span_start, span_end, &glucose, &workouts, &sets);
  const SeriesIndex index(std::move(glucose), std::move(workouts), std::move(sets));

  rows.reserve(meals.size());
  for (size_t i = 0; i < meals.size(); ++i) {
    const MealEvent& meal = meals[i];
    const std::vector<RelativeSample> g = glucose_for_meal(index, meal.eaten_at_ms, cfg);

    const MaybeReal since_prev = (i == 0) ? MaybeReal()
                                          : minutes_between(meals[i - 1].eaten_at_ms, meal.eaten_at_ms);

    MealRow row;
    row.meal_event_id = meal.id;
    row.eaten_at_ms = meal.eaten_at_ms;
    row.features = compute_meal_features(meal, g, index, since_prev, cfg);
    row.targets = compute_targets(g, cfg);
    row.egv_points_in_window = g.size();
    rows.push_back(std::move(row));
  }
  return rows;
}

FeatureRow build_single_meal_features(const MealEvent& meal,
                                      const std::vector<MealEvent>& all_meals,
                                      std::vector<GlucoseSample> glucose,
                                      std::vector<Workout> workouts,
                                      std::vector<ExerciseSet> sets,
                                      const MealWindowConfig& cfg) {
  MaybeReal since_prev;
  bool have_prev = false;
  int64_t prev_ms = 0;
  for (const auto& m : all_meals) {
    if (m.eaten_at_ms >= meal.eaten_at_ms) continue;
    if (!have_prev || m.eaten_at_ms > prev_ms) prev_ms = m.eaten_at_ms;
    have_prev = true;
  }
  if (have_prev) since_prev = minutes_between(prev_ms, meal.eaten_at_ms);

  int64_t span_start = 0;
  int64_t span_end = 0;
  meal_series_span(std::vector<MealEvent>{meal}, cfg, &span_start, &span_end);
  trim_series_to_span(span_start, span_end, &glucose, &workouts, &sets);
  const SeriesIndex index(std::move(glucose), std::move(workouts), std::move(sets));

  const std::vector<RelativeSample> g = glucose_for_meal(index, meal.eaten_at_ms, cfg);
  return compute_meal_features(meal, g, index, since_prev, cfg);
}

} // namespace mealwin
