#pragma once

#include "mealwin/meal_macros.hpp"
#include "mealwin/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mealwin {

// Readers for the raw observation tables.
//
// All readers accept comma / semicolon / tab delimited files (see
// DelimitedTable in csv_io.hpp). Timestamps are parsed with
// parse_timestamp_to_utc_millis(); a zone-less timestamp is taken as UTC.
//
// Missing required columns, empty or unparseable required cells, and
// unparseable numeric cells throw std::runtime_error with "<path>:<line>: ".
// Numeric cells holding a missing token (empty, nan, na, ...) are unknown.
//
// Activity readers are lenient with numeric fields: an unparseable value is
// unknown (counted as 0 when aggregated) and the record is kept. Each such
// cell appends a "<path>:<line>: ..." message to *warnings when non-null.

// Columns: meal_event_id, eaten_at
// Optional: meal_grams, meal_calories_kcal, meal_carbs_g, meal_fiber_g,
//           meal_protein_g, meal_fat_g
std::vector<MealEvent> read_meals_csv(const std::string& path);

// Columns: meal_event_id, food_item_id, grams
// Optional: sort_order (defaults to the row position)
std::vector<MealItem> read_meal_items_csv(const std::string& path);

// Columns: food_item_id, serving_grams
// Optional: calories_kcal, carbs_g, fiber_g, protein_g, fat_g
std::vector<FoodItem> read_foods_csv(const std::string& path);

// Columns: measured_at, glucose_mgdl
std::vector<GlucoseSample> read_glucose_csv(const std::string& path);

// Columns: start_at
// Optional: end_at (defaults to start_at), duration_min, active_energy_kcal,
//           avg_hr_bpm, activity_type
std::vector<Workout> read_workouts_csv(const std::string& path, std::vector<std::string>* warnings = nullptr);

// Columns: performed_at
// Optional: name, reps, weight_kg
std::vector<ExerciseSet> read_exercise_sets_csv(const std::string& path,
                                                std::vector<std::string>* warnings = nullptr);

// Keep meals with start_ms <= eaten_at < end_ms. Either bound may be absent.
std::vector<MealEvent> filter_meals_by_time(const std::vector<MealEvent>& meals,
                                            const std::optional<int64_t>& start_ms,
                                            const std::optional<int64_t>& end_ms);

} // namespace mealwin
