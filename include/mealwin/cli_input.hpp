#pragma once

#include "mealwin/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mealwin {

// Input tables shared by the dataset and prediction tools.
struct SourcePaths {
  std::string meals;          // required
  std::string meal_items;     // optional, needs foods
  std::string foods;          // optional, needs meal_items
  std::string glucose;        // required
  std::string workouts;       // optional
  std::string exercise_sets;  // optional
};

struct SourceData {
  std::vector<MealEvent> meals;
  std::vector<GlucoseSample> glucose;
  std::vector<Workout> workouts;
  std::vector<ExerciseSet> sets;
};

// Consume a source option (--meals, --meal-items, --foods, --glucose,
// --workouts, --exercise-sets) at argv[*i]. Returns false if argv[*i] is not
// one of them. Throws std::runtime_error if the value is missing.
bool parse_source_arg(int argc, char** argv, int* i, SourcePaths* paths);

// Usage lines for the source options.
std::string source_args_help();

// Read all configured tables and join meal items to foods.
// Throws std::runtime_error if a required path is missing or a table is
// malformed.
SourceData load_sources(const SourcePaths& paths);

// Window configuration options: --config FILE and one --<key> VALUE override
// per MealWindowConfig field (e.g. --post-minutes 240).
struct WindowArgs {
  std::string config_path;
  std::vector<std::pair<std::string, std::string>> overrides;
};

bool parse_window_arg(int argc, char** argv, int* i, WindowArgs* w);

std::string window_args_help();

// Defaults, then the config file, then overrides in command-line order;
// the result is validated. Warnings are printed to stderr.
MealWindowConfig resolve_window_config(const WindowArgs& w);

// Parse a --start / --end value. Empty => no bound.
std::optional<int64_t> parse_time_bound(const std::string& value, const std::string& option);

} // namespace mealwin
