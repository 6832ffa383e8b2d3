#include "mealwin/cli_input.hpp"

#include "mealwin/meal_macros.hpp"
#include "mealwin/source_io.hpp"
#include "mealwin/utils.hpp"
#include "mealwin/window_config.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace mealwin {

namespace {

static std::string take_value(int argc, char** argv, int* i, const std::string& opt) {
  if (*i + 1 >= argc) throw std::runtime_error("Missing value for " + opt);
  ++(*i);
  return argv[*i];
}

static std::string key_to_flag(std::string key) {
  std::replace(key.begin(), key.end(), '_', '-');
  return "--" + key;
}

} // namespace

bool parse_source_arg(int argc, char** argv, int* i, SourcePaths* paths) {
  const std::string arg = argv[*i];
  std::string* dst = nullptr;
  if (arg == "--meals") dst = &paths->meals;
  else if (arg == "--meal-items") dst = &paths->meal_items;
  else if (arg == "--foods") dst = &paths->foods;
  else if (arg == "--glucose") dst = &paths->glucose;
  else if (arg == "--workouts") dst = &paths->workouts;
  else if (arg == "--exercise-sets") dst = &paths->exercise_sets;
  if (!dst) return false;
  *dst = take_value(argc, argv, i, arg);
  return true;
}

std::string source_args_help() {
  return "  --meals PATH             Meal events table (meal_event_id,eaten_at[,meal_* macros])\n"
         "  --meal-items PATH        Meal items table (meal_event_id,food_item_id,grams[,sort_order])\n"
         "  --foods PATH             Food table (food_item_id,serving_grams,calories_kcal,...)\n"
         "                           --meal-items and --foods go together and replace meal_* columns\n"
         "  --glucose PATH           Glucose readings (measured_at,glucose_mgdl)\n"
         "  --workouts PATH          Optional workouts (start_at,end_at,duration_min,active_energy_kcal,...)\n"
         "  --exercise-sets PATH     Optional exercise sets (performed_at,name,reps,weight_kg)\n";
}

SourceData load_sources(const SourcePaths& paths) {
  if (paths.meals.empty()) throw std::runtime_error("--meals is required");
  if (paths.glucose.empty()) throw std::runtime_error("--glucose is required");
  if (paths.meal_items.empty() != paths.foods.empty()) {
    throw std::runtime_error("--meal-items and --foods must be given together");
  }

  SourceData d;
  d.meals = read_meals_csv(paths.meals);
  if (!paths.meal_items.empty()) {
    attach_meal_macros(&d.meals, read_meal_items_csv(paths.meal_items), read_foods_csv(paths.foods));
  }
  d.glucose = read_glucose_csv(paths.glucose);
  std::vector<std::string> warnings;
  if (!paths.workouts.empty()) d.workouts = read_workouts_csv(paths.workouts, &warnings);
  if (!paths.exercise_sets.empty()) d.sets = read_exercise_sets_csv(paths.exercise_sets, &warnings);
  for (const auto& msg : warnings) {
    std::cerr << "Warning: " << msg << "\n";
  }
  return d;
}

bool parse_window_arg(int argc, char** argv, int* i, WindowArgs* w) {
  const std::string arg = argv[*i];
  if (arg == "--config") {
    w->config_path = take_value(argc, argv, i, arg);
    return true;
  }
  for (const auto& key : window_config_keys()) {
    if (arg == key_to_flag(key)) {
      w->overrides.emplace_back(key, take_value(argc, argv, i, arg));
      return true;
    }
  }
  return false;
}

std::string window_args_help() {
  std::ostringstream o;
  o << "  --config FILE            Window config (key=value lines)\n";
  const MealWindowConfig defaults;
  const std::string formatted = format_window_config(defaults);
  for (const auto& line : split(formatted, '\n')) {
    const size_t eq = line.find('=');
    if (eq == std::string::npos) continue;
    std::string flag = key_to_flag(line.substr(0, eq)) + " X";
    if (flag.size() < 25) flag.resize(25, ' ');
    o << "  " << flag << "default: " << line.substr(eq + 1) << "\n";
  }
  return o.str();
}

MealWindowConfig resolve_window_config(const WindowArgs& w) {
  MealWindowConfig cfg;
  if (!w.config_path.empty()) load_window_config_into(w.config_path, &cfg);
  for (const auto& kv : w.overrides) {
    try {
      set_window_config_value(&cfg, kv.first, kv.second);
    } catch (const std::exception& e) {
      throw std::runtime_error(key_to_flag(kv.first) + ": " + e.what());
    }
  }
  validate_window_config(cfg);
  for (const auto& msg : window_config_warnings(cfg)) {
    std::cerr << "Warning: " << msg << "\n";
  }
  return cfg;
}

std::optional<int64_t> parse_time_bound(const std::string& value, const std::string& option) {
  if (trim(value).empty()) return std::nullopt;
  int64_t ms = 0;
  if (!parse_timestamp_to_utc_millis(value, &ms)) {
    throw std::runtime_error("Invalid timestamp for " + option + ": '" + value + "'");
  }
  return ms;
}

} // namespace mealwin
