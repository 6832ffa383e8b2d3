#include "mealwin/source_io.hpp"
#include "mealwin/utils.hpp"

#include "test_support.hpp"
#include <cstdint>
#include <fstream>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

static void write_file(const std::string& path, const std::string& content) {
  std::ofstream f(path, std::ios::binary);
  f << content;
}

static int64_t at(const std::string& ts) {
  int64_t ms = 0;
  assert(mealwin::parse_iso8601_to_utc_millis(ts, &ms));
  return ms;
}

// Runs fn and returns the runtime_error message ("" if nothing was thrown).
static std::string error_of(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const std::runtime_error& e) {
    return e.what();
  }
  return std::string();
}

} // namespace

int main() {
  using namespace mealwin;

  // Meals: naive timestamps are UTC, offsets are normalized.
  {
    const std::string path = "test_source_io_meals_tmp.csv";
    write_file(path,
               "meal_event_id,eaten_at,meal_carbs_g\n"
               "m1,2024-01-01 08:00:00,45\n"
               "m2,2024-01-01T14:00:00+02:00,NA\n");
    const std::vector<MealEvent> meals = read_meals_csv(path);
    assert(meals.size() == 2);
    assert(meals[0].id == "m1");
    assert(meals[0].eaten_at_ms == at("2024-01-01T08:00:00Z"));
    assert(meals[0].macros.meal_carbs_g == 45.0);
    assert(!meals[0].macros.meal_fat_g.known());
    assert(meals[1].eaten_at_ms == at("2024-01-01T12:00:00Z"));
    assert(!meals[1].macros.meal_carbs_g.known());
  }

  // Errors carry file and line.
  {
    const std::string path = "test_source_io_bad_meals_tmp.csv";
    write_file(path,
               "meal_event_id,eaten_at\n"
               "m1,2024-01-01T08:00:00Z\n"
               "m2,not a time\n");
    const std::string msg = error_of([&] { (void)read_meals_csv(path); });
    assert(msg.find(path + ":3:") != std::string::npos);
    assert(msg.find("eaten_at") != std::string::npos);

    write_file(path, "meal_event_id,eaten_at\n,2024-01-01T08:00:00Z\n");
    assert(error_of([&] { (void)read_meals_csv(path); }).find(path + ":2:") != std::string::npos);

    write_file(path, "meal_event_id,time\nm1,2024-01-01T08:00:00Z\n");
    assert(error_of([&] { (void)read_meals_csv(path); }).find("eaten_at") != std::string::npos);
  }

  // Meal items: sort_order defaults to the row position.
  {
    const std::string path = "test_source_io_items_tmp.csv";
    write_file(path,
               "meal_event_id,food_item_id,grams\n"
               "m1,rice,150\n"
               "m1,egg,50\n");
    const std::vector<MealItem> items = read_meal_items_csv(path);
    assert(items.size() == 2);
    assert(items[0].sort_order == 0 && items[1].sort_order == 1);
    assert(items[1].grams == 50.0);

    write_file(path,
               "meal_event_id,food_item_id,grams,sort_order\n"
               "m1,rice,150,x\n");
    assert(error_of([&] { (void)read_meal_items_csv(path); }).find(path + ":2:") != std::string::npos);
  }

  // Foods (semicolon-delimited export).
  {
    const std::string path = "test_source_io_foods_tmp.csv";
    write_file(path,
               "food_item_id;serving_grams;calories_kcal;carbs_g\n"
               "rice;100;130;28.5\n");
    const std::vector<FoodItem> foods = read_foods_csv(path);
    assert(foods.size() == 1);
    assert(foods[0].id == "rice");
    assert(foods[0].carbs_g == 28.5);
    assert(!foods[0].fat_g.known());
  }

  // Glucose: a bad number is an error, a missing token is unknown.
  {
    const std::string path = "test_source_io_egv_tmp.csv";
    write_file(path,
               "measured_at,glucose_mgdl\n"
               "2024-01-01T08:00:00Z,101\n"
               "2024-01-01T08:05:00Z,\n");
    const std::vector<GlucoseSample> g = read_glucose_csv(path);
    assert(g.size() == 2);
    assert(g[0].glucose_mgdl == 101.0);
    assert(!g[1].glucose_mgdl.known());

    write_file(path, "measured_at,glucose_mgdl\n2024-01-01T08:00:00Z,high\n");
    const std::string msg = error_of([&] { (void)read_glucose_csv(path); });
    assert(msg.find(path + ":2:") != std::string::npos);
    assert(msg.find("glucose_mgdl") != std::string::npos);
  }

  // Workouts: end_at defaults to start_at.
  {
    const std::string path = "test_source_io_workouts_tmp.csv";
    write_file(path,
               "start_at,end_at,duration_min,active_energy_kcal,activity_type\n"
               "2024-01-01T06:00:00Z,2024-01-01T06:30:00Z,30,250,run\n"
               "2024-01-01T18:00:00Z,,20,,walk\n");
    const std::vector<Workout> w = read_workouts_csv(path);
    assert(w.size() == 2);
    assert(w[0].end_ms == at("2024-01-01T06:30:00Z"));
    assert(w[0].activity_type == "run");
    assert(w[1].end_ms == w[1].start_ms);
    assert(!w[1].active_energy_kcal.known());
  }

  // Workouts: non-numeric fields are unknown with a warning; the record stays.
  {
    const std::string path = "test_source_io_workouts_lenient_tmp.csv";
    write_file(path,
               "start_at,duration_min,active_energy_kcal\n"
               "2024-01-01T08:00:00Z,30,abc\n"
               "2024-01-01T09:00:00Z,n/a,120\n");
    std::vector<std::string> warnings;
    const std::vector<Workout> w = read_workouts_csv(path, &warnings);
    assert(w.size() == 2);
    assert(w[0].duration_min == 30.0);
    assert(!w[0].active_energy_kcal.known());
    assert(!w[1].duration_min.known());
    assert(w[1].active_energy_kcal == 120.0);
    assert(warnings.size() == 1);
    assert(warnings[0].find(path + ":2:") != std::string::npos);
    assert(warnings[0].find("active_energy_kcal") != std::string::npos);

    // No sink: still lenient.
    assert(read_workouts_csv(path).size() == 2);

    // Timestamps are still required to parse.
    write_file(path, "start_at,duration_min\nlater,30\n");
    assert(error_of([&] { (void)read_workouts_csv(path); }).find(path + ":2:") != std::string::npos);
  }

  // Exercise sets: same leniency for reps / weight.
  {
    const std::string path = "test_source_io_sets_lenient_tmp.csv";
    write_file(path,
               "performed_at,reps,weight_kg\n"
               "2024-01-01T07:00:00Z,five,bodyweight\n");
    std::vector<std::string> warnings;
    const std::vector<ExerciseSet> s = read_exercise_sets_csv(path, &warnings);
    assert(s.size() == 1);
    assert(!s[0].reps.known() && !s[0].weight_kg.known());
    assert(warnings.size() == 2);
  }

  // Exercise sets.
  {
    const std::string path = "test_source_io_sets_tmp.csv";
    write_file(path,
               "performed_at,exercise,reps,weight_kg\n"
               "2024-01-01T07:00:00Z,squat,5,100\n");
    const std::vector<ExerciseSet> s = read_exercise_sets_csv(path);
    assert(s.size() == 1);
    assert(s[0].name == "squat");
    assert(s[0].reps == 5.0 && s[0].weight_kg == 100.0);
  }

  // Empty file => no rows.
  {
    const std::string path = "test_source_io_empty_tmp.csv";
    write_file(path, "");
    assert(read_glucose_csv(path).empty());
  }

  // Time filter is half-open.
  {
    std::vector<MealEvent> meals(3);
    meals[0].eaten_at_ms = 100;
    meals[1].eaten_at_ms = 200;
    meals[2].eaten_at_ms = 300;
    assert(filter_meals_by_time(meals, std::nullopt, std::nullopt).size() == 3);
    const std::vector<MealEvent> kept = filter_meals_by_time(meals, int64_t{200}, int64_t{300});
    assert(kept.size() == 1);
    assert(kept[0].eaten_at_ms == 200);
    assert(filter_meals_by_time(meals, std::nullopt, int64_t{200}).size() == 1);
  }

  std::cout << "ok\n";
  return 0;
}
