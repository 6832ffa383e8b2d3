#include "mealwin/source_io.hpp"

#include "mealwin/csv_io.hpp"
#include "mealwin/utils.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace mealwin {

namespace {

// Cell accessor bound to one table row; attaches file:line to every error.
class RowReader {
public:
  RowReader(const DelimitedTable& t, const DelimitedTable::Row& row) : t_(t), row_(row) {}

  std::string text(int col) const {
    if (col < 0) return std::string();
    return trim(row_.cells[static_cast<size_t>(col)]);
  }

  std::string required_text(size_t col) const {
    const std::string s = text(static_cast<int>(col));
    if (s.empty()) fail("empty '" + t_.header[col] + "'");
    return s;
  }

  int64_t required_time(size_t col) const {
    const std::string s = required_text(col);
    int64_t ms = 0;
    if (!parse_timestamp_to_utc_millis(s, &ms)) {
      fail("invalid timestamp in '" + t_.header[col] + "': '" + s + "'");
    }
    return ms;
  }

  std::optional<int64_t> optional_time(int col) const {
    const std::string s = text(col);
    if (is_missing_token(s)) return std::nullopt;
    int64_t ms = 0;
    if (!parse_timestamp_to_utc_millis(s, &ms)) {
      fail("invalid timestamp in '" + t_.header[static_cast<size_t>(col)] + "': '" + s + "'");
    }
    return ms;
  }

  MaybeReal real(int col) const {
    if (col < 0) return MaybeReal();
    try {
      return parse_maybe_real(row_.cells[static_cast<size_t>(col)]);
    } catch (const std::exception& e) {
      fail(std::string("column '") + t_.header[static_cast<size_t>(col)] + "': " + e.what());
    }
    return MaybeReal();
  }

  // Activity fields: unparseable text is unknown (aggregated as 0) and noted.
  MaybeReal lenient_real(int col, std::vector<std::string>* warnings) const {
    if (col < 0) return MaybeReal();
    const std::string& cell = row_.cells[static_cast<size_t>(col)];
    try {
      return parse_maybe_real(cell);
    } catch (const std::exception&) {
      if (warnings) {
        warnings->push_back(table_location(t_, row_) + "column '" + t_.header[static_cast<size_t>(col)] +
                            "': non-numeric '" + trim(cell) + "' treated as missing");
      }
    }
    return MaybeReal();
  }

  [[noreturn]] void fail(const std::string& msg) const {
    throw std::runtime_error(table_location(t_, row_) + msg);
  }

private:
  const DelimitedTable& t_;
  const DelimitedTable::Row& row_;
};

} // namespace

std::vector<MealEvent> read_meals_csv(const std::string& path) {
  const DelimitedTable t = DelimitedTable::read(path);
  std::vector<MealEvent> out;
  if (t.header.empty()) return out;

  const size_t c_id = t.require_column({"meal_event_id", "id"});
  const size_t c_at = t.require_column({"eaten_at"});
  const int c_grams = t.find_column({"meal_grams"});
  const int c_kcal = t.find_column({"meal_calories_kcal"});
  const int c_carbs = t.find_column({"meal_carbs_g"});
  const int c_fiber = t.find_column({"meal_fiber_g"});
  const int c_protein = t.find_column({"meal_protein_g"});
  const int c_fat = t.find_column({"meal_fat_g"});

  out.reserve(t.rows.size());
  for (const auto& row : t.rows) {
    const RowReader r(t, row);
    MealEvent m;
    m.id = r.required_text(c_id);
    m.eaten_at_ms = r.required_time(c_at);
    m.macros.meal_grams = r.real(c_grams);
    m.macros.meal_calories_kcal = r.real(c_kcal);
    m.macros.meal_carbs_g = r.real(c_carbs);
    m.macros.meal_fiber_g = r.real(c_fiber);
    m.macros.meal_protein_g = r.real(c_protein);
    m.macros.meal_fat_g = r.real(c_fat);
    out.push_back(std::move(m));
  }
  return out;
}

std::vector<MealItem> read_meal_items_csv(const std::string& path) {
  const DelimitedTable t = DelimitedTable::read(path);
  std::vector<MealItem> out;
  if (t.header.empty()) return out;

  const size_t c_meal = t.require_column({"meal_event_id"});
  const size_t c_food = t.require_column({"food_item_id"});
  const size_t c_grams = t.require_column({"grams"});
  const int c_order = t.find_column({"sort_order"});

  out.reserve(t.rows.size());
  for (size_t i = 0; i < t.rows.size(); ++i) {
    const RowReader r(t, t.rows[i]);
    MealItem it;
    it.meal_event_id = r.required_text(c_meal);
    it.food_item_id = r.required_text(c_food);
    it.grams = r.real(static_cast<int>(c_grams));
    it.sort_order = static_cast<int>(i);
    const std::string order = r.text(c_order);
    if (!order.empty()) {
      try {
        it.sort_order = to_int(order);
      } catch (const std::exception& e) {
        r.fail(e.what());
      }
    }
    out.push_back(std::move(it));
  }
  return out;
}

std::vector<FoodItem> read_foods_csv(const std::string& path) {
  const DelimitedTable t = DelimitedTable::read(path);
  std::vector<FoodItem> out;
  if (t.header.empty()) return out;

  const size_t c_id = t.require_column({"food_item_id", "id"});
  const size_t c_serving = t.require_column({"serving_grams"});
  const int c_kcal = t.find_column({"calories_kcal"});
  const int c_carbs = t.find_column({"carbs_g"});
  const int c_fiber = t.find_column({"fiber_g"});
  const int c_protein = t.find_column({"protein_g"});
  const int c_fat = t.find_column({"fat_g"});

  out.reserve(t.rows.size());
  for (const auto& row : t.rows) {
    const RowReader r(t, row);
    FoodItem f;
    f.id = r.required_text(c_id);
    f.serving_grams = r.real(static_cast<int>(c_serving));
    f.calories_kcal = r.real(c_kcal);
    f.carbs_g = r.real(c_carbs);
    f.fiber_g = r.real(c_fiber);
    f.protein_g = r.real(c_protein);
    f.fat_g = r.real(c_fat);
    out.push_back(std::move(f));
  }
  return out;
}

std::vector<GlucoseSample> read_glucose_csv(const std::string& path) {
  const DelimitedTable t = DelimitedTable::read(path);
  std::vector<GlucoseSample> out;
  if (t.header.empty()) return out;

  const size_t c_at = t.require_column({"measured_at"});
  const size_t c_val = t.require_column({"glucose_mgdl"});

  out.reserve(t.rows.size());
  for (const auto& row : t.rows) {
    const RowReader r(t, row);
    GlucoseSample s;
    s.measured_at_ms = r.required_time(c_at);
    s.glucose_mgdl = r.real(static_cast<int>(c_val));
    out.push_back(s);
  }
  return out;
}

std::vector<Workout> read_workouts_csv(const std::string& path, std::vector<std::string>* warnings) {
  const DelimitedTable t = DelimitedTable::read(path);
  std::vector<Workout> out;
  if (t.header.empty()) return out;

  const size_t c_start = t.require_column({"start_at"});
  const int c_end = t.find_column({"end_at"});
  const int c_dur = t.find_column({"duration_min"});
  const int c_energy = t.find_column({"active_energy_kcal"});
  const int c_hr = t.find_column({"avg_hr_bpm"});
  const int c_type = t.find_column({"activity_type"});

  out.reserve(t.rows.size());
  for (const auto& row : t.rows) {
    const RowReader r(t, row);
    Workout w;
    w.start_ms = r.required_time(c_start);
    w.end_ms = r.optional_time(c_end).value_or(w.start_ms);
    w.duration_min = r.lenient_real(c_dur, warnings);
    w.active_energy_kcal = r.lenient_real(c_energy, warnings);
    w.avg_hr_bpm = r.lenient_real(c_hr, warnings);
    w.activity_type = r.text(c_type);
    out.push_back(std::move(w));
  }
  return out;
}

std::vector<ExerciseSet> read_exercise_sets_csv(const std::string& path, std::vector<std::string>* warnings) {
  const DelimitedTable t = DelimitedTable::read(path);
  std::vector<ExerciseSet> out;
  if (t.header.empty()) return out;

  const size_t c_at = t.require_column({"performed_at"});
  const int c_name = t.find_column({"name", "exercise"});
  const int c_reps = t.find_column({"reps"});
  const int c_weight = t.find_column({"weight_kg"});

  out.reserve(t.rows.size());
  for (const auto& row : t.rows) {
    const RowReader r(t, row);
    ExerciseSet s;
    s.performed_at_ms = r.required_time(c_at);
    s.name = r.text(c_name);
    s.reps = r.lenient_real(c_reps, warnings);
    s.weight_kg = r.lenient_real(c_weight, warnings);
    out.push_back(std::move(s));
  }
  return out;
}

std::vector<MealEvent> filter_meals_by_time(const std::vector<MealEvent>& meals,
                                            const std::optional<int64_t>& start_ms,
                                            const std::optional<int64_t>& end_ms) {
  std::vector<MealEvent> out;
  out.reserve(meals.size());
  for (const auto& m : meals) {
    if (start_ms && m.eaten_at_ms < *start_ms) continue;
    if (end_ms && m.eaten_at_ms >= *end_ms) continue;
    out.push_back(m);
  }
  return out;
}

} // namespace mealwin
