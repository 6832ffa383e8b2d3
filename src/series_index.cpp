#include "mealwin/series_index.hpp"

#include "mealwin/activity.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace mealwin {

namespace {

static int64_t glucose_time(const GlucoseSample& s) { return s.measured_at_ms; }
static int64_t workout_time(const Workout& w) { return w.start_ms; }
static int64_t set_time(const ExerciseSet& s) { return s.performed_at_ms; }

template <typename T, typename TimeOf>
static void sort_by_time(std::vector<T>* v, TimeOf time_of) {
  std::stable_sort(v->begin(), v->end(), [&](const T& a, const T& b) { return time_of(a) < time_of(b); });
}

// Elements with time in [from_ms, to_ms).
template <typename T, typename TimeOf>
static std::vector<T> half_open_range(const std::vector<T>& v, int64_t from_ms, int64_t to_ms, TimeOf time_of) {
  if (to_ms <= from_ms) return {};
  auto lo = std::lower_bound(v.begin(), v.end(), from_ms,
                             [&](const T& e, int64_t t) { return time_of(e) < t; });
  auto hi = std::lower_bound(lo, v.end(), to_ms,
                             [&](const T& e, int64_t t) { return time_of(e) < t; });
  return std::vector<T>(lo, hi);
}

template <typename T, typename TimeOf>
static void erase_outside(std::vector<T>* v, int64_t start_ms, int64_t end_ms, TimeOf time_of) {
  if (!v) return;
  v->erase(std::remove_if(v->begin(), v->end(),
                          [&](const T& e) {
                            const int64_t t = time_of(e);
                            return t < start_ms || t > end_ms;
                          }),
           v->end());
}

} // namespace

SeriesIndex::SeriesIndex(std::vector<GlucoseSample> glucose,
                         std::vector<Workout> workouts,
                         std::vector<ExerciseSet> sets)
    : glucose_(std::move(glucose)), workouts_(std::move(workouts)), sets_(std::move(sets)) {
  sort_by_time(&glucose_, glucose_time);
  sort_by_time(&workouts_, workout_time);
  sort_by_time(&sets_, set_time);
}

std::vector<RelativeSample> SeriesIndex::glucose_relative(int64_t anchor_ms,
                                                          double before_minutes,
                                                          double after_minutes) const {
  const int64_t lo_ms = anchor_ms - minutes_to_millis(before_minutes);
  const int64_t hi_ms = anchor_ms + minutes_to_millis(after_minutes);

  auto lo = std::lower_bound(glucose_.begin(), glucose_.end(), lo_ms,
                             [](const GlucoseSample& s, int64_t t) { return s.measured_at_ms < t; });
  auto hi = std::upper_bound(lo, glucose_.end(), hi_ms,
                             [](int64_t t, const GlucoseSample& s) { return t < s.measured_at_ms; });

  std::vector<RelativeSample> out;
  out.reserve(static_cast<size_t>(hi - lo));
  for (auto it = lo; it != hi; ++it) {
    const double minute = static_cast<double>(it->measured_at_ms - anchor_ms) / 60000.0;
    if (minute < -before_minutes || minute > after_minutes) continue;
    out.push_back(RelativeSample{minute, it->glucose_mgdl});
  }
  return out;
}

std::vector<Workout> SeriesIndex::workouts_starting_in(int64_t from_ms, int64_t to_ms) const {
  return half_open_range(workouts_, from_ms, to_ms, workout_time);
}

std::vector<ExerciseSet> SeriesIndex::sets_performed_in(int64_t from_ms, int64_t to_ms) const {
  return half_open_range(sets_, from_ms, to_ms, set_time);
}

bool meal_series_span(const std::vector<MealEvent>& meals,
                      const MealWindowConfig& cfg,
                      int64_t* start_ms,
                      int64_t* end_ms) {
  if (meals.empty()) return false;

  auto by_time = [](const MealEvent& a, const MealEvent& b) { return a.eaten_at_ms < b.eaten_at_ms; };
  const auto mm = std::minmax_element(meals.begin(), meals.end(), by_time);

  const double before = std::max(cfg.pre_context_minutes, cfg.activity_pre_minutes);
  const double after = std::max(cfg.post_minutes, cfg.activity_post_minutes);

  if (start_ms) *start_ms = mm.first->eaten_at_ms - minutes_to_millis(before);
  if (end_ms) *end_ms = mm.second->eaten_at_ms + minutes_to_millis(after);
  return true;
}

void trim_series_to_span(int64_t start_ms,
                         int64_t end_ms,
                         std::vector<GlucoseSample>* glucose,
                         std::vector<Workout>* workouts,
                         std::vector<ExerciseSet>* sets) {
  erase_outside(glucose, start_ms, end_ms, glucose_time);
  erase_outside(workouts, start_ms, end_ms, workout_time);
  erase_outside(sets, start_ms, end_ms, set_time);
}

} // namespace mealwin
