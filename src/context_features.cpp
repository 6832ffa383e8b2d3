#include "mealwin/context_features.hpp"

#include "mealwin/running_stats.hpp"
#include "mealwin/series_stats.hpp"

#include <cmath>
#include <vector>

namespace mealwin {

namespace {

// Samples with minute in [-before_minutes, 0).
static std::vector<RelativeSample> pre_meal_window(const std::vector<RelativeSample>& samples,
                                                   double before_minutes) {
  std::vector<RelativeSample> out;
  for (const auto& s : samples) {
    if (!std::isfinite(s.minute)) continue;
    if (s.minute >= -before_minutes && s.minute < 0.0) out.push_back(s);
  }
  return out;
}

static size_t count_known_samples(const std::vector<RelativeSample>& pts) {
  size_t n = 0;
  for (const auto& p : pts) {
    if (p.value.known()) ++n;
  }
  return n;
}

} // namespace

MaybeReal compute_baseline(const std::vector<RelativeSample>& samples, const MealWindowConfig& cfg) {
  const std::vector<RelativeSample> win = pre_meal_window(samples, cfg.pre_baseline_minutes);
  if (count_known_samples(win) < cfg.min_points_pre_baseline) return MaybeReal();

  std::vector<MaybeReal> vals;
  vals.reserve(win.size());
  for (const auto& s : win) vals.push_back(s.value);
  return median_known(vals);
}

ContextFeatures compute_context_features(const std::vector<RelativeSample>& samples,
                                         const MealWindowConfig& cfg) {
  ContextFeatures f;
  f.baseline_mgdl = compute_baseline(samples, cfg);
  f.pre_slope_mgdl_per_min = linear_slope(pre_meal_window(samples, cfg.pre_baseline_minutes));

  RunningStats rs;
  for (const auto& s : pre_meal_window(samples, cfg.pre_context_minutes)) rs.add(s.value);
  if (rs.n() >= kMinPointsPreContext) {
    f.pre_mean_mgdl = rs.mean();
    f.pre_std_mgdl = rs.stddev_population();
  }
  return f;
}

} // namespace mealwin
