#include "mealwin/targets.hpp"

#include "mealwin/context_features.hpp"
#include "mealwin/grid_resample.hpp"
#include "mealwin/series_stats.hpp"

#include <algorithm>
#include <vector>

namespace mealwin {

TargetRow compute_targets(const std::vector<RelativeSample>& samples, const MealWindowConfig& cfg) {
  TargetRow t;
  t.baseline_mgdl = compute_baseline(samples, cfg);

  const std::vector<GridPoint> grid = resample_to_grid(samples, cfg.grid_minutes, 0.0, cfg.post_minutes);

  std::vector<MaybeReal> values;
  values.reserve(grid.size());
  for (const auto& g : grid) values.push_back(g.value);

  t.post_grid_points = count_known(values);
  t.low_confidence = t.post_grid_points < cfg.min_points_post;
  if (t.low_confidence) return t;

  double peak = 0.0;
  bool have_peak = false;
  for (const auto& v : values) {
    if (!v.known()) continue;
    if (!have_peak || v.value() > peak) peak = v.value();
    have_peak = true;
  }
  if (have_peak) t.peak_mgdl = peak;

  t.peak_inc_mgdl = t.peak_mgdl - t.baseline_mgdl;

  if (t.baseline_mgdl.known()) {
    const double base = t.baseline_mgdl.value();
    std::vector<MaybeReal> inc;
    inc.reserve(values.size());
    for (const auto& v : values) {
      inc.push_back(v.known() ? MaybeReal(std::max(0.0, v.value() - base)) : MaybeReal());
    }
    t.incremental_auc_mgdl_min = trapezoidal_integral(inc, cfg.grid_minutes);
  }

  const double slope_end = std::min(cfg.slope_minutes, cfg.post_minutes);
  std::vector<GridPoint> slope_pts;
  for (const auto& g : grid) {
    if (g.minute >= 0.0 && g.minute <= slope_end) slope_pts.push_back(g);
  }
  t.slope_0_60_mgdl_per_min = linear_slope(slope_pts);

  return t;
}

} // namespace mealwin
