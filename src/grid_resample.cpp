#include "mealwin/grid_resample.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace mealwin {

size_t grid_point_count(double step_minutes, double start_minute, double end_minute) {
  if (!std::isfinite(step_minutes) || !(step_minutes > 0.0)) return 0;
  if (!std::isfinite(start_minute) || !std::isfinite(end_minute)) return 0;
  if (end_minute < start_minute) return 0;
  const double n = std::floor((end_minute - start_minute + kGridInclusionEpsilon) / step_minutes);
  return static_cast<size_t>(n) + 1;
}

std::vector<GridPoint> resample_to_grid(const std::vector<RelativeSample>& samples,
                                        double step_minutes,
                                        double start_minute,
                                        double end_minute) {
  const size_t n_grid = grid_point_count(step_minutes, start_minute, end_minute);

  std::vector<GridPoint> grid(n_grid);
  for (size_t i = 0; i < n_grid; ++i) {
    grid[i].minute = std::min(start_minute + static_cast<double>(i) * step_minutes, end_minute);
  }
  if (n_grid == 0) return grid;

  std::vector<RelativeSample> pts;
  pts.reserve(samples.size());
  for (const auto& s : samples) {
    if (!std::isfinite(s.minute) || !s.value.known()) continue;
    pts.push_back(s);
  }
  if (pts.size() < 2) return grid;

  std::stable_sort(pts.begin(), pts.end(), [](const RelativeSample& a, const RelativeSample& b) {
    return a.minute < b.minute;
  });

  const double t_first = pts.front().minute;
  const double t_last = pts.back().minute;

  for (auto& g : grid) {
    const double t = g.minute;
    if (t < t_first || t > t_last) continue;

    // First sample at or after t.
    auto it = std::lower_bound(pts.begin(), pts.end(), t, [](const RelativeSample& s, double x) {
      return s.minute < x;
    });
    if (it == pts.end()) continue;  // unreachable since t <= t_last

    if (it->minute == t || it == pts.begin()) {
      g.value = it->value;
      continue;
    }

    const RelativeSample& b = *it;
    const RelativeSample& a = *(it - 1);
    const double span = b.minute - a.minute;
    if (!(span > 0.0)) {
      g.value = b.value;
      continue;
    }
    const double w = (t - a.minute) / span;
    const double ya = a.value.value();
    const double yb = b.value.value();
    g.value = ya + (yb - ya) * w;
  }

  return grid;
}

} // namespace mealwin
