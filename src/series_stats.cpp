#include "mealwin/series_stats.hpp"

#include "mealwin/robust_stats.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace mealwin {

MaybeReal linear_slope(const std::vector<double>& x, const std::vector<MaybeReal>& y) {
  const size_t n = std::min(x.size(), y.size());

  // Two passes over the usable pairs: means first, then centered sums.
  // Centering keeps Sxx well conditioned for large absolute x values.
  size_t used = 0;
  double sx = 0.0;
  double sy = 0.0;
  for (size_t i = 0; i < n; ++i) {
    if (!std::isfinite(x[i]) || !y[i].known()) continue;
    sx += x[i];
    sy += y[i].value();
    ++used;
  }
  if (used < kMinSlopePoints) return MaybeReal();

  const double mx = sx / static_cast<double>(used);
  const double my = sy / static_cast<double>(used);

  double sxx = 0.0;
  double sxy = 0.0;
  for (size_t i = 0; i < n; ++i) {
    if (!std::isfinite(x[i]) || !y[i].known()) continue;
    const double dx = x[i] - mx;
    sxx += dx * dx;
    sxy += dx * (y[i].value() - my);
  }
  if (!(sxx > 0.0)) return MaybeReal();
  return sxy / sxx;
}

MaybeReal linear_slope(const std::vector<RelativeSample>& pts) {
  std::vector<double> x;
  std::vector<MaybeReal> y;
  x.reserve(pts.size());
  y.reserve(pts.size());
  for (const auto& p : pts) {
    x.push_back(p.minute);
    y.push_back(p.value);
  }
  return linear_slope(x, y);
}

MaybeReal linear_slope(const std::vector<GridPoint>& pts) {
  std::vector<double> x;
  std::vector<MaybeReal> y;
  x.reserve(pts.size());
  y.reserve(pts.size());
  for (const auto& p : pts) {
    x.push_back(p.minute);
    y.push_back(p.value);
  }
  return linear_slope(x, y);
}

double trapezoidal_integral(const std::vector<MaybeReal>& y, double step) {
  if (y.size() < 2) return 0.0;
  if (count_known(y) == 0) return 0.0;

  double area = 0.0;
  for (size_t i = 0; i + 1 < y.size(); ++i) {
    const double a = y[i].value_or(0.0);
    const double b = y[i + 1].value_or(0.0);
    area += 0.5 * (a + b) * step;
  }
  return area;
}

MaybeReal median_known(const std::vector<MaybeReal>& v) {
  std::vector<double> vals;
  vals.reserve(v.size());
  for (const auto& x : v) {
    if (x.known()) vals.push_back(x.value());
  }
  if (vals.empty()) return MaybeReal();
  return median_inplace(&vals);
}

size_t count_known(const std::vector<MaybeReal>& v) {
  return static_cast<size_t>(std::count_if(v.begin(), v.end(), [](const MaybeReal& x) { return x.known(); }));
}

} // namespace mealwin
