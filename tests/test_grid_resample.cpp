#include "mealwin/grid_resample.hpp"

#include "test_support.hpp"
#include <cmath>
#include <iostream>
#include <limits>
#include <vector>

using mealwin_test::approx;

int main() {
  using namespace mealwin;

  // Point counts, including the tolerance-included window end.
  assert(grid_point_count(5.0, 0.0, 180.0) == 37);
  assert(grid_point_count(5.0, 0.0, 182.0) == 37);
  assert(grid_point_count(5.0, 0.0, 0.0) == 1);
  assert(grid_point_count(0.1, 0.0, 0.3) == 4);
  assert(grid_point_count(0.0, 0.0, 10.0) == 0);
  assert(grid_point_count(-5.0, 0.0, 10.0) == 0);
  assert(grid_point_count(5.0, 10.0, 0.0) == 0);
  assert(grid_point_count(std::numeric_limits<double>::quiet_NaN(), 0.0, 10.0) == 0);

  // Linear interpolation between samples.
  {
    const std::vector<RelativeSample> s = {{0.0, 100.0}, {10.0, 120.0}};
    const std::vector<GridPoint> g = resample_to_grid(s, 5.0, 0.0, 10.0);
    assert(g.size() == 3);
    assert(approx(g[0].minute, 0.0) && approx(g[0].value.value(), 100.0));
    assert(approx(g[1].minute, 5.0) && approx(g[1].value.value(), 110.0));
    assert(approx(g[2].minute, 10.0) && approx(g[2].value.value(), 120.0));
  }

  // Last grid minute never exceeds the window end.
  {
    const std::vector<RelativeSample> s = {{0.0, 1.0}, {1.0, 2.0}};
    const std::vector<GridPoint> g = resample_to_grid(s, 0.1, 0.0, 0.3);
    assert(g.size() == 4);
    assert(g.back().minute <= 0.3);
    assert(approx(g.back().minute, 0.3, 1e-12));
  }
  {
    const std::vector<RelativeSample> s = {{0.0, 1.0}, {200.0, 2.0}};
    const std::vector<GridPoint> g = resample_to_grid(s, 5.0, 0.0, 182.0);
    assert(g.size() == 37);
    assert(g.back().minute == 180.0);
  }

  // No extrapolation outside the sample range.
  {
    const std::vector<RelativeSample> s = {{0.0, 100.0}, {10.0, 120.0}};
    const std::vector<GridPoint> g = resample_to_grid(s, 5.0, -5.0, 15.0);
    assert(g.size() == 5);
    assert(!g[0].value.known());
    assert(g[1].value.known() && approx(g[1].value.value(), 100.0));
    assert(g[3].value.known() && approx(g[3].value.value(), 120.0));
    assert(!g[4].value.known());
  }

  // Unsorted input, with unknown values and non-finite minutes dropped.
  {
    const std::vector<RelativeSample> s = {
        {20.0, 140.0},
        {std::numeric_limits<double>::quiet_NaN(), 999.0},
        {10.0, MaybeReal()},
        {0.0, 100.0},
    };
    const std::vector<GridPoint> g = resample_to_grid(s, 10.0, 0.0, 20.0);
    assert(g.size() == 3);
    assert(approx(g[1].value.value(), 120.0));
  }

  // Fewer than two usable samples => every point unknown.
  {
    const std::vector<RelativeSample> s = {{0.0, 100.0}, {5.0, MaybeReal()}};
    const std::vector<GridPoint> g = resample_to_grid(s, 5.0, 0.0, 10.0);
    assert(g.size() == 3);
    for (const auto& p : g) assert(!p.value.known());
  }

  // Duplicate minutes: the first sample in input order wins on an exact hit.
  {
    const std::vector<RelativeSample> s = {{0.0, 100.0}, {5.0, 110.0}, {5.0, 130.0}, {10.0, 120.0}};
    const std::vector<GridPoint> g = resample_to_grid(s, 5.0, 0.0, 10.0);
    assert(approx(g[1].value.value(), 110.0));
  }

  std::cout << "ok\n";
  return 0;
}
