#include "mealwin/series_stats.hpp"

#include "test_support.hpp"
#include <iostream>
#include <limits>
#include <vector>

using mealwin_test::approx;

int main() {
  using namespace mealwin;

  // Exact line y = 2x + 1.
  {
    const std::vector<double> x = {0.0, 1.0, 2.0, 3.0};
    const std::vector<MaybeReal> y = {1.0, 3.0, 5.0, 7.0};
    const MaybeReal s = linear_slope(x, y);
    assert(s.known());
    assert(approx(s.value(), 2.0, 1e-12));
  }

  // Large absolute x values stay well conditioned.
  {
    const std::vector<double> x = {1.0e9, 1.0e9 + 1.0, 1.0e9 + 2.0};
    const std::vector<MaybeReal> y = {5.0, 4.0, 3.0};
    assert(approx(linear_slope(x, y).value(), -1.0, 1e-6));
  }

  // Too few usable pairs, or a vertical fit => unknown.
  {
    const std::vector<double> x = {0.0, 1.0, 2.0};
    const std::vector<MaybeReal> y = {1.0, MaybeReal(), 5.0};
    assert(!linear_slope(x, y).known());

    const std::vector<double> xv = {3.0, 3.0, 3.0};
    const std::vector<MaybeReal> yv = {1.0, 2.0, 3.0};
    assert(!linear_slope(xv, yv).known());

    const std::vector<double> xn = {0.0, std::numeric_limits<double>::quiet_NaN(), 2.0};
    assert(!linear_slope(xn, yv).known());
  }

  // Length mismatch: the tail of the longer input is ignored.
  {
    const std::vector<double> x = {0.0, 1.0, 2.0, 3.0, 4.0};
    const std::vector<MaybeReal> y = {0.0, 1.0, 2.0};
    assert(approx(linear_slope(x, y).value(), 1.0, 1e-12));
  }

  // Grid point overload.
  {
    const std::vector<GridPoint> g = {{0.0, 10.0}, {5.0, 20.0}, {10.0, 30.0}};
    assert(approx(linear_slope(g).value(), 2.0, 1e-12));
  }

  // Trapezoid: unknown contributes as 0.
  {
    const std::vector<MaybeReal> y = {0.0, 10.0, 10.0};
    assert(approx(trapezoidal_integral(y, 5.0), 25.0 + 50.0));

    const std::vector<MaybeReal> y2 = {10.0, MaybeReal(), 10.0};
    assert(approx(trapezoidal_integral(y2, 5.0), 50.0));

    assert(trapezoidal_integral({MaybeReal(), MaybeReal()}, 5.0) == 0.0);
    assert(trapezoidal_integral({42.0}, 5.0) == 0.0);
  }

  // Median / count of known values.
  {
    const std::vector<MaybeReal> v = {3.0, MaybeReal(), 1.0, 2.0};
    assert(count_known(v) == 3);
    assert(approx(median_known(v).value(), 2.0));
    assert(!median_known({MaybeReal(), MaybeReal()}).known());
  }

  std::cout << "ok\n";
  return 0;
}
