#pragma once

#include "mealwin/maybe_real.hpp"
#include "mealwin/types.hpp"

#include <cstddef>
#include <vector>

namespace mealwin {

// Minimum number of finite (x, y) pairs required by linear_slope().
// Fits through fewer points are considered too unstable to report.
constexpr size_t kMinSlopePoints = 3;

// Ordinary least-squares slope of y versus x.
//
// - Only pairs where x is finite and y is known are used.
// - If x and y differ in length, the extra tail of the longer one is ignored.
// - Returns unknown with fewer than kMinSlopePoints usable pairs, or when all
//   usable x are identical (vertical fit).
MaybeReal linear_slope(const std::vector<double>& x, const std::vector<MaybeReal>& y);

// Convenience overloads for relative samples / grid points (x = minute).
MaybeReal linear_slope(const std::vector<RelativeSample>& pts);
MaybeReal linear_slope(const std::vector<GridPoint>& pts);

// Trapezoidal integral of uniformly spaced values.
//
// Unknown values contribute as 0 (they are clamped, not excluded), which
// under-counts area when coverage is sparse.
// Returns 0 when fewer than 2 values are given or none is known.
double trapezoidal_integral(const std::vector<MaybeReal>& y, double step);

// Median of the known values; unknown when there are none.
MaybeReal median_known(const std::vector<MaybeReal>& v);

// Number of known values.
size_t count_known(const std::vector<MaybeReal>& v);

} // namespace mealwin
