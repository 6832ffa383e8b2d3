#pragma once

#include <algorithm>
#include <cstddef>
#include <vector>

namespace mealwin {

// Median via nth_element: O(n) average time. Modifies (partially reorders) v.
//
// For an even count the two middle values are averaged.
// Returns 0.0 for a null or empty vector; callers that need "unknown" for
// empty input check the size first (see median_known in series_stats.hpp).
inline double median_inplace(std::vector<double>* v) {
  if (!v || v->empty()) return 0.0;
  const size_t n = v->size();
  const size_t mid = n / 2;
  std::nth_element(v->begin(), v->begin() + static_cast<std::ptrdiff_t>(mid), v->end());
  double med = (*v)[mid];
  if (n % 2 == 0) {
    // Lower middle is the largest element of the left partition.
    auto max_it = std::max_element(v->begin(), v->begin() + static_cast<std::ptrdiff_t>(mid));
    med = 0.5 * (med + *max_it);
  }
  return med;
}

inline double median_inplace(std::vector<double>& v) { return median_inplace(&v); }

} // namespace mealwin
