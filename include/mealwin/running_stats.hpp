#pragma once

#include "mealwin/maybe_real.hpp"

#include <cmath>
#include <cstddef>

namespace mealwin {

// Running mean/variance accumulator (Welford's algorithm).
//
// Notes:
// - add() ignores unknown and non-finite values.
// - Variance is the population variance (divides by n).
// - Results are unknown until a value has been added.
class RunningStats {
public:
  void add(double x) {
    if (!std::isfinite(x)) return;
    ++n_;
    const double delta = x - mean_;
    mean_ += delta / static_cast<double>(n_);
    const double delta2 = x - mean_;
    m2_ += delta * delta2;
  }

  void add(const MaybeReal& x) {
    if (x.known()) add(x.value());
  }

  size_t n() const { return n_; }

  MaybeReal mean() const { return (n_ == 0) ? MaybeReal() : MaybeReal(mean_); }

  MaybeReal variance_population() const {
    if (n_ < 1) return MaybeReal();
    return m2_ / static_cast<double>(n_);
  }

  MaybeReal stddev_population() const {
    const MaybeReal v = variance_population();
    return v.known() ? MaybeReal(std::sqrt(std::fabs(v.value()))) : v;
  }

private:
  size_t n_{0};
  double mean_{0.0};
  double m2_{0.0};
};

} // namespace mealwin
