#pragma once

#include <cmath>
#include <limits>
#include <optional>
#include <stdexcept>

namespace mealwin {

// A real number that may be "unknown".
//
// Statistics that fail their data-quality gate resolve to an unknown value
// instead of throwing. Arithmetic propagates unknown explicitly rather than
// relying on NaN propagation:
//
//   known + unknown   => unknown
//   x / 0             => unknown
//
// Construction from a non-finite double (NaN, +/-inf) yields unknown, which
// makes it safe to wrap values coming from numeric code that still uses NaN
// as a sentinel.
class MaybeReal {
public:
  MaybeReal() = default;

  // Implicit so that plain doubles can be assigned into feature/target rows.
  MaybeReal(double v) {
    if (std::isfinite(v)) v_ = v;
  }

  static MaybeReal unknown() { return MaybeReal(); }

  bool known() const { return v_.has_value(); }

  double value() const {
    if (!v_) throw std::logic_error("MaybeReal::value: value is unknown");
    return *v_;
  }

  double value_or(double fallback) const { return v_ ? *v_ : fallback; }

  // Unknown => quiet NaN. Intended for numeric consumers (regressors, printing).
  double to_double() const {
    return v_ ? *v_ : std::numeric_limits<double>::quiet_NaN();
  }

  friend MaybeReal operator+(const MaybeReal& a, const MaybeReal& b) {
    if (!a.v_ || !b.v_) return MaybeReal();
    return MaybeReal(*a.v_ + *b.v_);
  }

  friend MaybeReal operator-(const MaybeReal& a, const MaybeReal& b) {
    if (!a.v_ || !b.v_) return MaybeReal();
    return MaybeReal(*a.v_ - *b.v_);
  }

  friend MaybeReal operator*(const MaybeReal& a, const MaybeReal& b) {
    if (!a.v_ || !b.v_) return MaybeReal();
    return MaybeReal(*a.v_ * *b.v_);
  }

  friend MaybeReal operator/(const MaybeReal& a, const MaybeReal& b) {
    if (!a.v_ || !b.v_) return MaybeReal();
    if (*b.v_ == 0.0) return MaybeReal();
    return MaybeReal(*a.v_ / *b.v_);
  }

  MaybeReal& operator+=(const MaybeReal& o) { return *this = *this + o; }
  MaybeReal& operator-=(const MaybeReal& o) { return *this = *this - o; }

  // Two unknowns compare equal; unknown never equals a known value.
  friend bool operator==(const MaybeReal& a, const MaybeReal& b) { return a.v_ == b.v_; }
  friend bool operator!=(const MaybeReal& a, const MaybeReal& b) { return !(a == b); }

private:
  std::optional<double> v_;
};

} // namespace mealwin
