#pragma once

#include "mealwin/types.hpp"

#include <cstddef>
#include <vector>

namespace mealwin {

// Tolerance used when deciding whether the window end is itself a grid point.
//
// Grid points are start, start+step, ... and the end of the window is
// included when (end - start) is a multiple of step up to this tolerance, so
// accumulated floating point error never drops the final point.
constexpr double kGridInclusionEpsilon = 1e-4;

// Number of grid points for [start_minute, end_minute] at the given step:
//   floor((end - start + kGridInclusionEpsilon) / step) + 1
//
// Returns 0 when step is not a positive finite number or end < start.
size_t grid_point_count(double step_minutes, double start_minute, double end_minute);

// Linearly resample irregular relative samples onto a uniform grid.
//
// Behavior:
// - Samples with a non-finite minute or an unknown value are dropped.
// - Remaining samples are sorted by minute (stable, so duplicate minutes keep
//   their input order; the first one wins on an exact grid hit).
// - Fewer than 2 usable samples => every grid point is unknown.
// - Grid points strictly before the first or strictly after the last usable
//   sample are unknown (no extrapolation).
// - Grid minutes never exceed end_minute (the tolerance-included last point
//   is clamped onto end_minute).
//
// Pure function; never throws for numeric input.
std::vector<GridPoint> resample_to_grid(const std::vector<RelativeSample>& samples,
                                        double step_minutes,
                                        double start_minute,
                                        double end_minute);

} // namespace mealwin
