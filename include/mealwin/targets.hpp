#pragma once

#include "mealwin/maybe_real.hpp"
#include "mealwin/types.hpp"

#include <cstddef>
#include <vector>

namespace mealwin {

// Post-meal outcome labels.
//
// When the post-meal window has fewer than cfg.min_points_post covered grid
// points, every target except baseline_mgdl is unknown and low_confidence is
// set. Downstream training drops such rows by requiring known targets.
struct TargetRow {
  MaybeReal baseline_mgdl;
  MaybeReal peak_mgdl;
  MaybeReal peak_inc_mgdl;
  MaybeReal incremental_auc_mgdl_min;
  MaybeReal slope_0_60_mgdl_per_min;

  size_t post_grid_points{0};  // known grid points in [0, post_minutes]
  bool low_confidence{true};
};

// Compute targets from samples relative to the meal anchor (normally sliced to
// [-pre_context_minutes, +post_minutes]).
//
// Steps:
//   1. baseline as in compute_baseline()
//   2. resample [0, post_minutes] at grid_minutes (pre-meal samples take part
//      in the interpolation, so the 0 grid point can be bracketed)
//   3. quality gate on known grid points
//   4. peak, peak - baseline, trapezoidal iAUC of max(0, g - baseline),
//      slope over grid points in [0, min(slope_minutes, post_minutes)]
//
// Every output degrades to unknown independently; this never throws.
TargetRow compute_targets(const std::vector<RelativeSample>& samples, const MealWindowConfig& cfg);

} // namespace mealwin
