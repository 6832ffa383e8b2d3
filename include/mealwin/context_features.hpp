#pragma once

#include "mealwin/maybe_real.hpp"
#include "mealwin/types.hpp"

#include <vector>

namespace mealwin {

// Pre-meal glucose context.
struct ContextFeatures {
  MaybeReal baseline_mgdl;           // median over [-pre_baseline, 0)
  MaybeReal pre_slope_mgdl_per_min;  // OLS slope over [-pre_baseline, 0)
  MaybeReal pre_mean_mgdl;           // mean over [-pre_context, 0)
  MaybeReal pre_std_mgdl;            // population std over [-pre_context, 0)
};

// Minimum known samples required for pre_mean / pre_std.
constexpr size_t kMinPointsPreContext = 3;

// Median of the samples in [-pre_baseline_minutes, 0).
//
// Unknown unless at least cfg.min_points_pre_baseline known samples fall in
// the window. Median (not mean) so a single spiky reading does not move the
// reference level.
MaybeReal compute_baseline(const std::vector<RelativeSample>& samples, const MealWindowConfig& cfg);

// Compute pre-meal context features from samples relative to the meal anchor
// (normally already sliced to [-pre_context_minutes, +post_minutes]).
ContextFeatures compute_context_features(const std::vector<RelativeSample>& samples,
                                         const MealWindowConfig& cfg);

} // namespace mealwin
