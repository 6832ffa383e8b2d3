#pragma once

#include "mealwin/dataset.hpp"
#include "mealwin/model_artifact.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace mealwin {

// peak_inc_mgdl, incremental_auc_mgdl_min, slope_0_60_mgdl_per_min
const std::vector<std::string>& default_training_targets();

// Minimum labeled rows for train_model_artifact().
constexpr size_t kMinTrainingRows = 20;

struct TrainOptions {
  std::vector<std::string> targets = default_training_targets();
  double test_frac{0.2};  // in [0, 1)
  double lambda{1.0};
};

// Throws std::runtime_error for a name that is not a target column.
void validate_training_targets(const std::vector<std::string>& targets);

// Rows where every requested target is known, in input order.
std::vector<MealRow> select_labeled_rows(const std::vector<MealRow>& rows,
                                         const std::vector<std::string>& targets);

// Chronological split: rows are stable-sorted by eaten_at and cut at
// max(1, floor((1 - test_frac) * n)), clamped to n. The earlier part is the
// training split. Throws std::runtime_error if test_frac is outside [0, 1).
void time_split(std::vector<MealRow> rows,
                double test_frac,
                std::vector<MealRow>* train,
                std::vector<MealRow>* test);

// MAE / RMSE / R^2 of predictions against known values.
// y_true and y_pred must have equal size.
RegressionMetrics regression_metrics(const std::vector<double>& y_true, const std::vector<double>& y_pred);

// Select labeled rows, split by time, fit one ridge regressor per target on
// the training split using feature_column_names(), and evaluate on the test
// split.
//
// Throws std::runtime_error if fewer than kMinTrainingRows rows are labeled.
ModelArtifact train_model_artifact(const std::vector<MealRow>& rows, const TrainOptions& opt);

} // namespace mealwin
