#pragma once

#include "mealwin/dataset.hpp"
#include "mealwin/maybe_real.hpp"
#include "mealwin/regressor.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace mealwin {

// Held-out evaluation of one target's regressor.
// Errors are unknown when the test split is empty; r2 is also unknown when the
// test targets have zero variance.
struct RegressionMetrics {
  MaybeReal mae;
  MaybeReal rmse;
  MaybeReal r2;
  size_t n_train{0};
  size_t n_test{0};
};

struct TargetModel {
  std::string target;
  std::unique_ptr<Regressor> regressor;
  RegressionMetrics metrics;
};

// A trained multi-target model: one regressor per target over one fixed,
// ordered feature column list.
//
// Stored as CSV with leading metadata comments:
//
//   # format=mealwin-model-v1
//   # feature_columns=meal_hour;meal_dow;...
//   # targets=peak_inc_mgdl;...
//   target,kind,term,value
//   peak_inc_mgdl,ridge,intercept,41.5
//   peak_inc_mgdl,metric,mae,12.25
//   ...
struct ModelArtifact {
  std::vector<std::string> feature_columns;
  std::vector<TargetModel> models;

  std::vector<std::string> target_names() const;

  // Throws std::runtime_error if the target is not part of the model.
  const TargetModel& model_for(const std::string& target) const;
};

extern const char* const kModelFormat;

std::string format_model_artifact(const ModelArtifact& artifact);

// Throws std::runtime_error if the file cannot be written.
void save_model_artifact(const std::string& path, const ModelArtifact& artifact);

// Throws std::runtime_error for unreadable files, a wrong format tag, or
// inconsistent rows.
ModelArtifact load_model_artifact(const std::string& path);

struct TargetPrediction {
  std::string target;
  double value{0.0};
};

// Predict every target of the artifact for one feature record, in the
// artifact's target order.
//
// Throws std::runtime_error when the artifact's feature columns differ from
// feature_column_names() (names or order): such a model was trained on a
// different feature layout and its weights cannot be applied.
std::vector<TargetPrediction> predict_targets(const ModelArtifact& artifact, const FeatureRow& features);

} // namespace mealwin
