#pragma once

#include "mealwin/maybe_real.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace mealwin {

// Named model parameter, as stored in a model artifact.
using RegressorTerm = std::pair<std::string, double>;

// A fitted scalar regressor over a fixed feature vector.
//
// Implementations must accept unknown feature values at prediction time.
class Regressor {
public:
  virtual ~Regressor() = default;

  // Short identifier written to the model artifact (e.g. "ridge").
  virtual std::string kind() const = 0;

  // features must be in the column order the model was fitted with.
  virtual double predict(const std::vector<MaybeReal>& features) const = 0;

  // Parameters in a stable order; make_regressor() rebuilds the model from them.
  virtual std::vector<RegressorTerm> terms() const = 0;
};

// Linear ridge regression.
//
// - Unknown feature values are imputed with the training mean of the column.
// - Columns are standardized with the training mean and population std
//   (a constant or all-unknown column gets weight 0).
// - Weights solve (Z'Z + lambda*I) w = Z'(y - mean(y)); intercept = mean(y).
class RidgeRegressor : public Regressor {
public:
  static constexpr const char* kKind = "ridge";

  RidgeRegressor() = default;

  // X: one row per sample, each with feature_columns.size() values.
  // Throws std::runtime_error on shape mismatch, empty input, non-finite y,
  // lambda < 0, or a singular system (lambda == 0 with collinear columns).
  void fit(const std::vector<std::vector<MaybeReal>>& X,
           const std::vector<double>& y,
           const std::vector<std::string>& feature_columns,
           double lambda);

  std::string kind() const override { return kKind; }
  double predict(const std::vector<MaybeReal>& features) const override;
  std::vector<RegressorTerm> terms() const override;

  // Rebuild from terms(). Throws std::runtime_error on missing terms.
  static std::unique_ptr<RidgeRegressor> from_terms(const std::vector<RegressorTerm>& terms,
                                                    const std::vector<std::string>& feature_columns);

  double intercept() const { return intercept_; }
  const std::vector<double>& weights() const { return weights_; }

private:
  std::vector<std::string> columns_;
  double lambda_{1.0};
  double intercept_{0.0};
  std::vector<double> means_;
  std::vector<double> scales_;
  std::vector<double> weights_;
};

// Factory for artifact loading. Throws std::runtime_error for an unknown kind.
std::unique_ptr<Regressor> make_regressor(const std::string& kind,
                                          const std::vector<RegressorTerm>& terms,
                                          const std::vector<std::string>& feature_columns);

} // namespace mealwin
