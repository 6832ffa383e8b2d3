#include "mealwin/training.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <memory>
#include <stdexcept>

namespace mealwin {

namespace {

static std::vector<std::vector<MaybeReal>> design_matrix(const std::vector<MealRow>& rows) {
  std::vector<std::vector<MaybeReal>> X;
  X.reserve(rows.size());
  for (const auto& r : rows) X.push_back(feature_values(r.features));
  return X;
}

static std::vector<double> target_vector(const std::vector<MealRow>& rows, const std::string& target) {
  std::vector<double> y;
  y.reserve(rows.size());
  for (const auto& r : rows) y.push_back(target_value(r.targets, target).value());
  return y;
}

} // namespace

const std::vector<std::string>& default_training_targets() {
  static const std::vector<std::string> targets = {
    "peak_inc_mgdl",
    "incremental_auc_mgdl_min",
    "slope_0_60_mgdl_per_min",
  };
  return targets;
}

void validate_training_targets(const std::vector<std::string>& targets) {
  if (targets.empty()) throw std::runtime_error("No training targets given");
  for (const auto& t : targets) {
    if (!is_target_column(t)) throw std::runtime_error("Not a target column: '" + t + "'");
  }
}

std::vector<MealRow> select_labeled_rows(const std::vector<MealRow>& rows,
                                         const std::vector<std::string>& targets) {
  std::vector<MealRow> out;
  for (const auto& r : rows) {
    bool ok = true;
    for (const auto& t : targets) {
      if (!target_value(r.targets, t).known()) {
        ok = false;
        break;
      }
    }
    if (ok) out.push_back(r);
  }
  return out;
}

void time_split(std::vector<MealRow> rows,
                double test_frac,
                std::vector<MealRow>* train,
                std::vector<MealRow>* test) {
  if (!train || !test) throw std::runtime_error("time_split: output pointers must not be null");
  if (!std::isfinite(test_frac) || test_frac < 0.0 || test_frac >= 1.0) {
    throw std::runtime_error("test_frac must be in [0, 1)");
  }

  std::stable_sort(rows.begin(), rows.end(), [](const MealRow& a, const MealRow& b) {
    return a.eaten_at_ms < b.eaten_at_ms;
  });

  const size_t n = rows.size();
  size_t cut = static_cast<size_t>(std::floor((1.0 - test_frac) * static_cast<double>(n)));
  cut = std::min(std::max<size_t>(1, cut), n);

  train->assign(rows.begin(), rows.begin() + static_cast<std::ptrdiff_t>(cut));
  test->assign(rows.begin() + static_cast<std::ptrdiff_t>(cut), rows.end());
}

RegressionMetrics regression_metrics(const std::vector<double>& y_true, const std::vector<double>& y_pred) {
  if (y_true.size() != y_pred.size()) throw std::runtime_error("regression_metrics: size mismatch");

  RegressionMetrics m;
  m.n_test = y_true.size();
  if (y_true.empty()) return m;

  const double n = static_cast<double>(y_true.size());
  double abs_sum = 0.0;
  double sq_sum = 0.0;
  double mean = 0.0;
  for (size_t i = 0; i < y_true.size(); ++i) {
    const double e = y_pred[i] - y_true[i];
    abs_sum += std::fabs(e);
    sq_sum += e * e;
    mean += y_true[i];
  }
  mean /= n;

  double ss_tot = 0.0;
  for (double v : y_true) ss_tot += (v - mean) * (v - mean);

  m.mae = abs_sum / n;
  m.rmse = std::sqrt(sq_sum / n);
  if (ss_tot > 0.0) m.r2 = 1.0 - sq_sum / ss_tot;
  return m;
}

ModelArtifact train_model_artifact(const std::vector<MealRow>& rows, const TrainOptions& opt) {
  validate_training_targets(opt.targets);

  const std::vector<MealRow> labeled = select_labeled_rows(rows, opt.targets);
  if (labeled.size() < kMinTrainingRows) {
    throw std::runtime_error("Not enough labeled meals to train: " + std::to_string(labeled.size()) +
                             " (need at least " + std::to_string(kMinTrainingRows) + ")");
  }

  std::vector<MealRow> train;
  std::vector<MealRow> test;
  time_split(labeled, opt.test_frac, &train, &test);

  const std::vector<std::vector<MaybeReal>> X_train = design_matrix(train);
  const std::vector<std::vector<MaybeReal>> X_test = design_matrix(test);

  ModelArtifact a;
  a.feature_columns = feature_column_names();
  for (const auto& target : opt.targets) {
    auto reg = std::make_unique<RidgeRegressor>();
    reg->fit(X_train, target_vector(train, target), a.feature_columns, opt.lambda);

    std::vector<double> pred;
    pred.reserve(X_test.size());
    for (const auto& x : X_test) pred.push_back(reg->predict(x));

    TargetModel m;
    m.target = target;
    m.metrics = regression_metrics(target_vector(test, target), pred);
    m.metrics.n_train = train.size();
    m.regressor = std::move(reg);
    a.models.push_back(std::move(m));
  }
  return a;
}

} // namespace mealwin
