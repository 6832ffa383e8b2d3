#include "mealwin/regressor.hpp"

#include "mealwin/running_stats.hpp"

#include <cmath>
#include <map>
#include <stdexcept>

namespace mealwin {

namespace {

static std::vector<double> solve_linear_system_gauss(std::vector<double> A,
                                                     std::vector<double> b,
                                                     size_t n) {
  // A is row-major n*n. b length n.
  if (b.size() != n || A.size() != n * n) {
    throw std::runtime_error("solve_linear_system_gauss: size mismatch");
  }

  auto idx = [n](size_t r, size_t c) { return r * n + c; };

  for (size_t i = 0; i < n; ++i) {
    size_t piv = i;
    double best = std::abs(A[idx(i, i)]);
    for (size_t r = i + 1; r < n; ++r) {
      const double v = std::abs(A[idx(r, i)]);
      if (v > best) {
        best = v;
        piv = r;
      }
    }

    if (best < 1e-12) {
      throw std::runtime_error("Ridge fit: normal equations are singular (try lambda > 0)");
    }

    if (piv != i) {
      for (size_t c = i; c < n; ++c) std::swap(A[idx(i, c)], A[idx(piv, c)]);
      std::swap(b[i], b[piv]);
    }

    const double diag = A[idx(i, i)];
    for (size_t r = i + 1; r < n; ++r) {
      const double f = A[idx(r, i)] / diag;
      if (f == 0.0) continue;
      A[idx(r, i)] = 0.0;
      for (size_t c = i + 1; c < n; ++c) A[idx(r, c)] -= f * A[idx(i, c)];
      b[r] -= f * b[i];
    }
  }

  std::vector<double> x(n, 0.0);
  for (size_t k = n; k-- > 0;) {
    double s = b[k];
    for (size_t c = k + 1; c < n; ++c) s -= A[idx(k, c)] * x[c];
    x[k] = s / A[idx(k, k)];
  }
  return x;
}

// Minimum standard deviation for a column to be considered non-constant.
constexpr double kMinScale = 1e-12;

} // namespace

void RidgeRegressor::fit(const std::vector<std::vector<MaybeReal>>& X,
                         const std::vector<double>& y,
                         const std::vector<std::string>& feature_columns,
                         double lambda) {
  if (X.empty()) throw std::runtime_error("Ridge fit: no training rows");
  if (X.size() != y.size()) throw std::runtime_error("Ridge fit: X/y row count mismatch");
  if (!std::isfinite(lambda) || lambda < 0.0) throw std::runtime_error("Ridge fit: lambda must be >= 0");

  const size_t n = X.size();
  const size_t p = feature_columns.size();
  for (const auto& row : X) {
    if (row.size() != p) throw std::runtime_error("Ridge fit: feature row width mismatch");
  }
  for (double v : y) {
    if (!std::isfinite(v)) throw std::runtime_error("Ridge fit: non-finite target value");
  }

  columns_ = feature_columns;
  lambda_ = lambda;
  means_.assign(p, 0.0);
  scales_.assign(p, 1.0);
  weights_.assign(p, 0.0);

  std::vector<bool> active(p, false);
  for (size_t j = 0; j < p; ++j) {
    RunningStats rs;
    for (size_t i = 0; i < n; ++i) rs.add(X[i][j]);
    means_[j] = rs.mean().value_or(0.0);
    const double sd = rs.stddev_population().value_or(0.0);
    if (sd > kMinScale) {
      scales_[j] = sd;
      active[j] = true;
    }
  }

  RunningStats ys;
  for (double v : y) ys.add(v);
  intercept_ = ys.mean().value_or(0.0);

  // Standardized design over the active columns only.
  std::vector<size_t> cols;
  for (size_t j = 0; j < p; ++j) {
    if (active[j]) cols.push_back(j);
  }
  const size_t q = cols.size();
  if (q == 0) return;

  std::vector<double> Z(n * q, 0.0);
  for (size_t i = 0; i < n; ++i) {
    for (size_t k = 0; k < q; ++k) {
      const size_t j = cols[k];
      const double v = X[i][j].value_or(means_[j]);
      Z[i * q + k] = (v - means_[j]) / scales_[j];
    }
  }

  std::vector<double> A(q * q, 0.0);
  std::vector<double> b(q, 0.0);
  for (size_t i = 0; i < n; ++i) {
    const double yc = y[i] - intercept_;
    for (size_t a = 0; a < q; ++a) {
      const double za = Z[i * q + a];
      b[a] += za * yc;
      for (size_t c = a; c < q; ++c) A[a * q + c] += za * Z[i * q + c];
    }
  }
  for (size_t a = 0; a < q; ++a) {
    for (size_t c = 0; c < a; ++c) A[a * q + c] = A[c * q + a];
    A[a * q + a] += lambda;
  }

  const std::vector<double> w = solve_linear_system_gauss(std::move(A), std::move(b), q);
  for (size_t k = 0; k < q; ++k) weights_[cols[k]] = w[k];
}

double RidgeRegressor::predict(const std::vector<MaybeReal>& features) const {
  if (features.size() != weights_.size()) {
    throw std::runtime_error("RidgeRegressor::predict: expected " + std::to_string(weights_.size()) +
                             " features, got " + std::to_string(features.size()));
  }
  double out = intercept_;
  for (size_t j = 0; j < weights_.size(); ++j) {
    if (weights_[j] == 0.0) continue;
    const double v = features[j].value_or(means_[j]);
    out += weights_[j] * (v - means_[j]) / scales_[j];
  }
  return out;
}

std::vector<RegressorTerm> RidgeRegressor::terms() const {
  std::vector<RegressorTerm> t;
  t.reserve(2 + 3 * columns_.size());
  t.emplace_back("lambda", lambda_);
  t.emplace_back("intercept", intercept_);
  for (size_t j = 0; j < columns_.size(); ++j) {
    t.emplace_back("mean:" + columns_[j], means_[j]);
    t.emplace_back("scale:" + columns_[j], scales_[j]);
    t.emplace_back("weight:" + columns_[j], weights_[j]);
  }
  return t;
}

std::unique_ptr<RidgeRegressor> RidgeRegressor::from_terms(const std::vector<RegressorTerm>& terms,
                                                           const std::vector<std::string>& feature_columns) {
  std::map<std::string, double> by_name;
  for (const auto& t : terms) by_name[t.first] = t.second;

  auto get = [&](const std::string& name) {
    const auto it = by_name.find(name);
    if (it == by_name.end()) throw std::runtime_error("Ridge model missing term: " + name);
    return it->second;
  };

  auto m = std::make_unique<RidgeRegressor>();
  m->columns_ = feature_columns;
  m->lambda_ = get("lambda");
  m->intercept_ = get("intercept");
  for (const auto& c : feature_columns) {
    m->means_.push_back(get("mean:" + c));
    const double scale = get("scale:" + c);
    if (!(scale > 0.0)) throw std::runtime_error("Ridge model has non-positive scale for: " + c);
    m->scales_.push_back(scale);
    m->weights_.push_back(get("weight:" + c));
  }
  return m;
}

std::unique_ptr<Regressor> make_regressor(const std::string& kind,
                                          const std::vector<RegressorTerm>& terms,
                                          const std::vector<std::string>& feature_columns) {
  if (kind == RidgeRegressor::kKind) return RidgeRegressor::from_terms(terms, feature_columns);
  throw std::runtime_error("Unknown regressor kind: '" + kind + "'");
}

} // namespace mealwin
