#include "mealwin/model_artifact.hpp"

#include "mealwin/csv_io.hpp"
#include "mealwin/utils.hpp"

#include <algorithm>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>

namespace mealwin {

const char* const kModelFormat = "mealwin-model-v1";

namespace {

static const char* kMetricKind = "metric";

static std::string join_list(const std::vector<std::string>& v) {
  std::string out;
  for (size_t i = 0; i < v.size(); ++i) {
    if (i) out += ";";
    out += v[i];
  }
  return out;
}

static std::vector<std::string> split_list(const std::string& s) {
  std::vector<std::string> out;
  for (const auto& part : split(s, ';')) {
    const std::string t = trim(part);
    if (!t.empty()) out.push_back(t);
  }
  return out;
}

// "# key=value" lines preceding the table.
static std::map<std::string, std::string> read_metadata(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) throw std::runtime_error("Failed to open model artifact: " + path);

  std::map<std::string, std::string> meta;
  std::string line;
  bool first = true;
  while (std::getline(f, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (first) {
      line = strip_utf8_bom(line);
      first = false;
    }
    const std::string t = trim(line);
    if (t.empty()) continue;
    if (t[0] != '#') break;
    const size_t eq = t.find('=');
    if (eq == std::string::npos) continue;
    meta[trim(t.substr(1, eq - 1))] = trim(t.substr(eq + 1));
  }
  return meta;
}

static void set_metric(RegressionMetrics* m, const std::string& term, const MaybeReal& v) {
  if (term == "mae") m->mae = v;
  else if (term == "rmse") m->rmse = v;
  else if (term == "r2") m->r2 = v;
  else if (term == "n_train") m->n_train = static_cast<size_t>(v.value_or(0.0));
  else if (term == "n_test") m->n_test = static_cast<size_t>(v.value_or(0.0));
  else throw std::runtime_error("unknown metric term '" + term + "'");
}

} // namespace

std::vector<std::string> ModelArtifact::target_names() const {
  std::vector<std::string> out;
  out.reserve(models.size());
  for (const auto& m : models) out.push_back(m.target);
  return out;
}

const TargetModel& ModelArtifact::model_for(const std::string& target) const {
  for (const auto& m : models) {
    if (m.target == target) return m;
  }
  throw std::runtime_error("Model has no target: " + target);
}

std::string format_model_artifact(const ModelArtifact& artifact) {
  std::ostringstream o;
  o << "# format=" << kModelFormat << "\n";
  o << "# feature_columns=" << join_list(artifact.feature_columns) << "\n";
  o << "# targets=" << join_list(artifact.target_names()) << "\n";
  o << "target,kind,term,value\n";
  for (const auto& m : artifact.models) {
    if (!m.regressor) throw std::runtime_error("Model for target '" + m.target + "' is not fitted");
    const std::string kind = m.regressor->kind();
    for (const auto& t : m.regressor->terms()) {
      o << csv_escape(m.target) << "," << kind << "," << csv_escape(t.first) << ","
        << format_maybe_real(t.second) << "\n";
    }
    o << m.target << "," << kMetricKind << ",mae," << format_maybe_real(m.metrics.mae) << "\n";
    o << m.target << "," << kMetricKind << ",rmse," << format_maybe_real(m.metrics.rmse) << "\n";
    o << m.target << "," << kMetricKind << ",r2," << format_maybe_real(m.metrics.r2) << "\n";
    o << m.target << "," << kMetricKind << ",n_train," << m.metrics.n_train << "\n";
    o << m.target << "," << kMetricKind << ",n_test," << m.metrics.n_test << "\n";
  }
  return o.str();
}

void save_model_artifact(const std::string& path, const ModelArtifact& artifact) {
  if (!write_text_file_atomic(path, format_model_artifact(artifact))) {
    throw std::runtime_error("Failed to write model artifact: " + path);
  }
}

ModelArtifact load_model_artifact(const std::string& path) {
  const auto meta = read_metadata(path);

  const auto fmt = meta.find("format");
  if (fmt == meta.end() || fmt->second != kModelFormat) {
    throw std::runtime_error("Not a " + std::string(kModelFormat) + " model artifact: " + path);
  }
  const auto cols = meta.find("feature_columns");
  const auto tgts = meta.find("targets");
  if (cols == meta.end() || tgts == meta.end()) {
    throw std::runtime_error("Model artifact missing feature_columns/targets metadata: " + path);
  }

  ModelArtifact a;
  a.feature_columns = split_list(cols->second);
  const std::vector<std::string> targets = split_list(tgts->second);
  if (targets.empty()) throw std::runtime_error("Model artifact lists no targets: " + path);

  struct Pending {
    std::string kind;
    std::vector<RegressorTerm> terms;
    RegressionMetrics metrics;
  };
  std::map<std::string, Pending> pending;
  for (const auto& t : targets) pending[t];

  const DelimitedTable table = DelimitedTable::read(path);
  const size_t c_target = table.require_column({"target"});
  const size_t c_kind = table.require_column({"kind"});
  const size_t c_term = table.require_column({"term"});
  const size_t c_value = table.require_column({"value"});

  for (const auto& row : table.rows) {
    try {
      const std::string target = trim(row.cells[c_target]);
      const std::string kind = trim(row.cells[c_kind]);
      const std::string term = trim(row.cells[c_term]);
      const MaybeReal value = parse_maybe_real(row.cells[c_value]);

      const auto it = pending.find(target);
      if (it == pending.end()) throw std::runtime_error("target '" + target + "' not listed in metadata");
      Pending& p = it->second;

      if (kind == kMetricKind) {
        set_metric(&p.metrics, term, value);
        continue;
      }
      if (!p.kind.empty() && p.kind != kind) {
        throw std::runtime_error("mixed regressor kinds for target '" + target + "'");
      }
      p.kind = kind;
      if (!value.known()) throw std::runtime_error("missing value for term '" + term + "'");
      p.terms.emplace_back(term, value.value());
    } catch (const std::exception& e) {
      throw std::runtime_error(table_location(table, row) + e.what());
    }
  }

  for (const auto& t : targets) {
    Pending& p = pending[t];
    if (p.kind.empty()) throw std::runtime_error("Model artifact has no parameters for target '" + t + "': " + path);
    TargetModel m;
    m.target = t;
    m.regressor = make_regressor(p.kind, p.terms, a.feature_columns);
    m.metrics = p.metrics;
    a.models.push_back(std::move(m));
  }
  return a;
}

std::vector<TargetPrediction> predict_targets(const ModelArtifact& artifact, const FeatureRow& features) {
  const auto& expected = feature_column_names();
  if (artifact.feature_columns != expected) {
    std::ostringstream msg;
    msg << "Model feature columns do not match this build (model has "
        << artifact.feature_columns.size() << ", expected " << expected.size() << ")";
    for (size_t i = 0; i < std::max(artifact.feature_columns.size(), expected.size()); ++i) {
      const std::string have = i < artifact.feature_columns.size() ? artifact.feature_columns[i] : "<none>";
      const std::string want = i < expected.size() ? expected[i] : "<none>";
      if (have != want) {
        msg << "; first difference at column " << i << ": '" << have << "' vs '" << want << "'";
        break;
      }
    }
    throw std::runtime_error(msg.str());
  }

  const std::vector<MaybeReal> x = feature_values(features);
  std::vector<TargetPrediction> out;
  out.reserve(artifact.models.size());
  for (const auto& m : artifact.models) {
    if (!m.regressor) throw std::runtime_error("Model for target '" + m.target + "' is not fitted");
    out.push_back(TargetPrediction{m.target, m.regressor->predict(x)});
  }
  return out;
}

} // namespace mealwin
