#include "mealwin/window_config.hpp"

#include "mealwin/csv_io.hpp"
#include "mealwin/utils.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace mealwin {

namespace {

struct MinuteField {
  const char* key;
  double MealWindowConfig::*field;
};

struct CountField {
  const char* key;
  size_t MealWindowConfig::*field;
};

static const MinuteField kMinuteFields[] = {
  {"pre_baseline_minutes", &MealWindowConfig::pre_baseline_minutes},
  {"pre_context_minutes", &MealWindowConfig::pre_context_minutes},
  {"post_minutes", &MealWindowConfig::post_minutes},
  {"slope_minutes", &MealWindowConfig::slope_minutes},
  {"grid_minutes", &MealWindowConfig::grid_minutes},
  {"activity_pre_minutes", &MealWindowConfig::activity_pre_minutes},
  {"activity_post_minutes", &MealWindowConfig::activity_post_minutes},
};

static const CountField kCountFields[] = {
  {"min_points_pre_baseline", &MealWindowConfig::min_points_pre_baseline},
  {"min_points_post", &MealWindowConfig::min_points_post},
};

static const char* kOffsetKey = "local_utc_offset_minutes";

static std::string normalize_key(const std::string& key) {
  std::string k = to_lower(trim(key));
  std::replace(k.begin(), k.end(), '-', '_');
  return k;
}

static bool is_comment_or_empty_line(const std::string& s) {
  const std::string t = trim(s);
  return t.empty() || t[0] == '#';
}

} // namespace

const std::vector<std::string>& window_config_keys() {
  static const std::vector<std::string> keys = [] {
    std::vector<std::string> k;
    for (const auto& f : kMinuteFields) k.emplace_back(f.key);
    for (const auto& f : kCountFields) k.emplace_back(f.key);
    k.emplace_back(kOffsetKey);
    return k;
  }();
  return keys;
}

void set_window_config_value(MealWindowConfig* cfg, const std::string& key, const std::string& value) {
  if (!cfg) throw std::runtime_error("set_window_config_value: cfg is null");
  const std::string k = normalize_key(key);

  for (const auto& f : kMinuteFields) {
    if (k == f.key) {
      cfg->*(f.field) = to_double(value);
      return;
    }
  }
  for (const auto& f : kCountFields) {
    if (k == f.key) {
      const int n = to_int(value);
      if (n < 0) throw std::runtime_error(std::string(f.key) + " must be >= 0");
      cfg->*(f.field) = static_cast<size_t>(n);
      return;
    }
  }
  if (k == kOffsetKey) {
    cfg->local_utc_offset_minutes = to_double(value);
    return;
  }
  throw std::runtime_error("Unknown window config key: '" + key + "'");
}

MealWindowConfig load_window_config(const std::string& path) {
  MealWindowConfig cfg;
  load_window_config_into(path, &cfg);
  return cfg;
}

void load_window_config_into(const std::string& path, MealWindowConfig* cfg) {
  std::ifstream f(path);
  if (!f) throw std::runtime_error("Failed to open window config: " + path);

  std::string line;
  size_t line_no = 0;
  bool first = true;
  while (std::getline(f, line)) {
    ++line_no;
    if (first) {
      line = strip_utf8_bom(line);
      first = false;
    }
    if (is_comment_or_empty_line(line)) continue;

    const size_t eq = line.find('=');
    if (eq == std::string::npos) {
      throw std::runtime_error(path + ":" + std::to_string(line_no) + ": expected key=value");
    }
    try {
      set_window_config_value(cfg, line.substr(0, eq), line.substr(eq + 1));
    } catch (const std::exception& e) {
      throw std::runtime_error(path + ":" + std::to_string(line_no) + ": " + e.what());
    }
  }
}

void validate_window_config(const MealWindowConfig& cfg) {
  for (const auto& f : kMinuteFields) {
    const double v = cfg.*(f.field);
    if (!std::isfinite(v) || v < 0.0) {
      throw std::runtime_error(std::string("Invalid window config: ") + f.key + " must be finite and >= 0");
    }
  }
  if (!(cfg.grid_minutes > 0.0)) {
    throw std::runtime_error("Invalid window config: grid_minutes must be > 0");
  }
  if (!std::isfinite(cfg.local_utc_offset_minutes)) {
    throw std::runtime_error("Invalid window config: local_utc_offset_minutes must be finite");
  }
}

std::vector<std::string> window_config_warnings(const MealWindowConfig& cfg) {
  std::vector<std::string> w;
  if (cfg.slope_minutes > cfg.post_minutes) {
    w.push_back("slope_minutes > post_minutes; the slope is computed over [0, post_minutes]");
  }
  if (cfg.pre_baseline_minutes > cfg.pre_context_minutes) {
    w.push_back("pre_baseline_minutes > pre_context_minutes; baseline samples are limited to the context window");
  }
  if (cfg.grid_minutes > cfg.post_minutes) {
    w.push_back("grid_minutes > post_minutes; the post-meal grid has a single point");
  }
  return w;
}

std::string format_window_config(const MealWindowConfig& cfg) {
  std::ostringstream o;
  for (const auto& f : kMinuteFields) {
    o << f.key << "=" << format_maybe_real(cfg.*(f.field)) << "\n";
  }
  for (const auto& f : kCountFields) {
    o << f.key << "=" << cfg.*(f.field) << "\n";
  }
  o << kOffsetKey << "=" << format_maybe_real(cfg.local_utc_offset_minutes) << "\n";
  return o.str();
}

} // namespace mealwin
