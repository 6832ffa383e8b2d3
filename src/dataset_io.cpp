#include "mealwin/dataset_io.hpp"

#include "mealwin/csv_io.hpp"
#include "mealwin/utils.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

namespace mealwin {

std::vector<std::string> dataset_column_names() {
  std::vector<std::string> cols = {"meal_event_id", "eaten_at"};
  for (const auto& c : feature_column_names()) cols.push_back(c);
  for (const auto& c : target_column_names()) cols.push_back(c);
  cols.push_back("egv_points_in_window");
  cols.push_back("low_confidence");
  return cols;
}

std::string format_dataset_csv(const std::vector<MealRow>& rows) {
  if (rows.empty()) return std::string();

  std::ostringstream o;
  const auto cols = dataset_column_names();
  for (size_t i = 0; i < cols.size(); ++i) {
    if (i) o << ",";
    o << cols[i];
  }
  o << "\n";

  for (const auto& r : rows) {
    o << csv_escape(r.meal_event_id) << "," << format_utc_millis_iso8601(r.eaten_at_ms);
    for (const auto& v : feature_values(r.features)) o << "," << format_maybe_real(v);
    for (const auto& name : target_column_names()) {
      o << "," << format_maybe_real(target_value(r.targets, name));
    }
    o << "," << r.egv_points_in_window << "," << (r.targets.low_confidence ? 1 : 0) << "\n";
  }
  return o.str();
}

void write_dataset_csv(const std::string& path, const std::vector<MealRow>& rows) {
  if (!write_text_file_atomic(path, format_dataset_csv(rows))) {
    throw std::runtime_error("Failed to write dataset CSV: " + path);
  }
}

std::vector<MealRow> read_dataset_csv(const std::string& path) {
  const DelimitedTable t = DelimitedTable::read(path);
  std::vector<MealRow> out;
  if (t.header.empty()) return out;

  const size_t c_id = t.require_column({"meal_event_id"});
  const size_t c_at = t.require_column({"eaten_at"});
  const int c_points = t.find_column({"egv_points_in_window"});
  const int c_low = t.find_column({"low_confidence"});

  std::vector<int> feature_cols;
  for (const auto& name : feature_column_names()) feature_cols.push_back(t.find_column({name}));
  std::vector<int> target_cols;
  for (const auto& name : target_column_names()) target_cols.push_back(t.find_column({name}));

  const auto& fnames = feature_column_names();
  const auto& tnames = target_column_names();

  out.reserve(t.rows.size());
  for (const auto& row : t.rows) {
    const std::string where = table_location(t, row);
    try {
      MealRow r;
      r.meal_event_id = trim(row.cells[c_id]);
      if (r.meal_event_id.empty()) throw std::runtime_error("empty meal_event_id");
      const std::string at = trim(row.cells[c_at]);
      if (!parse_timestamp_to_utc_millis(at, &r.eaten_at_ms)) {
        throw std::runtime_error("invalid eaten_at '" + at + "'");
      }

      for (size_t i = 0; i < fnames.size(); ++i) {
        if (feature_cols[i] < 0) continue;
        set_feature_value(&r.features, fnames[i], parse_maybe_real(row.cells[static_cast<size_t>(feature_cols[i])]));
      }
      for (size_t i = 0; i < tnames.size(); ++i) {
        if (target_cols[i] < 0) continue;
        set_target_value(&r.targets, tnames[i], parse_maybe_real(row.cells[static_cast<size_t>(target_cols[i])]));
      }
      // The baseline is stored once, as a feature.
      r.targets.baseline_mgdl = r.features.context.baseline_mgdl;

      if (c_points >= 0) {
        const std::string s = trim(row.cells[static_cast<size_t>(c_points)]);
        if (!s.empty()) r.egv_points_in_window = static_cast<size_t>(to_int(s));
      }
      if (c_low >= 0) {
        const std::string s = trim(row.cells[static_cast<size_t>(c_low)]);
        r.targets.low_confidence = !(s == "0" || to_lower(s) == "false");
      }
      out.push_back(std::move(r));
    } catch (const std::exception& e) {
      throw std::runtime_error(where + e.what());
    }
  }
  return out;
}

} // namespace mealwin
