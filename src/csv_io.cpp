#include "mealwin/csv_io.hpp"

#include "mealwin/utils.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>
#include <stdexcept>

namespace mealwin {

namespace {

static size_t count_delim_outside_quotes(const std::string& line, char delim) {
  bool in_quotes = false;
  size_t n = 0;
  for (size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (c == '"') {
      // Escaped quote: "" inside quotes.
      if (in_quotes && i + 1 < line.size() && line[i + 1] == '"') {
        ++i;
        continue;
      }
      in_quotes = !in_quotes;
      continue;
    }
    if (!in_quotes && c == delim) ++n;
  }
  return n;
}

static char detect_delim(const std::string& header, const std::string& path) {
  if (to_lower(std::filesystem::u8path(path).extension().u8string()) == ".tsv") return '\t';

  const size_t n_tab = count_delim_outside_quotes(header, '\t');
  const size_t n_comma = count_delim_outside_quotes(header, ',');
  const size_t n_semi = count_delim_outside_quotes(header, ';');

  // Highest count wins; ties prefer comma, then semicolon, then tab.
  char best = ',';
  size_t best_n = n_comma;
  if (n_semi > best_n) {
    best = ';';
    best_n = n_semi;
  }
  if (n_tab > best_n) {
    best = '\t';
    best_n = n_tab;
  }
  return best;
}

static bool is_comment_or_blank(const std::string& t) {
  return t.empty() || t[0] == '#';
}

} // namespace

std::string csv_escape(const std::string& s) {
  // A leading '#' would read back as a comment line.
  const size_t first = s.find_first_not_of(" \t");
  bool need = first != std::string::npos && s[first] == '#';
  for (char c : s) {
    if (c == '"' || c == ',' || c == '\n' || c == '\r') {
      need = true;
      break;
    }
  }
  if (!need) return s;

  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('"');
  for (char c : s) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

bool is_missing_token(const std::string& cell) {
  const std::string low = to_lower(trim(cell));
  return low.empty() || low == "nan" || low == "na" || low == "n/a" || low == "none" || low == "null";
}

MaybeReal parse_maybe_real(const std::string& cell) {
  if (is_missing_token(cell)) return MaybeReal();
  const double v = to_double(cell);
  if (!std::isfinite(v)) {
    throw std::runtime_error("Non-finite numeric value: '" + trim(cell) + "'");
  }
  return v;
}

std::string format_maybe_real(const MaybeReal& v) {
  if (!v.known()) return std::string();
  std::ostringstream oss;
  oss.imbue(std::locale::classic());
  oss << std::setprecision(std::numeric_limits<double>::max_digits10) << v.value();
  return oss.str();
}

DelimitedTable DelimitedTable::read(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) throw std::runtime_error("Failed to open table: " + path);

  DelimitedTable t;
  t.path = path;

  std::string line;
  size_t line_no = 0;
  bool have_header = false;
  while (std::getline(f, line)) {
    ++line_no;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (!have_header) {
      // Some Windows exports prefix the first line with a UTF-8 BOM.
      const std::string s = trim(strip_utf8_bom(line));
      if (is_comment_or_blank(s)) continue;
      t.delim = detect_delim(s, path);
      try {
        t.header = split_csv_row(s, t.delim);
      } catch (const std::exception& e) {
        throw std::runtime_error(path + ":" + std::to_string(line_no) + ": " + e.what());
      }
      for (auto& h : t.header) h = trim(h);
      have_header = true;
      continue;
    }

    const std::string s = trim(line);
    if (is_comment_or_blank(s)) continue;

    Row row;
    row.line_no = line_no;
    try {
      row.cells = split_csv_row(line, t.delim);
    } catch (const std::exception& e) {
      throw std::runtime_error(path + ":" + std::to_string(line_no) + ": " + e.what());
    }
    while (row.cells.size() > t.header.size() && trim(row.cells.back()).empty()) {
      row.cells.pop_back();
    }
    if (row.cells.size() < t.header.size()) row.cells.resize(t.header.size());
    t.rows.push_back(std::move(row));
  }
  return t;
}

int DelimitedTable::find_column(const std::vector<std::string>& names) const {
  for (const auto& want : names) {
    const std::string w = to_lower(want);
    for (size_t i = 0; i < header.size(); ++i) {
      if (to_lower(header[i]) == w) return static_cast<int>(i);
    }
  }
  return -1;
}

size_t DelimitedTable::require_column(const std::vector<std::string>& names) const {
  const int idx = find_column(names);
  if (idx < 0) {
    std::string want;
    for (size_t i = 0; i < names.size(); ++i) {
      if (i) want += "/";
      want += names[i];
    }
    throw std::runtime_error("Table missing required column (" + want + "): " + path);
  }
  return static_cast<size_t>(idx);
}

std::string table_location(const DelimitedTable& t, const DelimitedTable::Row& row) {
  return t.path + ":" + std::to_string(row.line_no) + ": ";
}

} // namespace mealwin
