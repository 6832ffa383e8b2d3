#pragma once

#include "mealwin/maybe_real.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace mealwin {

// Minimal CSV helpers shared by the data-source readers, the dataset writer
// and the model artifact.
//
// Notes:
// - Output always uses comma (",") as the delimiter and the classic "C"
//   locale, so files stay parseable regardless of process locale.
// - Input delimiter is auto-detected (see DelimitedTable::read).

// Escape a string for inclusion in a CSV cell.
// - Quotes are doubled.
// - The cell is wrapped in quotes if it contains: comma, quote, or newline.
std::string csv_escape(const std::string& s);

// True for tokens that mean "no value" in a numeric cell:
// empty, nan, na, n/a, none, null (case-insensitive, surrounding whitespace ignored).
bool is_missing_token(const std::string& cell);

// Parse a numeric cell.
//
// Missing tokens (is_missing_token) give unknown. Any other text must be a
// finite number in the classic locale, otherwise std::runtime_error is thrown.
MaybeReal parse_maybe_real(const std::string& cell);

// Format a value for a CSV cell: empty for unknown, otherwise the shortest
// classic-locale text that round-trips the double exactly (max_digits10).
std::string format_maybe_real(const MaybeReal& v);

// A delimited text table loaded fully into memory.
//
// The reader is forgiving about layout:
// - Leading blank lines and lines beginning with '#' are ignored.
// - A UTF-8 BOM on the header line is tolerated.
// - Delimiter: '\t' for *.tsv, otherwise the most frequent of ',', ';', '\t'
//   outside quotes in the header line (comma on ties).
// - Short rows are padded with empty cells; trailing empty cells beyond the
//   header are dropped.
//
// Column lookup is case-insensitive.
struct DelimitedTable {
  std::string path;
  char delim{','};
  std::vector<std::string> header;

  struct Row {
    size_t line_no{0};  // 1-based line number in the source file
    std::vector<std::string> cells;
  };
  std::vector<Row> rows;

  // Throws std::runtime_error if the file cannot be opened or a row is
  // malformed (e.g. unterminated quote). An empty file yields an empty table.
  static DelimitedTable read(const std::string& path);

  // Column index for the first matching name, or -1.
  int find_column(const std::vector<std::string>& names) const;

  // Like find_column, but throws naming the file and the expected column.
  size_t require_column(const std::vector<std::string>& names) const;

  bool empty() const { return rows.empty(); }
};

// Error message prefix "<path>:<line>: " for row-level diagnostics.
std::string table_location(const DelimitedTable& t, const DelimitedTable::Row& row);

} // namespace mealwin
