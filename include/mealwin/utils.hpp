#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace mealwin {

std::string trim(const std::string& s);

// Remove a UTF-8 BOM (0xEF,0xBB,0xBF) from the beginning of a string if present.
// Spreadsheet exports frequently start with one, which breaks header matching.
std::string strip_utf8_bom(std::string s);

std::vector<std::string> split(const std::string& s, char delim);

// Split a single CSV row into fields.
//
// Supports the common RFC-4180 behaviors:
//  - fields may be quoted with double quotes
//  - delimiters inside quoted fields are preserved
//  - escaped quotes inside quoted fields are written as "" and are unescaped
//
// Multi-line quoted fields are not supported (rows must be single-line).
// Throws std::runtime_error on an unterminated quoted field.
std::vector<std::string> split_csv_row(const std::string& row, char delim);

std::string to_lower(std::string s);

// Strict numeric parsing helpers.
//
// These trim surrounding whitespace and then require that the entire
// remaining string is a number (no trailing "abc" fragments). Parsing uses the
// classic "C" locale so '.' is the decimal separator regardless of the
// process locale. Throw std::runtime_error on failure.
int to_int(const std::string& s);
double to_double(const std::string& s);

void ensure_directory(const std::string& path);

// Write a text file (binary mode, parent directories created) through a
// temporary file in the destination directory, then rename it into
// place so readers never observe a partially written file.
// Returns false on failure (the temporary file is removed).
bool write_text_file_atomic(const std::string& path, const std::string& content);

// Current local time, ISO-8601 with numeric UTC offset, e.g. 2026-01-15T13:37:42-0500
std::string now_string_local();

// Current UTC time, ISO-8601, e.g. 2026-01-15T18:37:42Z
std::string now_string_utc();

// Parse an ISO-8601 / RFC3339-style timestamp to UTC milliseconds since the
// Unix epoch.
//
// Supported forms:
//   - YYYY-MM-DDTHH:MM:SS[.fff]Z
//   - YYYY-MM-DDTHH:MM:SS[.fff]+HH:MM   (also +HHMM and +HH; '-' likewise)
//   - ' ' may replace 'T'; ',' may replace '.' before the fraction
//   - surrounding whitespace is ignored
//
// Fractional seconds are truncated to milliseconds. A zone designator is
// required. Returns true on success and writes *out_utc_ms.
bool parse_iso8601_to_utc_millis(const std::string& ts, int64_t* out_utc_ms);

// Boundary timestamp parser used for input tables and CLI options.
//
// Accepts everything parse_iso8601_to_utc_millis() accepts, plus:
//   - zone-less timestamps (YYYY-MM-DD[T ]HH:MM[:SS[.fff]]), taken as UTC
//   - date-only YYYY-MM-DD, taken as midnight UTC
bool parse_timestamp_to_utc_millis(const std::string& ts, int64_t* out_utc_ms);

// Format UTC milliseconds as YYYY-MM-DDTHH:MM:SSZ, or YYYY-MM-DDTHH:MM:SS.sssZ
// when the millisecond part is non-zero.
std::string format_utc_millis_iso8601(int64_t utc_ms);

// Calendar breakdown of a millisecond timestamp (no time zone applied).
struct CivilTime {
  int year{1970};
  int month{1};    // 1..12
  int day{1};      // 1..31
  int hour{0};     // 0..23
  int minute{0};
  int second{0};
  int millis{0};
  int weekday{3};  // 0 = Monday ... 6 = Sunday
};

CivilTime civil_from_millis(int64_t ms);

// Escape a string for inclusion in a JSON string value (no surrounding quotes).
std::string json_escape(const std::string& s);

// Normalize and validate a relative path for safe joining under an output
// directory. Rejects ".." segments, absolute paths and drive prefixes.
// Writes a '/'-separated normalized path to *out_norm on success.
bool normalize_rel_path_safe(const std::string& raw, std::string* out_norm);

} // namespace mealwin
