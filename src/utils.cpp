#include "mealwin/utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <locale>
#include <random>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace mealwin {

static inline bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trim(const std::string& s) {
  const auto b = std::find_if_not(s.begin(), s.end(), is_space);
  const auto e = std::find_if_not(s.rbegin(), std::string::const_reverse_iterator(b), is_space).base();
  return std::string(b, e);
}

std::string strip_utf8_bom(std::string s) {
  if (s.compare(0, 3, "\xEF\xBB\xBF") == 0) s.erase(0, 3);
  return s;
}

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> out;
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    out.push_back(item);
  }
  // Handle trailing empty field
  if (!s.empty() && s.back() == delim) out.emplace_back("");
  return out;
}

std::vector<std::string> split_csv_row(const std::string& row, char delim) {
  enum class State { kPlain, kQuoted, kClosed };

  std::vector<std::string> out(1);
  State st = State::kPlain;
  for (size_t i = 0; i < row.size(); ++i) {
    const char c = row[i];
    std::string& cell = out.back();

    if (st == State::kQuoted) {
      if (c != '"') {
        cell.push_back(c);
      } else if (i + 1 < row.size() && row[i + 1] == '"') {
        cell.push_back('"');
        ++i;
      } else {
        st = State::kClosed;
      }
      continue;
    }

    if (c == '\r') continue;
    if (c == delim) {
      out.emplace_back();
      st = State::kPlain;
      continue;
    }
    if (st == State::kClosed) {
      // Whitespace between a closing quote and the delimiter is dropped.
      if (is_space(c)) continue;
      st = State::kPlain;
    } else if (c == '"' && trim(cell).empty()) {
      cell.clear();
      st = State::kQuoted;
      continue;
    }
    cell.push_back(c);
  }

  if (st == State::kQuoted) {
    throw std::runtime_error("split_csv_row: unterminated quoted field");
  }
  return out;
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

int to_int(const std::string& s) {
  const std::string t = trim(s);
  size_t used = 0;
  int v = 0;
  try {
    v = std::stoi(t, &used, 10);
  } catch (const std::exception&) {
    used = 0;
  }
  if (t.empty() || used != t.size()) {
    throw std::runtime_error("Failed to parse int from '" + s + "'");
  }
  return v;
}

double to_double(const std::string& s) {
  const std::string t = trim(s);
  if (!t.empty()) {
    std::istringstream iss(t);
    iss.imbue(std::locale::classic());
    double v = 0.0;
    iss >> v;
    if (iss) {
      iss >> std::ws;
      if (iss.eof()) return v;
    }
  }
  throw std::runtime_error("Failed to parse double from '" + s + "'");
}

void ensure_directory(const std::string& path) {
  if (path.empty()) return;
  std::filesystem::create_directories(std::filesystem::u8path(path));
}

bool write_text_file_atomic(const std::string& path, const std::string& content) {
  namespace fs = std::filesystem;
  const fs::path target = fs::u8path(path);

  std::error_code ec;
  if (target.has_parent_path()) fs::create_directories(target.parent_path(), ec);

  std::random_device rd;
  std::ostringstream token;
  token << std::hex << rd() << rd();
  fs::path tmp = target;
  tmp += fs::u8path(".tmp." + token.str());

  {
    std::ofstream out(tmp, std::ios::binary);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) {
      fs::remove(tmp, ec);
      return false;
    }
  }

  fs::rename(tmp, target, ec);
  if (ec) {
    // Windows will not rename over an existing file.
    std::error_code rm_ec;
    fs::remove(target, rm_ec);
    ec.clear();
    fs::rename(tmp, target, ec);
  }
  if (ec) {
    fs::remove(tmp, ec);
    return false;
  }
  return true;
}

std::string now_string_local() {
  const std::time_t t = std::time(nullptr);
  std::tm tm{};
#if defined(_WIN32)
  if (localtime_s(&tm, &t) != 0) return now_string_utc();
#else
  if (localtime_r(&t, &tm) == nullptr) return now_string_utc();
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S%z");
  return oss.str();
}

std::string now_string_utc() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  const int64_t secs = std::chrono::duration_cast<std::chrono::seconds>(now).count();
  return format_utc_millis_iso8601(secs * 1000);
}

namespace {

// Exactly n decimal digits at s[pos].
static bool parse_digits(const std::string& s, size_t pos, size_t n, int* out) {
  if (pos + n > s.size()) return false;
  int v = 0;
  for (size_t i = pos; i < pos + n; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    v = v * 10 + (s[i] - '0');
  }
  *out = v;
  return true;
}

static bool parse_2dig(const std::string& s, size_t pos, int* out) {
  return parse_digits(s, pos, 2, out);
}

static bool is_leap_year(int y) {
  if (y % 4 != 0) return false;
  if (y % 100 != 0) return true;
  return (y % 400 == 0);
}

static int days_in_month(int y, int m) {
  static const int mdays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (m < 1 || m > 12) return 0;
  if (m == 2) return mdays[1] + (is_leap_year(y) ? 1 : 0);
  return mdays[m - 1];
}

// Days since 1970-01-01 for a proleptic Gregorian date (Howard Hinnant's
// civil date algorithms).
static int64_t days_from_civil(int y, unsigned m, unsigned d) {
  y -= (m <= 2) ? 1 : 0;
  const int era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return static_cast<int64_t>(era) * 146097 + static_cast<int64_t>(doe) - 719468;
}

static void civil_from_days(int64_t z, int* y_out, int* m_out, int* d_out) {
  z += 719468;
  const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const int64_t y = static_cast<int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  *y_out = static_cast<int>(y + (m <= 2 ? 1 : 0));
  *m_out = static_cast<int>(m);
  *d_out = static_cast<int>(d);
}

static int64_t floor_div(int64_t a, int64_t b) {
  int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
  return q;
}

// Shared parser. With require_zone=false, zone-less timestamps are UTC,
// seconds may be omitted and a bare date means midnight.
static bool parse_timestamp_impl(const std::string& ts_in, bool require_zone, int64_t* out_utc_ms) {
  if (!out_utc_ms) return false;
  *out_utc_ms = 0;

  const std::string ts = trim(ts_in);

  int year = 0;
  int mon = 0;
  int day = 0;
  if (!parse_digits(ts, 0, 4, &year) || ts.size() < 10 || ts[4] != '-') return false;
  if (!parse_2dig(ts, 5, &mon) || ts[7] != '-') return false;
  if (!parse_2dig(ts, 8, &day)) return false;
  if (mon < 1 || mon > 12) return false;
  if (day < 1 || day > days_in_month(year, mon)) return false;

  int hh = 0;
  int mm = 0;
  int ss = 0;
  int millis = 0;
  int offset_seconds = 0;

  size_t i = 10;
  if (i == ts.size()) {
    if (require_zone) return false;
  } else {
    const char t = ts[i];
    if (t != 'T' && t != 't' && t != ' ') return false;

    if (!parse_2dig(ts, 11, &hh) || ts.size() < 16 || ts[13] != ':') return false;
    if (!parse_2dig(ts, 14, &mm)) return false;
    i = 16;

    if (i < ts.size() && ts[i] == ':') {
      if (!parse_2dig(ts, 17, &ss)) return false;
      i = 19;
    } else if (require_zone) {
      return false;
    }

    if (hh > 23 || mm > 59 || ss > 59) return false;

    if (i < ts.size() && (ts[i] == '.' || ts[i] == ',')) {
      ++i;
      if (i >= ts.size() || ts[i] < '0' || ts[i] > '9') return false;
      int mult = 100;
      size_t nd = 0;
      while (i < ts.size() && ts[i] >= '0' && ts[i] <= '9') {
        if (nd < 3) {
          millis += (ts[i] - '0') * mult;
          mult /= 10;
        }
        ++nd;
        ++i;
      }
    }

    if (i == ts.size()) {
      if (require_zone) return false;
    } else {
      const char z = ts[i];
      if (z == 'Z' || z == 'z') {
        if (i + 1 != ts.size()) return false;
      } else if (z == '+' || z == '-') {
        int oh = 0;
        int om = 0;
        const size_t rest = ts.size() - i;
        if (rest == 6 && ts[i + 3] == ':') {
          if (!parse_2dig(ts, i + 1, &oh) || !parse_2dig(ts, i + 4, &om)) return false;
        } else if (rest == 5) {
          if (!parse_2dig(ts, i + 1, &oh) || !parse_2dig(ts, i + 3, &om)) return false;
        } else if (rest == 3) {
          if (!parse_2dig(ts, i + 1, &oh)) return false;
        } else {
          return false;
        }
        if (oh > 23 || om > 59) return false;
        offset_seconds = oh * 3600 + om * 60;
        if (z == '-') offset_seconds = -offset_seconds;
      } else {
        return false;
      }
    }
  }

  const int64_t days = days_from_civil(year, static_cast<unsigned>(mon), static_cast<unsigned>(day));
  const int64_t local_seconds = days * 86400 + static_cast<int64_t>(hh) * 3600 +
                                static_cast<int64_t>(mm) * 60 + static_cast<int64_t>(ss);

  // local_time = utc_time + offset
  const int64_t utc_seconds = local_seconds - static_cast<int64_t>(offset_seconds);
  *out_utc_ms = utc_seconds * 1000 + static_cast<int64_t>(millis);
  return true;
}

} // namespace

bool parse_iso8601_to_utc_millis(const std::string& ts, int64_t* out_utc_ms) {
  return parse_timestamp_impl(ts, true, out_utc_ms);
}

bool parse_timestamp_to_utc_millis(const std::string& ts, int64_t* out_utc_ms) {
  return parse_timestamp_impl(ts, false, out_utc_ms);
}

CivilTime civil_from_millis(int64_t ms) {
  const int64_t days = floor_div(ms, 86400000LL);
  const int64_t ms_of_day = ms - days * 86400000LL;

  CivilTime c;
  civil_from_days(days, &c.year, &c.month, &c.day);
  c.hour = static_cast<int>(ms_of_day / 3600000LL);
  c.minute = static_cast<int>((ms_of_day / 60000LL) % 60);
  c.second = static_cast<int>((ms_of_day / 1000LL) % 60);
  c.millis = static_cast<int>(ms_of_day % 1000LL);

  // 1970-01-01 was a Thursday (3 with Monday = 0).
  c.weekday = static_cast<int>(((days % 7) + 7 + 3) % 7);
  return c;
}

std::string format_utc_millis_iso8601(int64_t utc_ms) {
  const CivilTime c = civil_from_millis(utc_ms);
  std::ostringstream oss;
  oss << std::setfill('0')
      << std::setw(4) << c.year << "-"
      << std::setw(2) << c.month << "-"
      << std::setw(2) << c.day << "T"
      << std::setw(2) << c.hour << ":"
      << std::setw(2) << c.minute << ":"
      << std::setw(2) << c.second;
  if (c.millis != 0) oss << "." << std::setw(3) << c.millis;
  oss << "Z";
  return oss.str();
}

std::string json_escape(const std::string& s) {
  std::ostringstream oss;
  oss << std::hex << std::uppercase;
  for (unsigned char uc : s) {
    const char c = static_cast<char>(uc);
    switch (c) {
      case '"': oss << "\\\""; break;
      case '\\': oss << "\\\\"; break;
      case '\b': oss << "\\b"; break;
      case '\f': oss << "\\f"; break;
      case '\n': oss << "\\n"; break;
      case '\r': oss << "\\r"; break;
      case '\t': oss << "\\t"; break;
      default:
        if (uc < 0x20) {
          oss << "\\u" << std::setw(4) << std::setfill('0') << static_cast<int>(uc);
          oss << std::setw(0) << std::setfill(' ');
        } else {
          oss << c;
        }
        break;
    }
  }
  return oss.str();
}

bool normalize_rel_path_safe(const std::string& raw, std::string* out_norm) {
  if (!out_norm) return false;
  *out_norm = std::string();

  std::string s = trim(raw);
  if (s.empty()) return false;
  if (s.find('\0') != std::string::npos) return false;

  std::replace(s.begin(), s.end(), '\\', '/');

  // Drive prefixes like "C:".
  if (s.size() >= 2 && std::isalpha(static_cast<unsigned char>(s[0])) != 0 && s[1] == ':') {
    return false;
  }

  while (!s.empty() && s.front() == '/') s.erase(s.begin());
  while (!s.empty() && s.back() == '/') s.pop_back();
  if (s.empty()) return false;

  const std::filesystem::path p = std::filesystem::u8path(s);
  if (p.is_absolute() || p.has_root_name() || p.has_root_directory()) return false;
  for (const auto& part : p) {
    const std::string comp = part.u8string();
    if (comp.empty() || comp == "..") return false;
  }

  const std::string norm = p.lexically_normal().generic_u8string();
  if (norm.empty() || norm == ".") return false;

  *out_norm = norm;
  return true;
}

} // namespace mealwin
