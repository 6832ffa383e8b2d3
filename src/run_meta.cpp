#include "mealwin/run_meta.hpp"
#include "mealwin/utils.hpp"
#include "mealwin/version.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace mealwin {

namespace {

static std::string read_all(const std::string& path) {
  std::ifstream f(std::filesystem::u8path(path), std::ios::binary);
  if (!f) return std::string();
  std::ostringstream oss;
  oss << f.rdbuf();
  return oss.str();
}

static void skip_ws(const std::string& s, size_t* i) {
  while (*i < s.size() && std::isspace(static_cast<unsigned char>(s[*i])) != 0) ++(*i);
}

// Parses a JSON string starting at s[*i] == '"'. Handles the escapes
// json_escape() produces; \u escapes are kept only for ASCII code points.
static bool parse_json_string(const std::string& s, size_t* i, std::string* out) {
  if (*i >= s.size() || s[*i] != '"') return false;
  ++(*i);
  std::string r;
  while (*i < s.size()) {
    const char c = s[(*i)++];
    if (c == '"') {
      if (out) *out = r;
      return true;
    }
    if (c != '\\') {
      r.push_back(c);
      continue;
    }
    if (*i >= s.size()) return false;
    const char e = s[(*i)++];
    switch (e) {
      case 'n': r.push_back('\n'); break;
      case 'r': r.push_back('\r'); break;
      case 't': r.push_back('\t'); break;
      case 'b': r.push_back('\b'); break;
      case 'f': r.push_back('\f'); break;
      case 'u': {
        if (*i + 4 > s.size()) return false;
        unsigned cp = 0;
        try {
          cp = static_cast<unsigned>(std::stoul(s.substr(*i, 4), nullptr, 16));
        } catch (const std::exception&) {
          return false;
        }
        *i += 4;
        r.push_back(cp < 0x80u ? static_cast<char>(cp) : '?');
        break;
      }
      default: r.push_back(e); break;
    }
  }
  return false;
}

// Position of the value of a top-level member, skipping keys that appear
// inside nested objects or string values.
static bool find_value_pos_top_level(const std::string& s, const std::string& key, size_t* out_pos) {
  int depth = 0;
  size_t i = 0;
  while (i < s.size()) {
    const char c = s[i];
    if (c == '"') {
      const size_t start = i;
      std::string tok;
      if (!parse_json_string(s, &i, &tok)) {
        i = start + 1;
        continue;
      }
      if (depth == 1 && tok == key) {
        size_t j = i;
        skip_ws(s, &j);
        if (j < s.size() && s[j] == ':') {
          ++j;
          skip_ws(s, &j);
          *out_pos = j;
          return true;
        }
      }
      continue;
    }
    if (c == '{' || c == '[') ++depth;
    else if ((c == '}' || c == ']') && depth > 0) --depth;
    ++i;
  }
  return false;
}

} // namespace

bool write_run_meta_json(const std::string& json_path,
                         const std::string& tool,
                         const std::string& outdir,
                         const std::string& input_path,
                         const std::vector<std::string>& outputs) {
  std::ostringstream out;

  out << "{\n";
  out << "  \"Tool\": \"" << json_escape(tool) << "\",\n";
  out << "  \"MealwinVersion\": \"" << json_escape(version_string()) << "\",\n";
  out << "  \"GitDescribe\": \"" << json_escape(git_describe_string()) << "\",\n";
  out << "  \"BuildType\": \"" << json_escape(build_type_string()) << "\",\n";
  out << "  \"Compiler\": \"" << json_escape(compiler_string()) << "\",\n";
  out << "  \"CppStandard\": \"" << json_escape(cpp_standard_string()) << "\",\n";
  out << "  \"TimestampLocal\": \"" << json_escape(now_string_local()) << "\",\n";
  out << "  \"TimestampUTC\": \"" << json_escape(now_string_utc()) << "\",\n";
  out << "  \"OutputDir\": \"" << json_escape(outdir) << "\",\n";
  out << "  \"InputPath\": ";
  if (input_path.empty()) {
    out << "null";
  } else {
    out << "\"" << json_escape(input_path) << "\"";
  }
  out << ",\n";

  std::vector<std::string> safe_outputs;
  std::unordered_set<std::string> seen;
  for (const auto& o : outputs) {
    std::string norm;
    if (!normalize_rel_path_safe(o, &norm)) continue;
    if (seen.insert(norm).second) safe_outputs.push_back(norm);
  }

  out << "  \"Outputs\": [\n";
  for (size_t i = 0; i < safe_outputs.size(); ++i) {
    out << "    \"" << json_escape(safe_outputs[i]) << "\"";
    if (i + 1 < safe_outputs.size()) out << ",";
    out << "\n";
  }
  out << "  ]\n";
  out << "}\n";
  return write_text_file_atomic(json_path, out.str());
}

std::string read_run_meta_string(const std::string& json_path, const std::string& key) {
  const std::string s = read_all(json_path);
  size_t pos = 0;
  if (!find_value_pos_top_level(s, key, &pos)) return std::string();
  std::string v;
  if (!parse_json_string(s, &pos, &v)) return std::string();
  return v;
}

std::vector<std::string> read_run_meta_outputs(const std::string& json_path) {
  const std::string s = read_all(json_path);
  size_t pos = 0;
  std::vector<std::string> out;
  if (!find_value_pos_top_level(s, "Outputs", &pos)) return out;
  if (pos >= s.size() || s[pos] != '[') return out;
  ++pos;
  while (pos < s.size()) {
    skip_ws(s, &pos);
    if (pos >= s.size() || s[pos] == ']') break;
    if (s[pos] == ',') {
      ++pos;
      continue;
    }
    std::string v;
    if (!parse_json_string(s, &pos, &v)) break;
    out.push_back(v);
  }
  return out;
}

} // namespace mealwin
