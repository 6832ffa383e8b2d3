#include "mealwin/run_meta.hpp"
#include "mealwin/version.hpp"

#include "test_support.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace mealwin;

int main() {
  try {
    const std::string path = "test_run_meta_write_tmp.json";
    const std::string tmp_prefix = path + ".tmp.";

    // Cleanup any leftovers from an interrupted run.
    {
      std::error_code ec;
      for (const auto& e : std::filesystem::directory_iterator(".", ec)) {
        if (ec) break;
        const std::string name = e.path().filename().u8string();
        if (name == path || name.rfind(tmp_prefix, 0) == 0) {
          std::filesystem::remove(e.path(), ec);
          ec.clear();
        }
      }
    }

    const std::vector<std::string> outputs = {
      "meal_dataset.csv",
      "b\"c.txt",
      "dir/window_config.txt",
      "tab\tchar.dat",
    };

    assert(write_run_meta_json(path, "mealwin_test_tool", "outdir", "meals.csv", outputs));

    assert(read_run_meta_string(path, "Tool") == "mealwin_test_tool");
    assert(read_run_meta_string(path, "InputPath") == "meals.csv");
    assert(read_run_meta_string(path, "OutputDir") == "outdir");
    assert(read_run_meta_string(path, "MealwinVersion") == version_string());
    assert(read_run_meta_string(path, "NoSuchKey").empty());

    const std::vector<std::string> outs = read_run_meta_outputs(path);
    assert(outs.size() == outputs.size());
    for (size_t i = 0; i < outs.size(); ++i) {
      assert(outs[i] == outputs[i]);
    }

    // Provenance fields.
    assert(!read_run_meta_string(path, "TimestampLocal").empty());
    const std::string ts_utc = read_run_meta_string(path, "TimestampUTC");
    assert(!ts_utc.empty());
    assert(ts_utc.back() == 'Z');
    assert(!read_run_meta_string(path, "GitDescribe").empty());
    assert(!read_run_meta_string(path, "BuildType").empty());
    assert(!read_run_meta_string(path, "Compiler").empty());
    assert(!read_run_meta_string(path, "CppStandard").empty());

    // Atomic write: no temporary file is left behind.
    {
      size_t tmp_count = 0;
      std::error_code ec;
      for (const auto& e : std::filesystem::directory_iterator(".", ec)) {
        if (ec) break;
        const std::string name = e.path().filename().u8string();
        if (name.rfind(tmp_prefix, 0) == 0) {
          ++tmp_count;
        }
      }
      assert(tmp_count == 0);
    }

    // No input path => null.
    {
      const std::string p2 = "test_run_meta_write_noinput_tmp.json";
      assert(write_run_meta_json(p2, "mealwin_test_tool", "outdir", "", {}));
      assert(read_run_meta_string(p2, "InputPath").empty());
      assert(read_run_meta_outputs(p2).empty());
    }

    // Output normalization: safe, normalized relative paths only.
    {
      const std::string p4 = "test_run_meta_write_sanitize_tmp.json";
      const std::vector<std::string> outputs2 = {
        "subdir\\file.txt",   // normalize slashes
        "ok/./c.txt",         // collapse dot segments
        "folder/",            // strip trailing slash
        "../evil.txt",        // reject traversal
        "ok/../nope.txt",     // reject traversal (even if lexically normalizable)
        "C:\\secret.txt",     // reject drive prefix
        "/abs.txt",           // leading '/' is stripped to a safe relative path
        "dup.txt",
        "./dup.txt",          // normalizes to dup.txt (dedupe)
      };

      assert(write_run_meta_json(p4, "mealwin_test_tool", "outdir", "meals.csv", outputs2));

      std::ifstream f(p4, std::ios::binary);
      assert(f.good());
      std::string s;
      {
        std::ostringstream oss;
        oss << f.rdbuf();
        s = oss.str();
      }

      assert(s.find("subdir/file.txt") != std::string::npos);
      assert(s.find("ok/c.txt") != std::string::npos);
      assert(s.find("\"abs.txt\"") != std::string::npos);
      assert(s.find("\"folder\"") != std::string::npos);

      assert(s.find("subdir\\\\file.txt") == std::string::npos);
      assert(s.find("ok/./c.txt") == std::string::npos);
      assert(s.find("\"folder/\"") == std::string::npos);
      assert(s.find("../evil.txt") == std::string::npos);
      assert(s.find("ok/../nope.txt") == std::string::npos);
      assert(s.find("C:\\") == std::string::npos);

      const size_t first = s.find("\"dup.txt\"");
      assert(first != std::string::npos);
      const size_t second = s.find("\"dup.txt\"", first + 1);
      assert(second == std::string::npos);
    }

    std::cout << "test_run_meta_write: OK\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "test_run_meta_write failed: " << e.what() << "\n";
    return 1;
  }
}
