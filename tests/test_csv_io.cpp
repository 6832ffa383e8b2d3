#include "mealwin/csv_io.hpp"

#include "test_support.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

static void write_file(const std::string& path, const std::string& content) {
  std::ofstream f(path, std::ios::binary);
  f << content;
}

static bool throws_runtime(const std::string& cell) {
  try {
    (void)mealwin::parse_maybe_real(cell);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

} // namespace

int main() {
  using namespace mealwin;

  // Escaping.
  assert(csv_escape("plain") == "plain");
  assert(csv_escape("a,b") == "\"a,b\"");
  assert(csv_escape("#7") == "\"#7\"");
  assert(csv_escape("7#") == "7#");
  assert(csv_escape("say \"hi\"") == "\"say \"\"hi\"\"\"");

  // Missing tokens and numeric cells.
  assert(is_missing_token(""));
  assert(is_missing_token("  NaN "));
  assert(is_missing_token("N/A"));
  assert(is_missing_token("null"));
  assert(!is_missing_token("0"));

  assert(!parse_maybe_real("").known());
  assert(!parse_maybe_real("NA").known());
  assert(parse_maybe_real(" 12.5 ") == 12.5);
  assert(parse_maybe_real("-3") == -3.0);
  assert(throws_runtime("abc"));
  assert(throws_runtime("12abc"));
  assert(throws_runtime("inf"));

  // Formatting: unknown is empty; values survive a text round trip exactly.
  assert(format_maybe_real(MaybeReal()).empty());
  assert(format_maybe_real(2.0) == "2");
  {
    const double v = 0.1 + 0.2;
    assert(parse_maybe_real(format_maybe_real(v)).value() == v);
  }

  // Table reader: comments, BOM, semicolons, quoted cells, padding.
  {
    const std::string path = "test_csv_io_tmp.csv";
    write_file(path,
               "# exported\n"
               "\n"
               "\xEF\xBB\xBFId;Name;Value\n"
               "1;\"a;b\";2.5\n"
               "# skipped\n"
               "2;short\n"
               "3;x;4;;\n");
    const DelimitedTable t = DelimitedTable::read(path);
    assert(t.delim == ';');
    assert(t.header.size() == 3);
    assert(t.header[0] == "Id");
    assert(t.rows.size() == 3);

    assert(t.rows[0].line_no == 4);
    assert(t.rows[0].cells[1] == "a;b");
    assert(t.rows[1].line_no == 6);
    assert(t.rows[1].cells.size() == 3);
    assert(t.rows[1].cells[2].empty());
    assert(t.rows[2].cells.size() == 3);

    assert(t.find_column({"id"}) == 0);
    assert(t.find_column({"missing", "VALUE"}) == 2);
    assert(t.find_column({"missing"}) == -1);
    assert(t.require_column({"name"}) == 1);

    bool threw = false;
    try {
      (void)t.require_column({"glucose_mgdl"});
    } catch (const std::runtime_error& e) {
      threw = std::string(e.what()).find("glucose_mgdl") != std::string::npos;
    }
    assert(threw);

    assert(table_location(t, t.rows[1]) == path + ":6: ");
  }

  // .tsv always uses tabs.
  {
    const std::string path = "test_csv_io_tmp.tsv";
    write_file(path, "a\tb,c\n1\t2,3\n");
    const DelimitedTable t = DelimitedTable::read(path);
    assert(t.delim == '\t');
    assert(t.header.size() == 2);
    assert(t.rows[0].cells[1] == "2,3");
  }

  // Unterminated quote names the line.
  {
    const std::string path = "test_csv_io_bad_tmp.csv";
    write_file(path, "a,b\n1,\"oops\n");
    bool threw = false;
    try {
      (void)DelimitedTable::read(path);
    } catch (const std::runtime_error& e) {
      threw = std::string(e.what()).find(path + ":2:") != std::string::npos;
    }
    assert(threw);
  }

  // Empty file.
  {
    const std::string path = "test_csv_io_empty_tmp.csv";
    write_file(path, "");
    const DelimitedTable t = DelimitedTable::read(path);
    assert(t.header.empty());
    assert(t.empty());
  }

  // Missing file.
  {
    bool threw = false;
    try {
      (void)DelimitedTable::read("does_not_exist_tmp.csv");
    } catch (const std::runtime_error&) {
      threw = true;
    }
    assert(threw);
  }

  std::cout << "ok\n";
  return 0;
}
