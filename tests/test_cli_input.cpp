#include "mealwin/cli_input.hpp"

#include "test_support.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

// Mutable argv built from strings.
struct Argv {
  explicit Argv(const std::vector<std::string>& args) : storage(args) {
    for (auto& s : storage) ptrs.push_back(&s[0]);
  }
  int argc() const { return static_cast<int>(ptrs.size()); }
  char** argv() { return ptrs.data(); }

  std::vector<std::string> storage;
  std::vector<char*> ptrs;
};

static void write_file(const std::string& path, const std::string& content) {
  std::ofstream f(path, std::ios::binary);
  f << content;
}

template <typename Fn>
static bool throws_runtime(Fn fn) {
  try {
    fn();
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

} // namespace

int main() {
  using namespace mealwin;

  // Option parsing.
  {
    Argv a({"tool", "--meals", "m.csv", "--post-minutes", "240", "--glucose", "g.csv", "--grid-minutes", "2",
            "--other", "x"});
    SourcePaths paths;
    WindowArgs window;
    std::vector<std::string> rest;
    for (int i = 1; i < a.argc(); ++i) {
      if (parse_source_arg(a.argc(), a.argv(), &i, &paths)) continue;
      if (parse_window_arg(a.argc(), a.argv(), &i, &window)) continue;
      rest.push_back(a.argv()[i]);
    }
    assert(paths.meals == "m.csv");
    assert(paths.glucose == "g.csv");
    assert(window.overrides.size() == 2);
    assert(window.overrides[0].first == "post_minutes");
    assert(window.overrides[0].second == "240");
    assert(rest.size() == 2 && rest[0] == "--other");

    const MealWindowConfig cfg = resolve_window_config(window);
    assert(cfg.post_minutes == 240.0);
    assert(cfg.grid_minutes == 2.0);
  }

  // Missing option value.
  {
    Argv a({"tool", "--meals"});
    SourcePaths paths;
    int i = 1;
    assert(throws_runtime([&] { (void)parse_source_arg(a.argc(), a.argv(), &i, &paths); }));
  }

  // Config file first, then overrides; invalid results are rejected.
  {
    const std::string path = "test_cli_input_cfg_tmp.txt";
    write_file(path, "post_minutes=120\nslope_minutes=30\n");
    WindowArgs w;
    w.config_path = path;
    w.overrides.emplace_back("slope_minutes", "45");
    const MealWindowConfig cfg = resolve_window_config(w);
    assert(cfg.post_minutes == 120.0);
    assert(cfg.slope_minutes == 45.0);

    w.overrides.emplace_back("grid_minutes", "0");
    assert(throws_runtime([&] { (void)resolve_window_config(w); }));

    WindowArgs bad;
    bad.overrides.emplace_back("post_minutes", "long");
    bool named = false;
    try {
      (void)resolve_window_config(bad);
    } catch (const std::runtime_error& e) {
      named = std::string(e.what()).find("--post-minutes") != std::string::npos;
    }
    assert(named);
  }

  // Time bounds.
  {
    assert(!parse_time_bound("", "--start").has_value());
    assert(parse_time_bound("1970-01-02", "--start").value() == 86400000LL);
    assert(throws_runtime([] { (void)parse_time_bound("soon", "--end"); }));
  }

  // Loading sources: items and foods replace the meal macros.
  {
    write_file("test_cli_input_meals_tmp.csv", "meal_event_id,eaten_at,meal_carbs_g\nm1,2024-01-01T08:00:00Z,99\n");
    write_file("test_cli_input_items_tmp.csv", "meal_event_id,food_item_id,grams\nm1,rice,200\n");
    write_file("test_cli_input_foods_tmp.csv", "food_item_id,serving_grams,carbs_g\nrice,100,30\n");
    write_file("test_cli_input_egv_tmp.csv", "measured_at,glucose_mgdl\n2024-01-01T07:55:00Z,100\n");

    SourcePaths p;
    p.meals = "test_cli_input_meals_tmp.csv";
    p.glucose = "test_cli_input_egv_tmp.csv";
    {
      const SourceData d = load_sources(p);
      assert(d.meals.size() == 1);
      assert(d.meals[0].macros.meal_carbs_g == 99.0);
      assert(d.glucose.size() == 1);
      assert(d.workouts.empty() && d.sets.empty());
    }

    p.meal_items = "test_cli_input_items_tmp.csv";
    assert(throws_runtime([&] { (void)load_sources(p); }));

    p.foods = "test_cli_input_foods_tmp.csv";
    {
      const SourceData d = load_sources(p);
      assert(d.meals[0].macros.meal_carbs_g == 60.0);
      assert(d.meals[0].macros.meal_grams == 200.0);
    }

    SourcePaths no_glucose;
    no_glucose.meals = p.meals;
    assert(throws_runtime([&] { (void)load_sources(no_glucose); }));
  }

  std::cout << "ok\n";
  return 0;
}
