#include "mealwin/cli_input.hpp"
#include "mealwin/dataset.hpp"
#include "mealwin/dataset_io.hpp"
#include "mealwin/run_meta.hpp"
#include "mealwin/source_io.hpp"
#include "mealwin/utils.hpp"
#include "mealwin/window_config.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace mealwin;

namespace {

struct Args {
  SourcePaths sources;
  WindowArgs window;
  std::string start;
  std::string end;
  std::string outdir{"out_mealwin"};
  std::string out_name{"meal_dataset.csv"};
};

static void print_help() {
  std::cout
      << "mealwin_build_dataset_cli\n\n"
      << "Build a meal-centered dataset (one row per meal) of pre-meal features and\n"
      << "post-meal glucose targets.\n\n"
      << "Usage:\n"
      << "  mealwin_build_dataset_cli --meals meals.csv --glucose glucose.csv --outdir out\n"
      << "  mealwin_build_dataset_cli --meals meals.csv --meal-items items.csv --foods foods.csv \\\n"
      << "      --glucose glucose.csv --workouts workouts.csv --start 2025-01-01 --post-minutes 240\n\n"
      << "Inputs:\n"
      << source_args_help()
      << "\nOptions:\n"
      << "  --start TIME             Keep meals eaten at or after TIME (ISO-8601; naive = UTC)\n"
      << "  --end TIME               Keep meals eaten before TIME\n"
      << "  --outdir DIR             Output directory (default: out_mealwin)\n"
      << "  --out NAME               Dataset file name under --outdir (default: meal_dataset.csv)\n"
      << window_args_help()
      << "  -h, --help               Show this help\n";
}

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_help();
      std::exit(0);
    } else if (parse_source_arg(argc, argv, &i, &a.sources)) {
      continue;
    } else if (parse_window_arg(argc, argv, &i, &a.window)) {
      continue;
    } else if (arg == "--start" && i + 1 < argc) {
      a.start = argv[++i];
    } else if (arg == "--end" && i + 1 < argc) {
      a.end = argv[++i];
    } else if (arg == "--outdir" && i + 1 < argc) {
      a.outdir = argv[++i];
    } else if (arg == "--out" && i + 1 < argc) {
      a.out_name = argv[++i];
    } else {
      throw std::runtime_error("Unknown or incomplete argument: " + arg);
    }
  }
  return a;
}

} // namespace

int main(int argc, char** argv) {
  try {
    const Args args = parse_args(argc, argv);
    if (args.sources.meals.empty() || args.sources.glucose.empty()) {
      print_help();
      throw std::runtime_error("--meals and --glucose are required");
    }

    std::string out_rel;
    if (!normalize_rel_path_safe(args.out_name, &out_rel)) {
      throw std::runtime_error("--out must be a relative file name: " + args.out_name);
    }

    const MealWindowConfig cfg = resolve_window_config(args.window);
    const auto start = parse_time_bound(args.start, "--start");
    const auto end = parse_time_bound(args.end, "--end");

    SourceData data = load_sources(args.sources);
    const size_t n_all = data.meals.size();
    std::vector<MealEvent> meals = filter_meals_by_time(data.meals, start, end);
    if (meals.size() != n_all) {
      std::cout << "Selected " << meals.size() << " of " << n_all << " meals in time range\n";
    }
    if (meals.empty()) {
      std::cerr << "Warning: no meals selected; writing an empty dataset\n";
    }

    const std::vector<MealRow> rows = build_meal_dataset(std::move(meals),
                                                         std::move(data.glucose),
                                                         std::move(data.workouts),
                                                         std::move(data.sets),
                                                         cfg);

    size_t n_low = 0;
    for (const auto& r : rows) {
      if (r.targets.low_confidence) ++n_low;
    }
    if (n_low > 0) {
      std::cerr << "Warning: " << n_low << " of " << rows.size()
                << " meals have too little post-meal glucose data (targets left empty)\n";
    }

    ensure_directory(args.outdir);
    const std::string out_csv = args.outdir + "/" + out_rel;
    write_dataset_csv(out_csv, rows);

    const std::string cfg_path = args.outdir + "/window_config.txt";
    if (!write_text_file_atomic(cfg_path, format_window_config(cfg))) {
      throw std::runtime_error("Failed to write: " + cfg_path);
    }

    std::vector<std::string> outs = {out_rel, "window_config.txt", "build_dataset_run_meta.json"};
    const std::string meta_path = args.outdir + "/build_dataset_run_meta.json";
    if (!write_run_meta_json(meta_path, "mealwin_build_dataset_cli", args.outdir, args.sources.meals, outs)) {
      std::cerr << "Warning: failed to write run meta JSON: " << meta_path << "\n";
    }

    std::cout << "Wrote " << rows.size() << " meals -> " << out_csv << "\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
