#include "mealwin/cli_input.hpp"
#include "mealwin/dataset.hpp"
#include "mealwin/model_artifact.hpp"
#include "mealwin/run_meta.hpp"
#include "mealwin/utils.hpp"
#include "mealwin/version.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace mealwin;

namespace {

struct Args {
  std::string model_path;
  std::string meal_event_id;
  SourcePaths sources;
  WindowArgs window;
};

static void print_help() {
  std::cout
      << "mealwin_predict_cli\n\n"
      << "Predict post-meal glucose targets for one logged meal with a trained model.\n\n"
      << "Usage:\n"
      << "  mealwin_predict_cli --model out_model/meal_model.csv --meal-event-id 42 \\\n"
      << "      --meals meals.csv --glucose glucose.csv [--workouts workouts.csv]\n\n"
      << "Options:\n"
      << "  --model PATH             Model written by mealwin_train_cli\n"
      << "  --meal-event-id ID       Meal to predict\n"
      << source_args_help()
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
    } else if (arg == "--model" && i + 1 < argc) {
      a.model_path = argv[++i];
    } else if (arg == "--meal-event-id" && i + 1 < argc) {
      a.meal_event_id = argv[++i];
    } else {
      throw std::runtime_error("Unknown or incomplete argument: " + arg);
    }
  }
  return a;
}

// The train tool leaves train_run_meta.json beside the model. If it lists this
// model, warn when it was produced by a different mealwin version.
static void check_model_provenance(const std::string& model_path) {
  const std::filesystem::path p = std::filesystem::u8path(model_path);
  const std::string meta_path = (p.parent_path() / "train_run_meta.json").u8string();
  const std::vector<std::string> outs = read_run_meta_outputs(meta_path);
  if (std::find(outs.begin(), outs.end(), p.filename().u8string()) == outs.end()) return;

  const std::string trained_with = read_run_meta_string(meta_path, "MealwinVersion");
  if (!trained_with.empty() && trained_with != version_string()) {
    std::cerr << "Warning: model was trained with mealwin " << trained_with
              << " (this is " << version_string() << ")\n";
  }
}

} // namespace

int main(int argc, char** argv) {
  try {
    const Args args = parse_args(argc, argv);
    if (args.model_path.empty() || args.meal_event_id.empty()) {
      print_help();
      throw std::runtime_error("--model and --meal-event-id are required");
    }

    const MealWindowConfig cfg = resolve_window_config(args.window);
    const ModelArtifact model = load_model_artifact(args.model_path);
    check_model_provenance(args.model_path);
    SourceData data = load_sources(args.sources);

    const MealEvent* meal = nullptr;
    for (const auto& m : data.meals) {
      if (m.id == args.meal_event_id) {
        meal = &m;
        break;
      }
    }
    if (!meal) throw std::runtime_error("MealEvent not found: " + args.meal_event_id);

    const FeatureRow features = build_single_meal_features(*meal,
                                                           data.meals,
                                                           std::move(data.glucose),
                                                           std::move(data.workouts),
                                                           std::move(data.sets),
                                                           cfg);
    const std::vector<TargetPrediction> preds = predict_targets(model, features);

    std::cout << "MealEvent " << meal->id << " @ " << format_utc_millis_iso8601(meal->eaten_at_ms) << "\n";
    std::cout << std::fixed << std::setprecision(3);
    for (const auto& p : preds) {
      std::cout << p.target << ": " << p.value << "\n";
    }
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
