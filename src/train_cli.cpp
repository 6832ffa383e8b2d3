#include "mealwin/csv_io.hpp"
#include "mealwin/dataset_io.hpp"
#include "mealwin/model_artifact.hpp"
#include "mealwin/run_meta.hpp"
#include "mealwin/training.hpp"
#include "mealwin/utils.hpp"

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace mealwin;

namespace {

struct Args {
  std::string data_path;
  std::string outdir{"out_mealwin_model"};
  std::string out_name{"meal_model.csv"};
  std::string targets;  // comma-separated; empty => defaults
  double test_frac{0.2};
  double lambda{1.0};
};

static void print_help() {
  std::cout
      << "mealwin_train_cli\n\n"
      << "Train one regressor per glucose target from a meal dataset, using a\n"
      << "chronological train/test split.\n\n"
      << "Usage:\n"
      << "  mealwin_train_cli --data out_mealwin/meal_dataset.csv --outdir out_model\n"
      << "  mealwin_train_cli --data meal_dataset.csv --targets peak_inc_mgdl,peak_mgdl --lambda 10\n\n"
      << "Options:\n"
      << "  --data PATH              Dataset CSV written by mealwin_build_dataset_cli\n"
      << "  --outdir DIR             Output directory (default: out_mealwin_model)\n"
      << "  --out NAME               Model file name under --outdir (default: meal_model.csv)\n"
      << "  --targets A,B,...        Targets to model (default: peak_inc_mgdl,\n"
      << "                           incremental_auc_mgdl_min,slope_0_60_mgdl_per_min)\n"
      << "  --test-frac X            Fraction of the latest meals held out (default: 0.2)\n"
      << "  --lambda X               Ridge penalty (default: 1.0)\n"
      << "  -h, --help               Show this help\n";
}

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_help();
      std::exit(0);
    } else if (arg == "--data" && i + 1 < argc) {
      a.data_path = argv[++i];
    } else if (arg == "--outdir" && i + 1 < argc) {
      a.outdir = argv[++i];
    } else if (arg == "--out" && i + 1 < argc) {
      a.out_name = argv[++i];
    } else if (arg == "--targets" && i + 1 < argc) {
      a.targets = argv[++i];
    } else if (arg == "--test-frac" && i + 1 < argc) {
      a.test_frac = to_double(argv[++i]);
    } else if (arg == "--lambda" && i + 1 < argc) {
      a.lambda = to_double(argv[++i]);
    } else {
      throw std::runtime_error("Unknown or incomplete argument: " + arg);
    }
  }
  return a;
}

static std::string metric_text(const MaybeReal& v) {
  if (!v.known()) return "n/a";
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(3) << v.value();
  return oss.str();
}

static std::string format_metrics_csv(const ModelArtifact& a) {
  std::ostringstream o;
  o << "target,n_train,n_test,mae,rmse,r2\n";
  for (const auto& m : a.models) {
    o << m.target << "," << m.metrics.n_train << "," << m.metrics.n_test << ","
      << format_maybe_real(m.metrics.mae) << "," << format_maybe_real(m.metrics.rmse) << ","
      << format_maybe_real(m.metrics.r2) << "\n";
  }
  return o.str();
}

} // namespace

int main(int argc, char** argv) {
  try {
    const Args args = parse_args(argc, argv);
    if (args.data_path.empty()) {
      print_help();
      throw std::runtime_error("--data is required");
    }

    std::string out_rel;
    if (!normalize_rel_path_safe(args.out_name, &out_rel)) {
      throw std::runtime_error("--out must be a relative file name: " + args.out_name);
    }

    TrainOptions opt;
    opt.test_frac = args.test_frac;
    opt.lambda = args.lambda;
    if (!trim(args.targets).empty()) {
      opt.targets.clear();
      for (const auto& t : split(args.targets, ',')) {
        const std::string name = trim(t);
        if (!name.empty()) opt.targets.push_back(name);
      }
    }
    validate_training_targets(opt.targets);

    const std::vector<MealRow> rows = read_dataset_csv(args.data_path);
    const size_t n_labeled = select_labeled_rows(rows, opt.targets).size();
    std::cout << "Loaded " << rows.size() << " meals (" << n_labeled << " with all targets known)\n";

    const ModelArtifact model = train_model_artifact(rows, opt);

    ensure_directory(args.outdir);
    const std::string model_path = args.outdir + "/" + out_rel;
    save_model_artifact(model_path, model);

    const std::string metrics_path = args.outdir + "/train_metrics.csv";
    if (!write_text_file_atomic(metrics_path, format_metrics_csv(model))) {
      throw std::runtime_error("Failed to write: " + metrics_path);
    }

    for (const auto& m : model.models) {
      std::cout << m.target << ": n_train=" << m.metrics.n_train << " n_test=" << m.metrics.n_test
                << " MAE=" << metric_text(m.metrics.mae) << " RMSE=" << metric_text(m.metrics.rmse)
                << " R2=" << metric_text(m.metrics.r2) << "\n";
    }

    std::vector<std::string> outs = {out_rel, "train_metrics.csv", "train_run_meta.json"};
    const std::string meta_path = args.outdir + "/train_run_meta.json";
    if (!write_run_meta_json(meta_path, "mealwin_train_cli", args.outdir, args.data_path, outs)) {
      std::cerr << "Warning: failed to write run meta JSON: " << meta_path << "\n";
    }

    std::cout << "Wrote model -> " << model_path << "\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
