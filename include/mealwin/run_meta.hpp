#pragma once

#include <string>
#include <vector>

namespace mealwin {

// Write a *_run_meta.json provenance file (lightweight JSON emitter).
//
// Keys written (top-level):
//   - Tool
//   - MealwinVersion
//   - GitDescribe
//   - BuildType
//   - Compiler
//   - CppStandard
//   - TimestampLocal
//   - TimestampUTC
//   - OutputDir
//   - InputPath (string or null)
//   - Outputs (array of relative paths)
//
// Outputs are normalized with normalize_rel_path_safe(); rejected entries and
// duplicates are dropped.
//
// The file is written atomically. Returns false on write failure.
bool write_run_meta_json(const std::string& json_path,
                         const std::string& tool,
                         const std::string& outdir,
                         const std::string& input_path,
                         const std::vector<std::string>& outputs);

// Read a top-level string member (e.g. "Tool") from a run meta file written
// by write_run_meta_json(). Not a general JSON parser.
// Returns an empty string if the file or key is missing or the value is null.
std::string read_run_meta_string(const std::string& json_path, const std::string& key);

// Read the "Outputs" array. Returns an empty vector if missing/unreadable.
std::vector<std::string> read_run_meta_outputs(const std::string& json_path);

} // namespace mealwin
