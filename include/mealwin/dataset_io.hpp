#pragma once

#include "mealwin/dataset.hpp"

#include <string>
#include <vector>

namespace mealwin {

// Dataset CSV layout (one row per meal):
//   meal_event_id, eaten_at, <feature_column_names()>, <target_column_names()>,
//   egv_points_in_window, low_confidence
//
// eaten_at is written as ISO-8601 UTC. Unknown values are written as empty
// cells; reals use max_digits10 so a write/read cycle is exact.
std::vector<std::string> dataset_column_names();

std::string format_dataset_csv(const std::vector<MealRow>& rows);

// Writes an empty file (no header) when rows is empty.
// Throws std::runtime_error if the file cannot be written.
void write_dataset_csv(const std::string& path, const std::vector<MealRow>& rows);

// Read a dataset written by write_dataset_csv().
//
// An empty file yields zero rows. Missing feature/target columns are left
// unknown; a missing meal_event_id or eaten_at column throws.
std::vector<MealRow> read_dataset_csv(const std::string& path);

} // namespace mealwin
