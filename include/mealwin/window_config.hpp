#pragma once

#include "mealwin/types.hpp"

#include <string>
#include <vector>

namespace mealwin {

// Field names accepted by the config file and by set_window_config_value(),
// in the order format_window_config() writes them.
const std::vector<std::string>& window_config_keys();

// Set one field by name. '-' is accepted in place of '_'
// ("post-minutes" == "post_minutes"). Count fields must be non-negative
// integers. Throws std::runtime_error for an unknown key or a bad value.
void set_window_config_value(MealWindowConfig* cfg, const std::string& key, const std::string& value);

// Load a config file of key=value lines on top of the defaults.
//
//   # comment
//   post_minutes=240
//   grid_minutes = 5
//
// Blank lines and lines starting with '#' are ignored. Throws
// std::runtime_error naming the file and line on any error.
MealWindowConfig load_window_config(const std::string& path);

// Same, on top of an existing config.
void load_window_config_into(const std::string& path, MealWindowConfig* cfg);

// Throws std::runtime_error for non-finite or negative window lengths and a
// non-positive grid_minutes.
void validate_window_config(const MealWindowConfig& cfg);

// Suspicious but accepted settings (e.g. slope_minutes > post_minutes).
std::vector<std::string> window_config_warnings(const MealWindowConfig& cfg);

// Render as key=value lines (one per field, trailing newline) that
// load_window_config() reads back to the same values.
std::string format_window_config(const MealWindowConfig& cfg);

} // namespace mealwin
