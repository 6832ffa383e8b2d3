#pragma once

#include "mealwin/maybe_real.hpp"
#include "mealwin/types.hpp"

#include <string>
#include <vector>

namespace mealwin {

// Nutrition facts of one food, stored per serving.
struct FoodItem {
  std::string id;
  MaybeReal serving_grams;
  MaybeReal calories_kcal;
  MaybeReal carbs_g;
  MaybeReal fiber_g;
  MaybeReal protein_g;
  MaybeReal fat_g;
};

// One line of a logged meal: an amount of a food.
struct MealItem {
  std::string meal_event_id;
  std::string food_item_id;
  MaybeReal grams;
  int sort_order{0};
};

// A meal line joined to its food.
struct MealLine {
  MaybeReal grams;
  FoodItem food;
};

// Sum the composition of a meal.
//
// Each line contributes value * (grams / serving_grams) for every per-serving
// value. Lines with unknown or non-positive grams / serving_grams are skipped;
// unknown per-serving values count as 0. meal_grams sums the grams of the
// lines that were used. All totals are known (0 for an empty meal).
MacroTotals compute_meal_macros(const std::vector<MealLine>& lines);

// Join meal items to foods and set each meal's macros.
//
// Items are grouped by meal id and ordered by sort_order (stable). Meals
// without items get all-zero totals. Throws std::runtime_error when an item
// references an unknown food id.
void attach_meal_macros(std::vector<MealEvent>* meals,
                        const std::vector<MealItem>& items,
                        const std::vector<FoodItem>& foods);

} // namespace mealwin
