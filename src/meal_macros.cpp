#include "mealwin/meal_macros.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace mealwin {

MacroTotals compute_meal_macros(const std::vector<MealLine>& lines) {
  double grams_total = 0.0;
  double kcal = 0.0;
  double carbs = 0.0;
  double fiber = 0.0;
  double protein = 0.0;
  double fat = 0.0;

  for (const auto& line : lines) {
    const double grams = line.grams.value_or(0.0);
    const double serving = line.food.serving_grams.value_or(0.0);
    if (!(grams > 0.0) || !(serving > 0.0)) continue;

    const double mult = grams / serving;
    grams_total += grams;
    kcal += line.food.calories_kcal.value_or(0.0) * mult;
    carbs += line.food.carbs_g.value_or(0.0) * mult;
    fiber += line.food.fiber_g.value_or(0.0) * mult;
    protein += line.food.protein_g.value_or(0.0) * mult;
    fat += line.food.fat_g.value_or(0.0) * mult;
  }

  MacroTotals t;
  t.meal_grams = grams_total;
  t.meal_calories_kcal = kcal;
  t.meal_carbs_g = carbs;
  t.meal_fiber_g = fiber;
  t.meal_protein_g = protein;
  t.meal_fat_g = fat;
  return t;
}

void attach_meal_macros(std::vector<MealEvent>* meals,
                        const std::vector<MealItem>& items,
                        const std::vector<FoodItem>& foods) {
  if (!meals) throw std::runtime_error("attach_meal_macros: meals is null");

  std::unordered_map<std::string, const FoodItem*> food_by_id;
  food_by_id.reserve(foods.size());
  for (const auto& f : foods) food_by_id[f.id] = &f;

  std::unordered_map<std::string, std::vector<const MealItem*>> items_by_meal;
  for (const auto& it : items) items_by_meal[it.meal_event_id].push_back(&it);

  for (auto& meal : *meals) {
    std::vector<MealLine> lines;
    auto found = items_by_meal.find(meal.id);
    if (found != items_by_meal.end()) {
      std::vector<const MealItem*> ordered = found->second;
      std::stable_sort(ordered.begin(), ordered.end(), [](const MealItem* a, const MealItem* b) {
        return a->sort_order < b->sort_order;
      });
      for (const MealItem* it : ordered) {
        auto f = food_by_id.find(it->food_item_id);
        if (f == food_by_id.end()) {
          throw std::runtime_error("Meal " + meal.id + " references unknown food item: " + it->food_item_id);
        }
        lines.push_back(MealLine{it->grams, *f->second});
      }
    }
    meal.macros = compute_meal_macros(lines);
  }
}

} // namespace mealwin
