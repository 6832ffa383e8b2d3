#include "mealwin/meal_macros.hpp"

#include "test_support.hpp"
#include <iostream>
#include <stdexcept>
#include <vector>

using mealwin_test::approx;

namespace {

static mealwin::FoodItem rice() {
  mealwin::FoodItem f;
  f.id = "rice";
  f.serving_grams = 100.0;
  f.calories_kcal = 200.0;
  f.carbs_g = 30.0;
  f.fiber_g = 5.0;
  f.protein_g = 10.0;
  f.fat_g = 8.0;
  return f;
}

static mealwin::FoodItem egg() {
  mealwin::FoodItem f;
  f.id = "egg";
  f.serving_grams = 50.0;
  f.calories_kcal = 70.0;
  f.protein_g = 6.0;
  f.fat_g = 5.0;  // carbs / fiber unknown => 0
  return f;
}

} // namespace

int main() {
  using namespace mealwin;

  // Half a serving.
  {
    const MacroTotals t = compute_meal_macros({MealLine{50.0, rice()}});
    assert(approx(t.meal_grams.value(), 50.0));
    assert(approx(t.meal_calories_kcal.value(), 100.0));
    assert(approx(t.meal_carbs_g.value(), 15.0));
    assert(approx(t.meal_fiber_g.value(), 2.5));
    assert(approx(t.meal_protein_g.value(), 5.0));
    assert(approx(t.meal_fat_g.value(), 4.0));
  }

  // Lines with unusable grams / serving size are skipped.
  {
    FoodItem no_serving = rice();
    no_serving.serving_grams = MaybeReal();
    const MacroTotals t = compute_meal_macros({
        MealLine{100.0, egg()},
        MealLine{MaybeReal(), rice()},
        MealLine{0.0, rice()},
        MealLine{100.0, no_serving},
    });
    assert(approx(t.meal_grams.value(), 100.0));
    assert(approx(t.meal_calories_kcal.value(), 140.0));
    assert(approx(t.meal_carbs_g.value(), 0.0));
    assert(approx(t.meal_protein_g.value(), 12.0));
  }

  // Empty meal => known zeros.
  {
    const MacroTotals t = compute_meal_macros({});
    assert(t.meal_grams.known() && t.meal_grams.value() == 0.0);
    assert(t.meal_fat_g.known() && t.meal_fat_g.value() == 0.0);
  }

  // Join items to foods by meal id.
  {
    std::vector<MealEvent> meals(2);
    meals[0].id = "m1";
    meals[1].id = "m2";

    std::vector<MealItem> items;
    items.push_back(MealItem{"m1", "rice", 200.0, 1});
    items.push_back(MealItem{"m1", "egg", 50.0, 0});
    attach_meal_macros(&meals, items, {rice(), egg()});

    assert(approx(meals[0].macros.meal_grams.value(), 250.0));
    assert(approx(meals[0].macros.meal_calories_kcal.value(), 470.0));
    assert(approx(meals[0].macros.meal_carbs_g.value(), 60.0));
    assert(meals[1].macros.meal_grams.known());
    assert(meals[1].macros.meal_grams.value() == 0.0);

    items.push_back(MealItem{"m2", "bread", 30.0, 0});
    bool threw = false;
    try {
      attach_meal_macros(&meals, items, {rice(), egg()});
    } catch (const std::runtime_error&) {
      threw = true;
    }
    assert(threw);
  }

  std::cout << "ok\n";
  return 0;
}
