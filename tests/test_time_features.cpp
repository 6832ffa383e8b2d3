#include "mealwin/time_features.hpp"
#include "mealwin/utils.hpp"

#include "test_support.hpp"
#include <cstdint>
#include <iostream>
#include <string>

namespace {

static int64_t at(const std::string& ts) {
  int64_t ms = 0;
  assert(mealwin::parse_iso8601_to_utc_millis(ts, &ms));
  return ms;
}

} // namespace

int main() {
  using namespace mealwin;

  MealWindowConfig cfg;

  // Monday.
  {
    const TimeFeatures f = compute_time_features(at("2024-01-01T08:15:00Z"), cfg);
    assert(f.meal_hour == 8.0);
    assert(f.meal_dow == 0.0);
    assert(f.meal_is_weekend == 0.0);
  }

  // Saturday.
  {
    const TimeFeatures f = compute_time_features(at("2024-01-06T12:00:00Z"), cfg);
    assert(f.meal_hour == 12.0);
    assert(f.meal_dow == 5.0);
    assert(f.meal_is_weekend == 1.0);
  }

  // Before the epoch.
  {
    const TimeFeatures f = compute_time_features(at("1969-12-31T23:00:00Z"), cfg);
    assert(f.meal_hour == 23.0);
    assert(f.meal_dow == 2.0);
  }

  // Local offset moves a late Saturday meal into Sunday.
  {
    cfg.local_utc_offset_minutes = 60.0;
    const TimeFeatures f = compute_time_features(at("2024-01-06T23:30:00Z"), cfg);
    assert(f.meal_hour == 0.0);
    assert(f.meal_dow == 6.0);
    assert(f.meal_is_weekend == 1.0);

    cfg.local_utc_offset_minutes = -300.0;
    const TimeFeatures g = compute_time_features(at("2024-01-08T03:00:00Z"), cfg);
    assert(g.meal_hour == 22.0);
    assert(g.meal_dow == 6.0);
  }

  std::cout << "ok\n";
  return 0;
}
