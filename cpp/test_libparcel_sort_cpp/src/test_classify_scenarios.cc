#include <gtest/gtest.h>

#include "parcelsort/parcelsort.hpp"

namespace {

using parcelsort::Category;
using parcelsort::Classify;

struct Scenario {
  double width;
  double height;
  double length;
  double mass;
  Category expected;
  const char* name;
};

const Scenario kScenarios[] = {
    {50, 50, 50, 10, Category::kStandard, "standard"},
    {100, 100, 100, 10, Category::kSpecial, "bulky_by_volume"},
    {160, 50, 50, 10, Category::kSpecial, "bulky_by_dimension"},
    {50, 50, 50, 25, Category::kSpecial, "heavy"},
    {160, 50, 50, 25, Category::kRejected, "bulky_and_heavy"},
    {149, 149, 1, 19.9, Category::kStandard, "just_under_every_limit"},
    {100, 100, 100, 5, Category::kSpecial, "volume_at_limit_light"},
};

/**
 * @brief Case001: Reference packages map to their documented category.
 *
 * Purpose:
 * - Pin the decision table against the reference scenarios.
 * Steps:
 * - Classify each scenario through the untyped entry point.
 * Expected:
 * - Category equals the expected value for every scenario.
 */
TEST(ClassifyScenarios, Case001_ReferencePackages) {
  for (const Scenario& s : kScenarios) {
    EXPECT_EQ(Classify(s.width, s.height, s.length, s.mass), s.expected)
        << s.name;
  }
}

/**
 * @brief Case002: Typed and untyped entry points agree.
 *
 * Purpose:
 * - The Package, unit-typed and double overloads share one rule.
 * Steps:
 * - Classify each scenario through all three overloads.
 * Expected:
 * - All three results are identical.
 */
TEST(ClassifyScenarios, Case002_OverloadsAgree) {
  using parcelsort::Centimeters;
  using parcelsort::Kilograms;
  for (const Scenario& s : kScenarios) {
    const parcelsort::Package pkg(Centimeters(s.width), Centimeters(s.height),
                                  Centimeters(s.length), Kilograms(s.mass));
    const Category by_pkg = Classify(pkg);
    EXPECT_EQ(by_pkg, Classify(Centimeters(s.width), Centimeters(s.height),
                               Centimeters(s.length), Kilograms(s.mass)))
        << s.name;
    EXPECT_EQ(by_pkg, Classify(s.width, s.height, s.length, s.mass))
        << s.name;
  }
}

/**
 * @brief Case003: Predicates drive the decision table.
 *
 * Purpose:
 * - IsBulky/IsHeavy match the category produced for each scenario.
 * Steps:
 * - Evaluate both predicates and derive the category by hand.
 * Expected:
 * - Derived category equals Classify().
 */
TEST(ClassifyScenarios, Case003_PredicatesMatchTable) {
  using parcelsort::Centimeters;
  using parcelsort::Kilograms;
  for (const Scenario& s : kScenarios) {
    const parcelsort::Package pkg(Centimeters(s.width), Centimeters(s.height),
                                  Centimeters(s.length), Kilograms(s.mass));
    const bool bulky = parcelsort::IsBulky(pkg);
    const bool heavy = parcelsort::IsHeavy(pkg);
    Category derived = Category::kStandard;
    if (bulky && heavy) {
      derived = Category::kRejected;
    } else if (bulky || heavy) {
      derived = Category::kSpecial;
    }
    EXPECT_EQ(derived, Classify(pkg)) << s.name;
  }
}

}  // namespace
