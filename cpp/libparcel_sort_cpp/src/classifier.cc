#include "parcelsort/classifier.hpp"

namespace parcelsort {

bool IsBulky(const Package& package) {
  return package.Volume() >= kBulkyVolumeCm3 ||
         package.Width().Value() >= kBulkyDimensionCm ||
         package.Height().Value() >= kBulkyDimensionCm ||
         package.Length().Value() >= kBulkyDimensionCm;
}

bool IsHeavy(const Package& package) {
  return package.Mass().Value() >= kHeavyMassKg;
}

Category Classify(const Package& package) {
  const bool bulky = IsBulky(package);
  const bool heavy = IsHeavy(package);
  if (bulky && heavy) return Category::kRejected;
  if (bulky || heavy) return Category::kSpecial;
  return Category::kStandard;
}

Category Classify(Centimeters width, Centimeters height, Centimeters length,
                  Kilograms mass) {
  return Classify(Package(width, height, length, mass));
}

Category Classify(double width, double height, double length, double mass) {
  return Classify(Centimeters(width), Centimeters(height), Centimeters(length),
                  Kilograms(mass));
}

}  // namespace parcelsort
