/**
 * @file classifier.hpp
 * @brief Package classification by size and mass.
 *
 * A package is bulky when its volume is at least kBulkyVolumeCm3 or any
 * single dimension is at least kBulkyDimensionCm, and heavy when its mass
 * is at least kHeavyMassKg. All thresholds are inclusive.
 *
 * | bulky | heavy | Category  |
 * |-------|-------|-----------|
 * | yes   | yes   | kRejected |
 * | yes   | no    | kSpecial  |
 * | no    | yes   | kSpecial  |
 * | no    | no    | kStandard |
 *
 * Thread-safety
 * - Every function here is pure. They may be called concurrently from any
 *   number of threads without synchronization.
 *
 * Inputs are not validated: negative, zero, NaN and infinite values are
 * evaluated with plain IEEE-754 comparisons (NaN never reaches a
 * threshold). Use ClassifyChecked() from validation.hpp to reject such
 * input up front.
 */
#pragma once

#include "parcelsort/category.hpp"
#include "parcelsort/package.hpp"

namespace parcelsort {

constexpr double kBulkyVolumeCm3 = 1000000.0;
constexpr double kBulkyDimensionCm = 150.0;
constexpr double kHeavyMassKg = 20.0;

/** @return true if the package meets the volume or dimension limit. */
bool IsBulky(const Package& package);

/** @return true if the package meets the mass limit. */
bool IsHeavy(const Package& package);

/** @brief Map a package to its handling category. */
Category Classify(const Package& package);

/** @overload */
Category Classify(Centimeters width, Centimeters height, Centimeters length,
                  Kilograms mass);

/**
 * @brief Untyped entry point.
 * @param width Width in centimeters.
 * @param height Height in centimeters.
 * @param length Length in centimeters.
 * @param mass Mass in kilograms.
 */
Category Classify(double width, double height, double length, double mass);

}  // namespace parcelsort
