/**
 * @file package.hpp
 * @brief Typed measurements and the immutable Package aggregate.
 *
 * Centimeters and Kilograms are distinct types over double so that a
 * length can not be passed where a mass is expected (and vice versa).
 * Construction is explicit; Value() exposes the raw double.
 *
 * @code{.cpp}
 * using namespace parcelsort;
 * Package pkg(Centimeters(50), Centimeters(50), Centimeters(50),
 *             Kilograms(10));
 * double v = pkg.Volume();  // 125000 cm^3
 * @endcode
 */
#pragma once

namespace parcelsort {

/** @brief A dimension in centimeters. */
class Centimeters {
 public:
  constexpr explicit Centimeters(double value) : value_(value) {}
  constexpr double Value() const { return value_; }

 private:
  double value_;
};

/** @brief A mass in kilograms. */
class Kilograms {
 public:
  constexpr explicit Kilograms(double value) : value_(value) {}
  constexpr double Value() const { return value_; }

 private:
  double value_;
};

/**
 * @brief Width, height, length and mass of one package.
 * @note Immutable after construction. Copyable.
 */
class Package {
 public:
  constexpr Package(Centimeters width, Centimeters height, Centimeters length,
                    Kilograms mass)
      : width_(width), height_(height), length_(length), mass_(mass) {}

  constexpr Centimeters Width() const { return width_; }
  constexpr Centimeters Height() const { return height_; }
  constexpr Centimeters Length() const { return length_; }
  constexpr Kilograms Mass() const { return mass_; }

  /** @brief width * height * length in cubic centimeters. */
  constexpr double Volume() const {
    return width_.Value() * height_.Value() * length_.Value();
  }

 private:
  Centimeters width_;
  Centimeters height_;
  Centimeters length_;
  Kilograms mass_;
};

}  // namespace parcelsort
