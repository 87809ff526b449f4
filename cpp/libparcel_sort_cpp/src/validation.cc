#include "parcelsort/validation.hpp"

#include <stdio.h>

#include <cmath>
#include <string>

#include "parcelsort/classifier.hpp"
#include "parcelsort/format.hpp"

namespace parcelsort {

namespace {
bool IsValidMeasurement(double value) {
  return std::isfinite(value) && value >= 0.0;
}

Result<void> InvalidField(const char* field, double value, const char* unit) {
  return Result<void>::Error(ErrorCode::kInvalidInput, [=]() {
    char buf[128];
    snprintf(buf, sizeof(buf),
             "%s must be a finite, non-negative value in %s (got %s)", field,
             unit, FormatMeasurement(value).c_str());
    return std::string(buf);
  });
}
}  // namespace

Result<void> ValidatePackage(const Package& package) {
  if (!IsValidMeasurement(package.Width().Value())) {
    return InvalidField("width", package.Width().Value(), "cm");
  }
  if (!IsValidMeasurement(package.Height().Value())) {
    return InvalidField("height", package.Height().Value(), "cm");
  }
  if (!IsValidMeasurement(package.Length().Value())) {
    return InvalidField("length", package.Length().Value(), "cm");
  }
  if (!IsValidMeasurement(package.Mass().Value())) {
    return InvalidField("mass", package.Mass().Value(), "kg");
  }
  return Result<void>::Ok();
}

Result<Category> ClassifyChecked(const Package& package) {
  Result<void> checked = ValidatePackage(package);
  if (!checked) {
    // Message is still built on first access, from the validation result.
    return Result<Category>::Error(
        checked.Code(), [checked]() { return checked.Message(); });
  }
  return Classify(package);
}

}  // namespace parcelsort
