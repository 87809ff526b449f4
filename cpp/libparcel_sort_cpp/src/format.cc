#include "parcelsort/format.hpp"

#include <stdio.h>

#include <cmath>
#include <cstdlib>
#include <string>

namespace parcelsort {

std::string FormatMeasurement(double value) {
  char buf[32];
  if (!std::isfinite(value)) {
    snprintf(buf, sizeof(buf), "%g", value);
    return std::string(buf);
  }
  for (int precision = 1; precision <= 17; ++precision) {
    snprintf(buf, sizeof(buf), "%.*g", precision, value);
    if (std::strtod(buf, nullptr) == value) break;
  }
  return std::string(buf);
}

}  // namespace parcelsort
