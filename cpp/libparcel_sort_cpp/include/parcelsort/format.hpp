// Text rendering of measurements for console output and messages
#pragma once

#include <string>

namespace parcelsort {

// Shortest decimal text that reads back to exactly `value` (up to 17
// significant digits). Non-finite values render as "nan", "inf" or "-inf".
std::string FormatMeasurement(double value);

}  // namespace parcelsort
