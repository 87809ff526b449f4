// Handling categories produced by the classifier
#pragma once

namespace parcelsort {

enum class Category { kStandard = 0, kSpecial = 1, kRejected = 2 };

// Canonical display text for a category. The returned string is a static
// literal.
inline const char* CategoryToString(Category category) {
  switch (category) {
    case Category::kStandard:
      return "STANDARD";
    case Category::kSpecial:
      return "SPECIAL";
    case Category::kRejected:
    default:
      return "REJECTED";
  }
}

}  // namespace parcelsort
