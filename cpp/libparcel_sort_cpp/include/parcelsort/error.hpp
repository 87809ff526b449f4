// Error codes and helpers for parcelsort C++ API
#pragma once

namespace parcelsort {

enum class ErrorCode {
  kSuccess = 0,

  // Input errors (1-99)
  kInvalidInput = 1,

  // Unknown
  kUnknown = 999
};

// Convert ErrorCode to short, stable English text. The returned string is a
// static literal and does not require lifetime management.
inline const char* ErrorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kInvalidInput:
      return "Invalid input";
    case ErrorCode::kUnknown:
    default:
      return "Unknown error";
  }
}

}  // namespace parcelsort
