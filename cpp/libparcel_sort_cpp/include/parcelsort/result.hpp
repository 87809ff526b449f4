/**
 * @file result.hpp
 * @brief Result<T> for the fallible parts of the parcelsort API.
 *
 * The classifier itself never fails. Result<T> is returned by the
 * validation helpers: on success it holds a value, on failure an
 * ErrorCode and a message built on first access by Message().
 *
 * Usage example
 * @code{.cpp}
 * Result<Category> r = ClassifyChecked(pkg);
 * if (!r) { fprintf(stderr, "%s\n", r.Message().c_str()); return 1; }
 * printf("%s\n", CategoryToString(*r));
 * @endcode
 */
#pragma once

#include <functional>
#include <string>
#include <utility>

#include "parcelsort/error.hpp"

namespace parcelsort {

namespace detail {
/** Error code plus a message produced lazily from a factory. */
struct ErrorDetail {
  ErrorCode code = ErrorCode::kSuccess;
  mutable std::string message;
  mutable std::function<std::string()> message_factory;  // may be empty

  ErrorDetail() = default;
  explicit ErrorDetail(ErrorCode c) : code(c) {}
  ErrorDetail(ErrorCode c, std::function<std::string()> factory)
      : code(c), message_factory(std::move(factory)) {}

  const std::string& Message() const {
    if (message.empty() && message_factory) {
      message = message_factory();
      message_factory = std::function<std::string()>();
    }
    if (message.empty()) {
      message = ErrorCodeToString(code);
    }
    return message;
  }
};
}  // namespace detail

/**
 * @brief Result type carrying either T or an error.
 * @tparam T Success value type. Must be default constructible.
 */
template <typename T>
class Result {
 public:
  /** Construct a successful Result with a copy of value. */
  Result(const T& value) : ok_(true), value_(value) {}
  /** Construct a successful Result moving the value. */
  Result(T&& value) : ok_(true), value_(std::move(value)) {}

  /** Construct an error Result with code and optional message factory. */
  Result(ErrorCode code, std::function<std::string()> msg_factory = {})
      : ok_(false), error_(code, std::move(msg_factory)) {}

  static Result<T> Ok(T value) { return Result<T>(std::move(value)); }
  static Result<T> Error(ErrorCode code,
                         std::function<std::string()> msg_factory = {}) {
    return Result<T>(code, std::move(msg_factory));
  }

  explicit operator bool() const noexcept { return ok_; }

  /** @return ErrorCode::kSuccess on ok, otherwise the stored code. */
  ErrorCode Code() const noexcept {
    return ok_ ? ErrorCode::kSuccess : error_.code;
  }

  /**
   * @brief Error message, constructed on first use.
   * @note Returns an empty string on success.
   */
  const std::string& Message() const {
    static const std::string kEmpty;
    return ok_ ? kEmpty : error_.Message();
  }

  /** @name Value access (valid only when ok) */
  ///@{
  T& Value() { return value_; }
  const T& Value() const { return value_; }

  T& operator*() { return value_; }
  const T& operator*() const { return value_; }

  T&& MoveValue() { return std::move(value_); }
  ///@}

 private:
  bool ok_ = false;
  T value_{};
  detail::ErrorDetail error_{};
};

/** Specialization for operations that only report success or failure. */
template <>
class Result<void> {
 public:
  Result() : ok_(true) {}
  explicit Result(ErrorCode code,
                  std::function<std::string()> msg_factory = {})
      : ok_(false), error_(code, std::move(msg_factory)) {}

  static Result<void> Ok() { return Result<void>(); }
  static Result<void> Error(ErrorCode code,
                            std::function<std::string()> msg_factory = {}) {
    return Result<void>(code, std::move(msg_factory));
  }

  explicit operator bool() const noexcept { return ok_; }

  ErrorCode Code() const noexcept {
    return ok_ ? ErrorCode::kSuccess : error_.code;
  }

  const std::string& Message() const {
    static const std::string kEmpty;
    return ok_ ? kEmpty : error_.Message();
  }

 private:
  bool ok_ = false;
  detail::ErrorDetail error_{};
};

}  // namespace parcelsort
