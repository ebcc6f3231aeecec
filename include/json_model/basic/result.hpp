// json_model/basic/result.hpp - Value-or-error return type
#pragma once

#include <optional>
#include <utility>
#include <variant>

#include "json_model/basic/error.hpp"

namespace json_model
{

/**
 * Result of a fallible operation: either a value or an error, never both.
 *
 * Every conversion entry point returns one; no partially built value is
 * ever observable through a failed Result.
 */
template <typename T, typename E = Error>
struct Result
{
  /// Produced value (only set when success() is true)
  std::optional<T> value;

  /// Failure description (only set when success() is false)
  std::optional<E> error;

  [[nodiscard]] bool success() const noexcept { return !error.has_value(); }

  explicit operator bool() const noexcept { return success(); }

  /// Create a successful result
  static Result ok(T v)
  {
    Result r;
    r.value.emplace(std::move(v));
    return r;
  }

  /// Create a failed result
  static Result fail(E e)
  {
    Result r;
    r.error.emplace(std::move(e));
    return r;
  }
};

/// Result of an operation that produces nothing on success.
template <typename E = Error>
using Status = Result<std::monostate, E>;

}  // namespace json_model
