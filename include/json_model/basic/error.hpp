// json_model/basic/error.hpp - Structured conversion errors
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace json_model
{

// ============================================================================
// Error Taxonomy
// ============================================================================

/// Domain tag carried by every error the conversion engine produces.
inline constexpr const char * k_adapter_error_domain = "json_model.adapter";

/// Domain tag used by the predefined transformers.
inline constexpr const char * k_transformer_error_domain = "json_model.transformer";

/// Domain tag used by model constructors that report through the helpers.
inline constexpr const char * k_model_error_domain = "json_model.model";

/**
 * Kind of failure. The numeric values are stable and exposed as
 * `Error::code()`.
 */
enum class ErrorKind : uint8_t {
  ExceptionThrown = 1,     ///< Fault with no more specific classification
  NoTargetType = 2,        ///< No concrete model type for the document
  InvalidDocument = 3,     ///< Root or intermediate node is not a mapping
  TransformFailed = 4,     ///< A property transformer rejected its input
  ConstructionFailed = 5,  ///< The model rejected the assembled values
};

[[nodiscard]] const char * to_string(ErrorKind kind) noexcept;

// ============================================================================
// Error
// ============================================================================

struct Error
{
  std::string domain = k_adapter_error_domain;
  ErrorKind kind = ErrorKind::ExceptionThrown;
  std::string message;         // short description
  std::string failure_reason;  // longer explanation, may be empty

  std::optional<std::string> property_key;
  std::optional<std::string> key_path;

  /// Underlying error this one wraps (transformer or constructor error).
  std::shared_ptr<const Error> cause;

  [[nodiscard]] int code() const noexcept { return static_cast<int>(kind); }

  /// Innermost error of the cause chain (this error if it wraps nothing).
  [[nodiscard]] const Error & root_cause() const noexcept;

  /// One-line rendering of this error and its whole cause chain.
  [[nodiscard]] std::string describe() const;
};

// ============================================================================
// ErrorBuilder
// ============================================================================

/**
 * Fluent construction of an Error.
 *
 *   Error e = ErrorBuilder(ErrorKind::InvalidDocument, "Invalid JSON document")
 *               .with_reason("...")
 *               .with_key_path("a.b");
 */
class ErrorBuilder
{
public:
  ErrorBuilder(ErrorKind kind, std::string message);

  ErrorBuilder & with_domain(std::string domain);
  ErrorBuilder & with_reason(std::string reason);
  ErrorBuilder & with_property(std::string property_key);
  ErrorBuilder & with_key_path(std::string key_path);
  ErrorBuilder & with_cause(Error cause);

  [[nodiscard]] Error build() const { return error_; }

  // NOLINTNEXTLINE(google-explicit-constructor)
  operator Error() const { return error_; }

private:
  Error error_;
};

// ============================================================================
// Reporter helpers
// ============================================================================

/// Error a transformer returns when it rejects its input.
[[nodiscard]] Error make_transform_error(std::string message, std::string reason = "");

/// Error a model constructor returns when the value mapping is unacceptable.
[[nodiscard]] Error make_construction_error(std::string message, std::string reason = "");

}  // namespace json_model
