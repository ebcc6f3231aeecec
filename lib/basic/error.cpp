// json_model/basic/error.cpp - Error implementation
#include "json_model/basic/error.hpp"

#include <sstream>
#include <utility>

namespace json_model
{

const char * to_string(ErrorKind kind) noexcept
{
  switch (kind) {
    case ErrorKind::ExceptionThrown:
      return "ExceptionThrown";
    case ErrorKind::NoTargetType:
      return "NoTargetType";
    case ErrorKind::InvalidDocument:
      return "InvalidDocument";
    case ErrorKind::TransformFailed:
      return "TransformFailed";
    case ErrorKind::ConstructionFailed:
      return "ConstructionFailed";
  }
  return "Unknown";
}

const Error & Error::root_cause() const noexcept
{
  const Error * e = this;
  while (e->cause) {
    e = e->cause.get();
  }
  return *e;
}

std::string Error::describe() const
{
  std::ostringstream out;
  const Error * e = this;
  bool first = true;
  while (e != nullptr) {
    if (!first) {
      out << ": caused by ";
    }
    first = false;

    out << e->domain << "/" << to_string(e->kind) << ": " << e->message;
    if (e->property_key) {
      out << " [property '" << *e->property_key << "'";
      if (e->key_path) {
        out << " at '" << *e->key_path << "'";
      }
      out << "]";
    } else if (e->key_path) {
      out << " [at '" << *e->key_path << "']";
    }
    if (!e->failure_reason.empty()) {
      out << " (" << e->failure_reason << ")";
    }
    e = e->cause.get();
  }
  return out.str();
}

// ============================================================================
// ErrorBuilder
// ============================================================================

ErrorBuilder::ErrorBuilder(ErrorKind kind, std::string message)
{
  error_.kind = kind;
  error_.message = std::move(message);
}

ErrorBuilder & ErrorBuilder::with_domain(std::string domain)
{
  error_.domain = std::move(domain);
  return *this;
}

ErrorBuilder & ErrorBuilder::with_reason(std::string reason)
{
  error_.failure_reason = std::move(reason);
  return *this;
}

ErrorBuilder & ErrorBuilder::with_property(std::string property_key)
{
  error_.property_key = std::move(property_key);
  return *this;
}

ErrorBuilder & ErrorBuilder::with_key_path(std::string key_path)
{
  error_.key_path = std::move(key_path);
  return *this;
}

ErrorBuilder & ErrorBuilder::with_cause(Error cause)
{
  error_.cause = std::make_shared<Error>(std::move(cause));
  return *this;
}

// ============================================================================
// Reporter helpers
// ============================================================================

Error make_transform_error(std::string message, std::string reason)
{
  return ErrorBuilder(ErrorKind::TransformFailed, std::move(message))
    .with_domain(k_transformer_error_domain)
    .with_reason(std::move(reason));
}

Error make_construction_error(std::string message, std::string reason)
{
  return ErrorBuilder(ErrorKind::ConstructionFailed, std::move(message))
    .with_domain(k_model_error_domain)
    .with_reason(std::move(reason));
}

}  // namespace json_model
