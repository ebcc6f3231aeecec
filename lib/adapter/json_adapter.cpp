// json_model/adapter/json_adapter.cpp - Conversion engine implementation
#include "json_model/adapter/json_adapter.hpp"

#include <exception>
#include <string>
#include <utility>

#include "json_model/basic/logging.hpp"
#include "json_model/document/navigator.hpp"
#include "json_model/transform/value_transformer.hpp"

namespace json_model
{

namespace
{

using ModelResult = Result<std::unique_ptr<Model>>;
using DocumentResult = Result<nlohmann::json>;

// ============================================================================
// Fault boundary
// ============================================================================

Error exception_error(const std::string & what)
{
  return ErrorBuilder(ErrorKind::ExceptionThrown, "exception thrown").with_reason(what);
}

/**
 * Run `fn` (which returns a Result<T>), turning anything it throws into a
 * failed Result carrying an ExceptionThrown error. `threw`, when given, is
 * set only if `fn` threw.
 */
template <typename T, typename Fn>
Result<T> call_guarded(Fn && fn, const std::string & context, bool * threw = nullptr)
{
  try {
    return std::forward<Fn>(fn)();
  } catch (const std::exception & ex) {
    get_logger()->warn("Caught exception {}: {}", context, ex.what());
    if (threw != nullptr) {
      *threw = true;
    }
    return Result<T>::fail(exception_error(ex.what()));
  } catch (...) {
    get_logger()->warn("Caught unknown exception {}", context);
    if (threw != nullptr) {
      *threw = true;
    }
    return Result<T>::fail(exception_error("unknown exception"));
  }
}

Error transform_failed(const PropertyMapping & prop, Error cause)
{
  std::string reason = cause.message;
  return ErrorBuilder(
           ErrorKind::TransformFailed,
           "could not transform value of property '" + prop.property_key + "'")
    .with_property(prop.property_key)
    .with_key_path(prop.key_path.to_string())
    .with_reason(std::move(reason))
    .with_cause(std::move(cause));
}

Error invalid_root(const ModelType & type, const nlohmann::json & document)
{
  return ErrorBuilder(ErrorKind::InvalidDocument, "missing JSON object")
    .with_reason(
      type.name() + " could not be created because an invalid JSON document was provided: " +
      document.type_name());
}

Error invalid_key_path(
  const ModelType & type, const PropertyMapping & prop, const StructuralError & err)
{
  const std::string path = prop.key_path.to_string();
  std::string reason = type.name() +
                       " could not be parsed because an invalid JSON document was provided "
                       "for key path \"" +
                       path + "\": " + err.reason;
  if (!err.path_so_far.empty()) {
    reason += " at \"" + err.path_so_far + "\"";
  }
  return ErrorBuilder(ErrorKind::InvalidDocument, "invalid JSON document")
    .with_property(prop.property_key)
    .with_key_path(path)
    .with_reason(std::move(reason));
}

// ============================================================================
// Per-property steps
// ============================================================================

Result<Value> decode_property(const PropertyMapping & prop, const nlohmann::json & node)
{
  if (!prop.transformer) {
    if (node.is_null()) {
      return Result<Value>::ok(Value{});
    }
    return Result<Value>::ok(Value(node));
  }

  auto decoded = call_guarded<Value>(
    [&] { return prop.transformer->decode(node); },
    "decoding property '" + prop.property_key + "' at \"" + prop.key_path.to_string() + "\"");
  if (!decoded.success()) {
    return Result<Value>::fail(transform_failed(prop, std::move(*decoded.error)));
  }
  return decoded;
}

DocumentResult encode_property(const PropertyMapping & prop, const Value & value)
{
  if (prop.transformer && prop.transformer->is_reversible()) {
    auto encoded = call_guarded<nlohmann::json>(
      [&] { return prop.transformer->encode(value); },
      "encoding property '" + prop.property_key + "' at \"" + prop.key_path.to_string() + "\"");
    if (!encoded.success()) {
      return DocumentResult::fail(transform_failed(prop, std::move(*encoded.error)));
    }
    return encoded;
  }

  // No reverse transformation: the value must already be a document node.
  if (is_null_value(value)) {
    return DocumentResult::ok(nullptr);
  }
  if (const nlohmann::json * node = value_as_json(value)) {
    return DocumentResult::ok(*node);
  }
  return DocumentResult::fail(transform_failed(
    prop, make_transform_error(
            "value is not a JSON node and no reversible transformer is declared",
            std::string("holds ") + value.type().name())));
}

}  // namespace

// ============================================================================
// JsonAdapter
// ============================================================================

JsonAdapter::JsonAdapter(const ModelType & type) : type_(type), mapping_(type.resolved_mapping())
{
}

Result<std::unique_ptr<Model>> JsonAdapter::decode(const nlohmann::json & document) const
{
  if (!document.is_object()) {
    return ModelResult::fail(invalid_root(type_, document));
  }

  get_logger()->debug("Decoding {} from JSON", type_.name());

  ValueMapping values;
  for (const auto & prop : mapping_->properties()) {
    const auto read = read_at_path(document, prop.key_path);
    if (!read.success()) {
      return ModelResult::fail(invalid_key_path(type_, prop, *read.error));
    }

    const nlohmann::json * node = *read.value;
    if (node == nullptr) {
      continue;  // absent: the model keeps its default
    }

    auto value = decode_property(prop, *node);
    if (!value.success()) {
      return ModelResult::fail(std::move(*value.error));
    }
    values.emplace(prop.property_key, std::move(*value.value));
  }

  bool construct_threw = false;
  auto constructed = call_guarded<std::unique_ptr<Model>>(
    [&] { return type_.construct(std::move(values)); }, "constructing " + type_.name(),
    &construct_threw);
  if (!constructed.success()) {
    Error & err = *constructed.error;
    if (construct_threw) {
      return ModelResult::fail(
        ErrorBuilder(ErrorKind::ConstructionFailed, "could not construct " + type_.name())
          .with_reason(err.failure_reason)
          .with_cause(std::move(err)));
    }
    return constructed;
  }
  if (!*constructed.value) {
    return ModelResult::fail(
      ErrorBuilder(ErrorKind::ConstructionFailed, "could not construct " + type_.name())
        .with_reason("constructor returned no model"));
  }
  return constructed;
}

Result<nlohmann::json> JsonAdapter::encode(const Model & model) const
{
  get_logger()->debug("Encoding {} to JSON", type_.name());

  auto decomposed =
    call_guarded<ValueMapping>([&] { return Result<ValueMapping>::ok(model.to_value_mapping()); },
                               "decomposing " + type_.name());
  if (!decomposed.success()) {
    return DocumentResult::fail(std::move(*decomposed.error));
  }
  const ValueMapping & values = *decomposed.value;

  nlohmann::json document = nlohmann::json::object();
  for (const auto & prop : mapping_->properties()) {
    const auto it = values.find(prop.property_key);
    if (it == values.end()) {
      continue;
    }

    auto encoded = encode_property(prop, it->second);
    if (!encoded.success()) {
      return encoded;
    }

    const auto written = write_at_path(
      document, prop.key_path, std::move(*encoded.value), WriteMode::FailIfPresent);
    if (!written.success()) {
      const std::string path = prop.key_path.to_string();
      return DocumentResult::fail(
        ErrorBuilder(ErrorKind::InvalidDocument, "cannot write key path \"" + path + "\"")
          .with_property(prop.property_key)
          .with_key_path(path)
          .with_reason(written.error->reason + " at \"" + written.error->path_so_far + "\""));
    }
  }

  return DocumentResult::ok(std::move(document));
}

Result<std::unique_ptr<Model>> JsonAdapter::model_of_type(
  const ModelType & type, const nlohmann::json & document)
{
  if (!document.is_object()) {
    return ModelResult::fail(invalid_root(type, document));
  }

  const ModelType * target = type.type_for_document(document);
  if (target == nullptr) {
    return ModelResult::fail(
      ErrorBuilder(ErrorKind::NoTargetType, "could not parse JSON")
        .with_reason("no model type could be found to parse the JSON object as " + type.name()));
  }

  return JsonAdapter(*target).decode(document);
}

Result<nlohmann::json> JsonAdapter::json_from_model(const Model & model)
{
  return JsonAdapter(model.model_type()).encode(model);
}

}  // namespace json_model
