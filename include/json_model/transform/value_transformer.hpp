// json_model/transform/value_transformer.hpp - Per-property value transformers
//
// A transformer converts a document node into a typed property value when
// decoding and, if reversible, converts the value back when encoding.
//
#pragma once

#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "json_model/basic/result.hpp"
#include "json_model/model/model.hpp"
#include "json_model/model/value.hpp"

namespace json_model
{

// ============================================================================
// ValueTransformer
// ============================================================================

class ValueTransformer
{
public:
  virtual ~ValueTransformer() = default;

  /**
   * Document node -> property value.
   *
   * `node` may be null; a transformer may map it to the "no value" marker
   * or to a sentinel of its own.
   */
  [[nodiscard]] virtual Result<Value> decode(const nlohmann::json & node) const = 0;

  /// Whether encode() is supported.
  [[nodiscard]] virtual bool is_reversible() const noexcept { return false; }

  /**
   * Property value -> document node. `value` may be the "no value" marker.
   *
   * The default implementation fails; reversible transformers override it.
   */
  [[nodiscard]] virtual Result<nlohmann::json> encode(const Value & value) const;
};

// ============================================================================
// Function-backed transformers
// ============================================================================

using DecodeFunction = std::function<Result<Value>(const nlohmann::json &)>;
using EncodeFunction = std::function<Result<nlohmann::json>(const Value &)>;

/// Forward-only transformer running `decode`.
[[nodiscard]] TransformerPtr make_transformer(DecodeFunction decode);

/// Reversible transformer running `decode` and `encode`.
[[nodiscard]] TransformerPtr make_reversible_transformer(
  DecodeFunction decode, EncodeFunction encode);

// ============================================================================
// Typed transformer
// ============================================================================

namespace detail
{

/**
 * Why `node` cannot be read as a T without loss, or an empty string when
 * it can. Types other than bool, integers, floating point and std::string
 * are left to their from_json().
 */
template <typename T>
std::string json_type_mismatch(const nlohmann::json & node)
{
  if constexpr (std::is_same_v<T, bool>) {
    return node.is_boolean() ? "" : "expected a boolean";
  } else if constexpr (std::is_integral_v<T>) {
    if (!node.is_number_integer()) {
      return "expected an integer";
    }
    constexpr auto max = static_cast<std::uint64_t>(std::numeric_limits<T>::max());
    if (node.is_number_unsigned()) {
      return node.get<std::uint64_t>() > max ? "integer out of range" : "";
    }
    const auto v = node.get<std::int64_t>();
    if constexpr (std::is_unsigned_v<T>) {
      return (v < 0 || static_cast<std::uint64_t>(v) > max) ? "integer out of range" : "";
    } else {
      constexpr auto min = static_cast<std::int64_t>(std::numeric_limits<T>::min());
      return (v < min || v > static_cast<std::int64_t>(max)) ? "integer out of range" : "";
    }
  } else if constexpr (std::is_floating_point_v<T>) {
    return node.is_number() ? "" : "expected a number";
  } else if constexpr (std::is_same_v<T, std::string>) {
    return node.is_string() ? "" : "expected a string";
  } else {
    return "";
  }
}

template <typename T>
class TypedTransformer final : public ValueTransformer
{
public:
  [[nodiscard]] Result<Value> decode(const nlohmann::json & node) const override
  {
    if (node.is_null()) {
      return Result<Value>::ok(Value{});
    }
    if (const std::string mismatch = json_type_mismatch<T>(node); !mismatch.empty()) {
      return Result<Value>::fail(make_transform_error(
        std::string("cannot convert ") + node.type_name() + " value", mismatch));
    }
    try {
      return Result<Value>::ok(Value(node.get<T>()));
    } catch (const nlohmann::json::exception & ex) {
      return Result<Value>::fail(make_transform_error(
        std::string("cannot convert ") + node.type_name() + " value", ex.what()));
    }
  }

  [[nodiscard]] bool is_reversible() const noexcept override { return true; }

  [[nodiscard]] Result<nlohmann::json> encode(const Value & value) const override
  {
    if (is_null_value(value)) {
      return Result<nlohmann::json>::ok(nullptr);
    }
    const T * typed = std::any_cast<T>(&value);
    if (typed == nullptr) {
      return Result<nlohmann::json>::fail(make_transform_error(
        "unexpected value type", std::string("holds ") + value.type().name()));
    }
    try {
      return Result<nlohmann::json>::ok(nlohmann::json(*typed));
    } catch (const nlohmann::json::exception & ex) {
      return Result<nlohmann::json>::fail(make_transform_error("cannot encode value", ex.what()));
    }
  }
};

}  // namespace detail

/**
 * Reversible transformer converting through nlohmann::json's own
 * `get<T>()` / `json(T)`, so any T with from_json/to_json (including
 * enums declared with NLOHMANN_JSON_SERIALIZE_ENUM) is supported.
 *
 * null decodes to no value and no value encodes to null. Arithmetic and
 * string targets only accept a node of the matching JSON type, and
 * integers must fit T: 3.7 is not an integer and is never truncated.
 */
template <typename T>
[[nodiscard]] TransformerPtr make_typed_transformer()
{
  return std::make_shared<detail::TypedTransformer<T>>();
}

// ============================================================================
// Nested model transformers
// ============================================================================

/// Shared model handle stored in a Value by the model transformers.
using ModelPtr = std::shared_ptr<const Model>;
using ModelList = std::vector<ModelPtr>;

/**
 * Nested object <-> ModelPtr, decoded with JsonAdapter::model_of_type().
 * `type` must outlive the transformer.
 */
[[nodiscard]] TransformerPtr make_model_transformer(const ModelType & type);

/// Array of objects <-> ModelList. `type` must outlive the transformer.
[[nodiscard]] TransformerPtr make_model_array_transformer(const ModelType & type);

}  // namespace json_model
