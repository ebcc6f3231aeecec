// json_model/model/value.hpp - Typed property values
//
// Values exchanged between the conversion engine and model types.
//
#pragma once

#include <any>
#include <map>
#include <nlohmann/json.hpp>
#include <string>

namespace json_model
{

/**
 * Decoded property value.
 *
 * An empty Value is the "no value" marker and corresponds to a document
 * null. Values that were not transformed hold the original
 * nlohmann::json node.
 */
using Value = std::any;

/// Property key -> value. Ordered so iteration is deterministic.
using ValueMapping = std::map<std::string, Value>;

/// Whether `v` carries the "no value" marker.
[[nodiscard]] inline bool is_null_value(const Value & v) noexcept { return !v.has_value(); }

/// Document node held by `v`, or nullptr when `v` holds something else.
[[nodiscard]] inline const nlohmann::json * value_as_json(const Value & v) noexcept
{
  return std::any_cast<nlohmann::json>(&v);
}

/// Payload of `v` when it holds exactly a T, otherwise nullptr.
template <typename T>
[[nodiscard]] const T * value_as(const Value & v) noexcept
{
  return std::any_cast<T>(&v);
}

/**
 * Pointer to the value stored under `key`, or nullptr when the key is
 * absent or the payload is not a T.
 */
template <typename T>
[[nodiscard]] const T * find_value(const ValueMapping & values, const std::string & key) noexcept
{
  const auto it = values.find(key);
  if (it == values.end()) {
    return nullptr;
  }
  return std::any_cast<T>(&it->second);
}

}  // namespace json_model
