// json_model/document/key_path.hpp - Dotted key paths into a document
//
// A key path addresses a location inside a document, e.g. "address.city"
// names the "city" member of the "address" object at the root.
//
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace json_model
{

inline constexpr char k_key_path_separator = '.';

/**
 * Ordered, non-empty sequence of object keys.
 */
class KeyPath
{
public:
  /**
   * Split a dotted specification into components.
   *
   * @return std::nullopt for an empty specification
   */
  [[nodiscard]] static std::optional<KeyPath> parse(std::string_view dotted);

  [[nodiscard]] const std::vector<std::string> & components() const noexcept
  {
    return components_;
  }
  [[nodiscard]] size_t size() const noexcept { return components_.size(); }
  [[nodiscard]] const std::string & operator[](size_t i) const { return components_[i]; }
  [[nodiscard]] const std::string & back() const { return components_.back(); }

  /// Dotted rendering of the first `count` components.
  [[nodiscard]] std::string prefix_string(size_t count) const;

  /// Dotted rendering of the whole path.
  [[nodiscard]] std::string to_string() const { return prefix_string(components_.size()); }

  [[nodiscard]] auto begin() const { return components_.begin(); }
  [[nodiscard]] auto end() const { return components_.end(); }

  bool operator==(const KeyPath & other) const { return components_ == other.components_; }
  bool operator!=(const KeyPath & other) const { return !(*this == other); }

private:
  explicit KeyPath(std::vector<std::string> components) : components_(std::move(components)) {}

  std::vector<std::string> components_;
};

/// Property key -> dotted key path. A missing or empty entry means unmapped.
using KeyPathTable = std::unordered_map<std::string, std::string>;

/**
 * Look up the key path of a property.
 *
 * @return std::nullopt when the property has no document representation
 */
[[nodiscard]] std::optional<KeyPath> resolve_key_path(
  const KeyPathTable & table, const std::string & property_key);

}  // namespace json_model
